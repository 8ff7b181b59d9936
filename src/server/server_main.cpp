#include "tscache/coherence.hpp"
#include "tscache/config.hpp"
#include "tscache/resp.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstring>
#include <deque>
#include <iostream>
#include <netinet/in.h>
#include <optional>
#include <sstream>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>
#include <unordered_map>

namespace {
volatile std::sig_atomic_t running = 1;
void on_sigint(int) { running = 0; }

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

template <typename T> bool parse_int(const std::string &s, T &out) {
  if (s.empty())
    return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

bool parse_ts(const std::string &sec, const std::string &nsec,
              tscache::LogicalTimestamp &out) {
  std::int64_t s = 0;
  std::int32_t n = 0;
  if (!parse_int(sec, s) || !parse_int(nsec, n))
    return false;
  if (n < 0 || n >= 1000000000)
    return false;
  out.seconds = s;
  out.nanoseconds = n;
  return true;
}

std::string store_error_reply(const tscache::StoreError &e) {
  return tscache::resp_error_kind(tscache::error_kind_name(e.kind), e.message);
}

struct ClientState {
  tscache::RespParser parser;
  std::string out;
};

struct ServerStats {
  std::uint64_t rejected_requests{0};
  std::uint64_t total_request_bytes{0};
  std::uint64_t request_count{0};
};

struct SlowEntry {
  std::string cmd;
  std::uint64_t latency_us{0};
  std::uint64_t timestamp_ms{0};
};

void usage() {
  std::cerr << "usage: tscache_server [--config path] [--port n] "
               "[--backend local|redis] [--redis-host h] [--redis-port n] "
               "[--shards n] [--tombstone-ttl-ms n]\n";
}

} // namespace

int main(int argc, char **argv) {
  tscache::ServerConfig cfg;

  // --config is applied first so the remaining flags override it.
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == "--config") {
      std::string err;
      if (!tscache::load_config(argv[i + 1], cfg, &err)) {
        std::cerr << "config: " << err << "\n";
        return 1;
      }
    }
  }
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    bool ok = true;
    if (a == "--config" && i + 1 < argc)
      ++i;
    else if (a == "--port" && i + 1 < argc)
      ok = parse_int(argv[++i], cfg.port);
    else if (a == "--backend" && i + 1 < argc)
      cfg.backend = argv[++i];
    else if (a == "--redis-host" && i + 1 < argc)
      cfg.redis.host = argv[++i];
    else if (a == "--redis-port" && i + 1 < argc)
      ok = parse_int(argv[++i], cfg.redis.port);
    else if (a == "--shards" && i + 1 < argc)
      ok = parse_int(argv[++i], cfg.local.shards);
    else if (a == "--tombstone-ttl-ms" && i + 1 < argc) {
      ok = parse_int(argv[++i], cfg.local.tombstone_ttl_ms);
      cfg.redis.tombstone_ttl_ms = cfg.local.tombstone_ttl_ms;
    } else {
      ok = false;
    }
    if (!ok) {
      usage();
      return 1;
    }
  }

  std::string store_err;
  auto store = tscache::make_store(cfg, &store_err);
  if (!store) {
    std::cerr << store_err << "\n";
    return 1;
  }
  auto *local = dynamic_cast<tscache::LocalStore *>(store.get());
  if (auto *redis = dynamic_cast<tscache::RedisStore *>(store.get())) {
    tscache::StoreError e;
    if (!redis->ping(&e))
      std::cerr << "warning: " << e.message << "\n";
  }
  tscache::CoherenceProtocol protocol(*store);

  std::deque<SlowEntry> slowlog;
  constexpr std::size_t max_slowlog = 256;

  int server_fd = socket(AF_INET, SOCK_STREAM, 0);
  int one = 1;
  setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = INADDR_ANY;
  addr.sin_port = htons(static_cast<std::uint16_t>(cfg.port));
  if (bind(server_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    std::cerr << "bind failed: " << std::strerror(errno) << "\n";
    return 1;
  }
  if (listen(server_fd, 128) < 0) {
    std::cerr << "listen failed: " << std::strerror(errno) << "\n";
    return 1;
  }

  std::signal(SIGINT, on_sigint);
  std::signal(SIGTERM, on_sigint);
  std::signal(SIGPIPE, SIG_IGN);
  std::unordered_map<int, ClientState> clients;
  ServerStats stats;
  std::cout << "tscache_server listening on " << cfg.port << " backend "
            << store->name() << std::endl;

  while (running) {
    if (local)
      local->tick();
    fd_set readfds, writefds;
    FD_ZERO(&readfds);
    FD_ZERO(&writefds);
    FD_SET(server_fd, &readfds);
    int maxfd = server_fd;
    for (const auto &[fd, st] : clients) {
      FD_SET(fd, &readfds);
      if (!st.out.empty())
        FD_SET(fd, &writefds);
      maxfd = std::max(maxfd, fd);
    }
    timeval tv{0, 20000};
    int n = select(maxfd + 1, &readfds, &writefds, nullptr, &tv);
    if (n < 0)
      continue;

    if (FD_ISSET(server_fd, &readfds)) {
      int cfd = accept(server_fd, nullptr, nullptr);
      if (cfd >= 0) {
        if (clients.size() >= cfg.max_connections) {
          const auto msg = tscache::resp_error("connection limit reached");
          send(cfd, msg.data(), msg.size(), 0);
          close(cfd);
          ++stats.rejected_requests;
        } else {
          clients[cfd] = {};
        }
      }
    }

    std::vector<int> to_close;
    for (auto &[fd, st] : clients) {
      if (FD_ISSET(fd, &readfds)) {
        char buf[4096];
        ssize_t r = recv(fd, buf, sizeof(buf), 0);
        if (r <= 0) {
          to_close.push_back(fd);
          continue;
        }
        stats.total_request_bytes += static_cast<std::uint64_t>(r);
        st.parser.feed(std::string(buf, static_cast<std::size_t>(r)));
        std::size_t processed = 0;
        while (processed < cfg.max_cmds_per_iteration) {
          auto cmd = st.parser.next_command();
          if (!cmd.has_value())
            break;
          ++processed;
          ++stats.request_count;
          const auto op_start = tscache::Clock::now();
          std::string op_name = cmd->empty() ? "UNKNOWN" : upper((*cmd)[0]);

          if (cmd->size() == 1 && cmd->front() == "__MALFORMED__") {
            ++stats.rejected_requests;
            st.out += tscache::resp_error("malformed RESP");
            break;
          }
          if (cmd->empty()) {
            ++stats.rejected_requests;
            st.out += tscache::resp_error("empty command");
            continue;
          }

          if (op_name == "PING") {
            st.out += tscache::resp_simple("PONG");
          } else if (op_name == "TS.SET") {
            tscache::LogicalTimestamp ts;
            if (cmd->size() != 5 || !parse_ts((*cmd)[3], (*cmd)[4], ts)) {
              ++stats.rejected_requests;
              st.out += tscache::resp_error("TS.SET key value sec nsec");
            } else {
              tscache::StoreError e;
              auto o = protocol.set((*cmd)[1], tscache::to_bytes((*cmd)[2]), ts, &e);
              st.out += o ? tscache::resp_integer(*o == tscache::WriteOutcome::Accepted)
                          : store_error_reply(e);
            }
          } else if (op_name == "TS.INVALIDATE") {
            tscache::LogicalTimestamp ts;
            if (cmd->size() != 4 || !parse_ts((*cmd)[2], (*cmd)[3], ts)) {
              ++stats.rejected_requests;
              st.out += tscache::resp_error("TS.INVALIDATE key sec nsec");
            } else {
              tscache::StoreError e;
              auto o = protocol.invalidate((*cmd)[1], ts, &e);
              st.out += o ? tscache::resp_integer(*o == tscache::WriteOutcome::Accepted)
                          : store_error_reply(e);
            }
          } else if (op_name == "TS.GET") {
            if (cmd->size() != 2) {
              ++stats.rejected_requests;
              st.out += tscache::resp_error("TS.GET key");
            } else {
              tscache::StoreError e;
              auto l = protocol.get((*cmd)[1], &e);
              if (!l)
                st.out += store_error_reply(e);
              else if (!l->hit)
                st.out += tscache::resp_null();
              else
                st.out += tscache::resp_bulk(tscache::to_string(l->value));
            }
          } else if (op_name == "TS.MSET") {
            tscache::LogicalTimestamp ts;
            if (cmd->size() < 5 || (cmd->size() - 3) % 2 != 0 ||
                !parse_ts((*cmd)[1], (*cmd)[2], ts)) {
              ++stats.rejected_requests;
              st.out += tscache::resp_error("TS.MSET sec nsec key value [key value ...]");
            } else {
              std::vector<std::pair<std::string, tscache::Bytes>> items;
              for (std::size_t i = 3; i + 1 < cmd->size(); i += 2)
                items.emplace_back((*cmd)[i], tscache::to_bytes((*cmd)[i + 1]));
              std::vector<tscache::StoreError> errors;
              auto outcomes = protocol.set_batch(items, ts, nullptr, &errors);
              std::vector<std::string> arr;
              arr.reserve(outcomes.size());
              for (std::size_t i = 0; i < outcomes.size(); ++i)
                arr.push_back(outcomes[i] ? tscache::resp_integer(*outcomes[i] == tscache::WriteOutcome::Accepted)
                                          : store_error_reply(errors[i]));
              st.out += tscache::resp_array(arr);
            }
          } else if (op_name == "TS.RECORD") {
            if (cmd->size() != 2) {
              ++stats.rejected_requests;
              st.out += tscache::resp_error("TS.RECORD key");
            } else {
              tscache::StoreError e;
              std::optional<tscache::StoredRecord> rec;
              if (!store->peek((*cmd)[1], &rec, &e)) {
                st.out += store_error_reply(e);
              } else if (!rec) {
                st.out += tscache::resp_array({});
              } else {
                const auto &r = rec->record;
                std::vector<std::string> arr{
                    tscache::resp_bulk("write_ts"), tscache::resp_bulk(r.write_ts.to_string()),
                    tscache::resp_bulk("invalidate_ts"), tscache::resp_bulk(r.invalidate_ts.to_string()),
                    tscache::resp_bulk("value"),
                    r.value ? tscache::resp_bulk(tscache::to_string(*r.value)) : tscache::resp_null(),
                    tscache::resp_bulk("retention_ms"),
                    tscache::resp_integer(rec->retention_ms ? static_cast<long long>(*rec->retention_ms) : -1)};
                st.out += tscache::resp_array(arr);
              }
            }
          } else if (op_name == "INFO") {
            std::ostringstream info;
            info << protocol.info();
            info << "connected_clients:" << clients.size() << "\n";
            info << "rejected_requests:" << stats.rejected_requests << "\n";
            const double avg_bytes = stats.request_count == 0 ? 0.0 : static_cast<double>(stats.total_request_bytes) / static_cast<double>(stats.request_count);
            info << "avg_request_bytes:" << avg_bytes << "\n";
            st.out += tscache::resp_bulk(info.str());
          } else if (op_name == "SLOWLOG") {
            if (cmd->size() >= 2 && upper((*cmd)[1]) == "RESET") {
              slowlog.clear();
              st.out += tscache::resp_simple("OK");
            } else if (cmd->size() >= 2 && upper((*cmd)[1]) == "GET") {
              std::uint64_t nentries = 16;
              if (cmd->size() == 3 && !parse_int((*cmd)[2], nentries))
                nentries = 16;
              nentries = std::min<std::uint64_t>(nentries, max_slowlog);
              std::vector<std::string> arr;
              for (std::size_t i = 0; i < std::min<std::size_t>(nentries, slowlog.size()); ++i) {
                const auto &e = slowlog[slowlog.size() - 1 - i];
                std::vector<std::string> item{tscache::resp_integer(static_cast<std::int64_t>(e.timestamp_ms)), tscache::resp_integer(static_cast<std::int64_t>(e.latency_us)), tscache::resp_bulk(e.cmd)};
                arr.push_back(tscache::resp_array(item));
              }
              st.out += tscache::resp_array(arr);
            } else {
              st.out += tscache::resp_error("SLOWLOG GET [N]|RESET");
            }
          } else {
            ++stats.rejected_requests;
            st.out += tscache::resp_error("unknown command");
          }

          const auto latency_us = static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(tscache::Clock::now() - op_start).count());
          if (latency_us > 5000) {
            slowlog.push_back({op_name, latency_us, static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(tscache::Clock::now().time_since_epoch()).count())});
            if (slowlog.size() > max_slowlog)
              slowlog.pop_front();
          }

          if (st.out.size() > cfg.max_pending_out) {
            ++stats.rejected_requests;
            to_close.push_back(fd);
            break;
          }
        }
      }

      if (FD_ISSET(fd, &writefds) && !st.out.empty()) {
        const std::size_t send_bytes = std::min<std::size_t>(st.out.size(), 8192);
        ssize_t w = send(fd, st.out.data(), send_bytes, 0);
        if (w <= 0)
          to_close.push_back(fd);
        else
          st.out.erase(0, static_cast<std::size_t>(w));
      }
    }

    std::sort(to_close.begin(), to_close.end());
    to_close.erase(std::unique(to_close.begin(), to_close.end()), to_close.end());
    for (int fd : to_close) {
      close(fd);
      clients.erase(fd);
    }
  }

  for (auto &[fd, _] : clients)
    close(fd);
  close(server_fd);
  std::cout << "tscache_server stopped" << std::endl;
  return 0;
}
