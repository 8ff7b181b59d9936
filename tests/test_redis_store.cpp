#include "tscache/coherence.hpp"
#include "tscache/redis_store.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

using namespace tscache;

namespace {
LogicalTimestamp ts(std::int64_t sec, std::int32_t nsec = 0) { return {sec, nsec}; }

// Live server shared by every test in this binary. TSCACHE_REDIS_PORT points
// at one already running; otherwise a throwaway redis-server is started on a
// scratch port, the same way the integration test starts tscache_server.
class LiveRedis {
public:
  static LiveRedis &instance() {
    static LiveRedis live;
    return live;
  }

  ~LiveRedis() {
    if (pid_ > 0) {
      kill(pid_, SIGTERM);
      waitpid(pid_, nullptr, 0);
    }
  }

  bool available() const { return available_; }
  const RedisStoreConfig &config() const { return cfg_; }

private:
  LiveRedis() {
    cfg_.connect_timeout_ms = 200;
    if (const char *port = std::getenv("TSCACHE_REDIS_PORT")) {
      cfg_.port = std::atoi(port);
      available_ = answers_ping();
      return;
    }
    cfg_.port = 42000 + (::getpid() % 20000);
    const std::string port = std::to_string(cfg_.port);
    pid_ = fork();
    if (pid_ == 0) {
      execlp("redis-server", "redis-server", "--port", port.c_str(), "--bind",
             "127.0.0.1", "--save", "", "--appendonly", "no", nullptr);
      _exit(127);
    }
    for (int i = 0; i < 50 && pid_ > 0; ++i) {
      if (answers_ping()) {
        available_ = true;
        return;
      }
      if (waitpid(pid_, nullptr, WNOHANG) == pid_)
        pid_ = -1;
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  }

  bool answers_ping() const {
    RedisConnection conn;
    if (!conn.connect(cfg_.host, cfg_.port, cfg_.connect_timeout_ms,
                      cfg_.io_timeout_ms))
      return false;
    auto reply = conn.command({"PING"});
    return reply && reply->type == RespType::Simple && reply->str == "PONG";
  }

  RedisStoreConfig cfg_;
  pid_t pid_{-1};
  bool available_{false};
};

std::string unique_key(const std::string &name) {
  return "tscache-test:" + std::to_string(::getpid()) + ":" + name;
}

// Raw connection for seeding and cleaning keys behind the store's back.
struct RawRedis {
  RedisConnection conn;
  bool open(const RedisStoreConfig &cfg) {
    return conn.connect(cfg.host, cfg.port, cfg.connect_timeout_ms,
                        cfg.io_timeout_ms);
  }
  std::optional<RespValue> run(const std::vector<std::string> &args) {
    return conn.command(args);
  }
};
} // namespace

TEST_CASE("an unreachable server is reported as unavailable", "[redis]") {
  RedisStoreConfig cfg;
  cfg.port = 1;
  cfg.connect_timeout_ms = 200;
  cfg.max_retries = 1;
  RedisStore store(cfg);
  CoherenceProtocol p(store);

  StoreError err;
  CHECK_FALSE(p.get("k", &err).has_value());
  CHECK(err.kind == ErrorKind::Unavailable);
  CHECK(err.message.find("127.0.0.1:1") != std::string::npos);
  CHECK(err.message.find("outcome unknown") == std::string::npos);

  err = {};
  CHECK_FALSE(p.set("k", to_bytes("v"), ts(1), &err).has_value());
  CHECK(err.kind == ErrorKind::Unavailable);

  const auto s = store.stats();
  CHECK(s.calls == 2);
  CHECK(s.retries == 2);
  CHECK(s.script_loads == 0);
  CHECK(p.stats().store_errors == 2);
  CHECK(store.info().find("redis_endpoint:127.0.0.1:1") != std::string::npos);
}

TEST_CASE("server-side scripts share the record layout", "[redis]") {
  for (const auto *script : {&RedisStore::set_script(), &RedisStore::invalidate_script(),
                             &RedisStore::get_script()}) {
    CHECK(script->find("HMGET") != std::string::npos);
    CHECK(script->find("'ts_sec', 'ts_nsec', 'inv_sec', 'inv_nsec', 'v'") !=
          std::string::npos);
    CHECK(script->find("CORRUPT") != std::string::npos);
  }
  CHECK(RedisStore::set_script().find("PERSIST") != std::string::npos);
  CHECK(RedisStore::invalidate_script().find("PEXPIRE") != std::string::npos);
  CHECK(RedisStore::peek_script().find("PTTL") != std::string::npos);
}

TEST_CASE("redis: scenario against a live server", "[redis][live]") {
  auto &live = LiveRedis::instance();
  if (!live.available()) {
    WARN("no redis-server on PATH and TSCACHE_REDIS_PORT unset");
    return;
  }
  RedisStore store(live.config());
  StoreError err;
  REQUIRE(store.ping(&err));
  CoherenceProtocol p(store);
  const auto key = unique_key("scenario");
  RawRedis raw;
  REQUIRE(raw.open(store.config()));
  raw.run({"DEL", key});

  REQUIRE(p.set(key, to_bytes("v1"), ts(100)) == WriteOutcome::Accepted);
  auto l = p.get(key);
  REQUIRE(l.has_value());
  CHECK(to_string(l->value) == "v1");

  REQUIRE(p.invalidate(key, ts(150)) == WriteOutcome::Accepted);
  l = p.get(key);
  REQUIRE(l.has_value());
  CHECK_FALSE(l->hit);

  CHECK(p.set(key, to_bytes("v2"), ts(120)) == WriteOutcome::Rejected);
  CHECK(p.set(key, to_bytes("v3"), ts(150)) == WriteOutcome::Accepted);
  l = p.get(key);
  REQUIRE(l.has_value());
  CHECK(to_string(l->value) == "v3");

  CHECK(p.set(key, to_bytes("v0"), ts(140)) == WriteOutcome::Rejected);
  CHECK(p.invalidate(key, ts(149)) == WriteOutcome::Rejected);

  raw.run({"DEL", key});
}

TEST_CASE("redis: retention follows invalidations and sets", "[redis][live]") {
  auto &live = LiveRedis::instance();
  if (!live.available()) {
    WARN("no redis-server on PATH and TSCACHE_REDIS_PORT unset");
    return;
  }
  RedisStore store(live.config());
  StoreError err;
  REQUIRE(store.ping(&err));
  CoherenceProtocol p(store);
  const auto key = unique_key("retention");
  RawRedis raw;
  REQUIRE(raw.open(store.config()));
  raw.run({"DEL", key});

  REQUIRE(p.invalidate(key, ts(10)) == WriteOutcome::Accepted);
  std::optional<StoredRecord> rec;
  REQUIRE(store.peek(key, &rec, &err));
  REQUIRE(rec.has_value());
  REQUIRE(rec->retention_ms.has_value());
  CHECK(*rec->retention_ms <= 120000);
  CHECK(rec->record.invalidate_ts == ts(10));

  REQUIRE(p.set(key, to_bytes("v"), ts(11)) == WriteOutcome::Accepted);
  REQUIRE(store.peek(key, &rec, &err));
  REQUIRE(rec.has_value());
  CHECK_FALSE(rec->retention_ms.has_value());
  REQUIRE(rec->record.value.has_value());
  CHECK(to_string(*rec->record.value) == "v");

  REQUIRE(p.invalidate(key, ts(12)) == WriteOutcome::Accepted);
  REQUIRE(store.peek(key, &rec, &err));
  REQUIRE(rec.has_value());
  CHECK_FALSE(rec->retention_ms.has_value());
  CHECK(rec->record.invalidate_ts == ts(12));
  CHECK(p.set(key, to_bytes("stale"), ts(11, 5)) == WriteOutcome::Rejected);

  raw.run({"DEL", key});
  REQUIRE(store.peek(key, &rec, &err));
  CHECK_FALSE(rec.has_value());
}

TEST_CASE("redis: malformed records are corrupt", "[redis][live]") {
  auto &live = LiveRedis::instance();
  if (!live.available()) {
    WARN("no redis-server on PATH and TSCACHE_REDIS_PORT unset");
    return;
  }
  RedisStore store(live.config());
  StoreError err;
  REQUIRE(store.ping(&err));
  CoherenceProtocol p(store);
  RawRedis raw;
  REQUIRE(raw.open(store.config()));

  const auto hash_key = unique_key("corrupt-hash");
  raw.run({"DEL", hash_key});
  raw.run({"HSET", hash_key, "v", "orphan"});
  err = {};
  CHECK_FALSE(p.get(hash_key, &err).has_value());
  CHECK(err.kind == ErrorKind::Corrupt);
  CHECK(err.message.find("value without write timestamp") != std::string::npos);

  err = {};
  CHECK_FALSE(p.set(hash_key, to_bytes("v"), ts(1), &err).has_value());
  CHECK(err.kind == ErrorKind::Corrupt);

  const auto string_key = unique_key("corrupt-type");
  raw.run({"SET", string_key, "plain"});
  err = {};
  CHECK_FALSE(p.get(string_key, &err).has_value());
  CHECK(err.kind == ErrorKind::Corrupt);

  raw.run({"DEL", hash_key, string_key});
}

TEST_CASE("redis: scripts are reloaded after a flush", "[redis][live]") {
  auto &live = LiveRedis::instance();
  if (!live.available()) {
    WARN("no redis-server on PATH and TSCACHE_REDIS_PORT unset");
    return;
  }
  RedisStore store(live.config());
  StoreError err;
  REQUIRE(store.ping(&err));
  CoherenceProtocol p(store);
  const auto key = unique_key("noscript");
  RawRedis raw;
  REQUIRE(raw.open(store.config()));
  raw.run({"DEL", key});

  REQUIRE(p.set(key, to_bytes("v"), ts(1)) == WriteOutcome::Accepted);
  const auto loads = store.stats().script_loads;
  raw.run({"SCRIPT", "FLUSH"});
  auto l = p.get(key, &err);
  REQUIRE(l.has_value());
  CHECK(l->hit);
  CHECK(store.stats().script_loads == loads + 1);

  raw.run({"DEL", key});
}
