#pragma once

#include "tscache/resp.hpp"
#include "tscache/store.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tscache {

struct RedisStoreConfig {
  std::string host{"127.0.0.1"};
  int port{6379};
  std::uint64_t connect_timeout_ms{1000};
  std::uint64_t io_timeout_ms{1000};
  std::size_t max_retries{1};
  std::uint64_t tombstone_ttl_ms{120 * 1000};
};

// Blocking request/reply connection. Not thread-safe.
class RedisConnection {
public:
  RedisConnection() = default;
  ~RedisConnection();
  RedisConnection(const RedisConnection &) = delete;
  RedisConnection &operator=(const RedisConnection &) = delete;

  bool connect(const std::string &host, int port, std::uint64_t connect_timeout_ms,
               std::uint64_t io_timeout_ms, std::string *err = nullptr);
  void close();
  bool connected() const { return fd_ >= 0; }

  // Sends one command and waits for its reply. On failure the connection is
  // closed; *sent tells whether the request may have reached the server.
  std::optional<RespValue> command(const std::vector<std::string> &args,
                                   std::string *err = nullptr,
                                   bool *sent = nullptr);

private:
  bool send_all(const std::string &data, std::string *err);

  int fd_{-1};
  RespReplyParser parser_;
};

struct RedisStoreStats {
  std::uint64_t calls{0};
  std::uint64_t retries{0};
  std::uint64_t reconnects{0};
  std::uint64_t script_loads{0};
  std::uint64_t transport_errors{0};
  std::uint64_t corrupt_records{0};
};

// Remote realization: every operation is one server-side Lua script, so the
// timestamp comparison and the write happen without a round-trip between
// them.
class RedisStore final : public IAtomicStore {
public:
  explicit RedisStore(RedisStoreConfig cfg);

  std::string name() const override { return "redis"; }
  std::optional<OpResult> execute_atomic(const std::string &key,
                                         const AtomicOp &op,
                                         StoreError *err = nullptr) override;
  bool peek(const std::string &key, std::optional<StoredRecord> *out,
            StoreError *err = nullptr) override;
  std::string info() const override;

  bool ping(StoreError *err = nullptr);
  RedisStoreStats stats() const;
  const RedisStoreConfig &config() const { return cfg_; }

  static const std::string &set_script();
  static const std::string &invalidate_script();
  static const std::string &get_script();
  static const std::string &peek_script();

private:
  enum class Script { Set = 0, Invalidate, Get, Peek };

  std::optional<RespValue> run_script(Script script,
                                      const std::vector<std::string> &keys_and_args,
                                      StoreError *err);
  bool ensure_ready(StoreError *err);
  bool load_scripts(StoreError *err);
  static const std::string &script_source(Script script);

  RedisStoreConfig cfg_;
  mutable std::mutex mu_;
  RedisConnection conn_;
  std::vector<std::string> shas_;
  std::atomic<std::uint64_t> calls_{0};
  std::atomic<std::uint64_t> retries_{0};
  std::atomic<std::uint64_t> reconnects_{0};
  std::atomic<std::uint64_t> script_loads_{0};
  std::atomic<std::uint64_t> transport_errors_{0};
  std::atomic<std::uint64_t> corrupt_records_{0};
};

} // namespace tscache
