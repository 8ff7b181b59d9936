#include "tscache/config.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace tscache {
namespace {
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  try {
    out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  } catch (const std::out_of_range &) {
    return false;
  }
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
std::uint64_t clamp_u64(std::uint64_t v, std::uint64_t lo, std::uint64_t hi) {
  return std::clamp(v, lo, hi);
}
} // namespace

bool load_config(const std::string &path, ServerConfig &cfg, std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found: " + path;
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  ServerConfig c = cfg;
  std::uint64_t u;
  std::string s;
  if (extract_u64(text, "port", u))
    c.port = static_cast<int>(clamp_u64(u, 1, 65535));
  if (extract_string(text, "backend", s))
    c.backend = s;
  if (extract_u64(text, "max_connections", u))
    c.max_connections = clamp_u64(u, 1, 65536);
  if (extract_u64(text, "max_pending_out", u))
    c.max_pending_out = clamp_u64(u, 4096, 1ULL << 30);
  if (extract_u64(text, "shards", u))
    c.local.shards = clamp_u64(u, 1, 4096);
  if (extract_u64(text, "tombstone_ttl_ms", u)) {
    c.local.tombstone_ttl_ms = clamp_u64(u, 1, 24ULL * 3600 * 1000);
    c.redis.tombstone_ttl_ms = c.local.tombstone_ttl_ms;
  }
  if (extract_u64(text, "ttl_cleanup_per_tick", u))
    c.local.ttl_cleanup_per_tick = clamp_u64(u, 1, 1000000);
  if (extract_string(text, "redis_host", s))
    c.redis.host = s;
  if (extract_u64(text, "redis_port", u))
    c.redis.port = static_cast<int>(clamp_u64(u, 1, 65535));
  if (extract_u64(text, "redis_connect_timeout_ms", u))
    c.redis.connect_timeout_ms = clamp_u64(u, 1, 60000);
  if (extract_u64(text, "redis_io_timeout_ms", u))
    c.redis.io_timeout_ms = clamp_u64(u, 1, 60000);
  if (extract_u64(text, "redis_max_retries", u))
    c.redis.max_retries = clamp_u64(u, 0, 16);

  if (c.backend != "local" && c.backend != "redis") {
    if (err)
      *err = "unknown backend: " + c.backend;
    return false;
  }
  cfg = std::move(c);
  return true;
}

std::unique_ptr<IAtomicStore> make_store(const ServerConfig &cfg,
                                         std::string *err) {
  if (cfg.backend == "local")
    return std::make_unique<LocalStore>(cfg.local);
  if (cfg.backend == "redis")
    return std::make_unique<RedisStore>(cfg.redis);
  if (err)
    *err = "unknown backend: " + cfg.backend;
  return nullptr;
}

} // namespace tscache
