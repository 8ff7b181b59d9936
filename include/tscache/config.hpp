#pragma once

#include "tscache/local_store.hpp"
#include "tscache/redis_store.hpp"

#include <memory>
#include <string>

namespace tscache {

struct ServerConfig {
  int port{6390};
  std::string backend{"local"};
  std::size_t max_connections{512};
  std::size_t max_pending_out{1 << 20};
  std::size_t max_cmds_per_iteration{64};
  LocalStoreConfig local{};
  RedisStoreConfig redis{};
};

// Reads a flat JSON object of known keys; unknown keys are ignored and
// numeric values are clamped. On error cfg is left untouched.
bool load_config(const std::string &path, ServerConfig &cfg,
                 std::string *err = nullptr);

std::unique_ptr<IAtomicStore> make_store(const ServerConfig &cfg,
                                         std::string *err = nullptr);

} // namespace tscache
