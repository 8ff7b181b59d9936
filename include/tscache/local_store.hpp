#pragma once

#include "tscache/record.hpp"
#include "tscache/store.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

namespace tscache {

struct LocalStoreConfig {
  std::size_t shards{16};
  std::uint64_t tombstone_ttl_ms{120 * 1000};
  std::size_t ttl_cleanup_per_tick{128};
};

struct LocalStoreStats {
  std::uint64_t ops{0};
  std::uint64_t expirations{0};
  std::uint64_t corrupt_records{0};
};

// In-process realization: one mutex per shard serializes every
// read-modify-write on the keys hashed to it.
class LocalStore final : public IAtomicStore {
public:
  explicit LocalStore(LocalStoreConfig cfg = {});

  std::string name() const override { return "local"; }
  std::optional<OpResult> execute_atomic(const std::string &key,
                                         const AtomicOp &op,
                                         StoreError *err = nullptr) override;
  bool peek(const std::string &key, std::optional<StoredRecord> *out,
            StoreError *err = nullptr) override;
  std::string info() const override;

  // Overwrites the persisted fields of key without validation.
  void put_raw(const std::string &key, FieldMap fields);

  void tick();
  std::size_t size() const;
  LocalStoreStats stats() const;
  const LocalStoreConfig &config() const { return cfg_; }

private:
  struct Slot {
    FieldMap fields;
    std::optional<TimePoint> deadline;
  };

  struct ExpiryNode {
    TimePoint deadline;
    std::string key;
    std::uint64_t generation;
    bool operator>(const ExpiryNode &other) const {
      return deadline > other.deadline;
    }
  };

  struct Shard {
    mutable std::mutex mu;
    std::unordered_map<std::string, Slot> slots;
    std::unordered_map<std::string, std::uint64_t> expiry_generation;
    std::priority_queue<ExpiryNode, std::vector<ExpiryNode>,
                        std::greater<ExpiryNode>>
        expiry_heap;
  };

  Shard &shard_for(const std::string &key) const;
  Slot *live_slot(Shard &shard, const std::string &key, TimePoint now);
  void arm_expiry(Shard &shard, const std::string &key, Slot &slot,
                  TimePoint now);
  void erase_slot(Shard &shard, const std::string &key);

  LocalStoreConfig cfg_;
  std::vector<std::unique_ptr<Shard>> shards_;
  std::atomic<std::uint64_t> ops_{0};
  std::atomic<std::uint64_t> expirations_{0};
  std::atomic<std::uint64_t> corrupt_records_{0};
};

} // namespace tscache
