#pragma once

#include "tscache/store.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tscache {

struct ProtocolStats {
  std::uint64_t sets_accepted{0};
  std::uint64_t sets_rejected{0};
  std::uint64_t invalidations_accepted{0};
  std::uint64_t invalidations_rejected{0};
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t store_errors{0};
};

// Timestamp-ordered cache coherence over an IAtomicStore. Each call is a
// single execute_atomic() round-trip; the store is never accessed in a
// read-then-write sequence from here. Safe to share between threads.
//
// Store failures come back as nullopt with err filled in. Rejected and
// Miss are ordinary results.
class CoherenceProtocol {
public:
  explicit CoherenceProtocol(IAtomicStore &store);

  // Accepted unless ts is strictly older than the key's last invalidation or
  // than the value already stored. Clears any tombstone retention.
  std::optional<WriteOutcome> set(const std::string &key, const Bytes &value,
                                  LogicalTimestamp ts,
                                  StoreError *err = nullptr);

  // Accepted unless ts is strictly older than the key's last invalidation.
  // An accepted invalidation of a key holding no value (re)arms the
  // tombstone retention window.
  std::optional<WriteOutcome> invalidate(const std::string &key,
                                         LogicalTimestamp ts,
                                         StoreError *err = nullptr);

  std::optional<Lookup> get(const std::string &key, StoreError *err = nullptr);

  // One store call per key, no atomicity across keys. A failed key yields
  // nullopt in its slot and the first failure is copied to err. When
  // errors is given it receives one entry per item, kind None on success.
  std::vector<std::optional<WriteOutcome>>
  set_batch(const std::vector<std::pair<std::string, Bytes>> &items,
            LogicalTimestamp ts, StoreError *err = nullptr,
            std::vector<StoreError> *errors = nullptr);
  std::vector<std::optional<WriteOutcome>>
  invalidate_batch(const std::vector<std::string> &keys, LogicalTimestamp ts,
                   StoreError *err = nullptr);
  std::vector<std::optional<Lookup>> get_many(const std::vector<std::string> &keys,
                                              StoreError *err = nullptr);

  ProtocolStats stats() const;
  std::string info() const;
  IAtomicStore &store() { return store_; }

private:
  std::optional<WriteOutcome> write(const std::string &key, const AtomicOp &op,
                                    std::atomic<std::uint64_t> &accepted,
                                    std::atomic<std::uint64_t> &rejected,
                                    StoreError *err);

  IAtomicStore &store_;
  std::atomic<std::uint64_t> sets_accepted_{0};
  std::atomic<std::uint64_t> sets_rejected_{0};
  std::atomic<std::uint64_t> invalidations_accepted_{0};
  std::atomic<std::uint64_t> invalidations_rejected_{0};
  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> store_errors_{0};
};

} // namespace tscache
