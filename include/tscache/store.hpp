#pragma once

#include "tscache/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace tscache {

enum class OpKind { Set, Invalidate, Get };

// One read-modify-write step on a single key. The local store runs
// apply_op() under the key's lock; the Redis store runs the equivalent
// server-side script.
struct AtomicOp {
  OpKind kind{OpKind::Get};
  LogicalTimestamp ts{};
  Bytes value;

  static AtomicOp set(Bytes value, LogicalTimestamp ts);
  static AtomicOp invalidate(LogicalTimestamp ts);
  static AtomicOp get();
};

struct OpResult {
  WriteOutcome outcome{WriteOutcome::Rejected};
  std::optional<Bytes> value;
};

enum class Retention { Keep, Arm, Clear };

struct OpEffect {
  bool write{false};
  CacheRecord next;
  Retention retention{Retention::Keep};
  OpResult result;
};

OpEffect apply_op(const AtomicOp &op, const std::optional<CacheRecord> &current);

struct StoredRecord {
  CacheRecord record;
  std::optional<std::uint64_t> retention_ms;
};

class IAtomicStore {
public:
  virtual ~IAtomicStore() = default;
  virtual std::string name() const = 0;

  // Linearizable per key. Returns nullopt and fills err on failure; a
  // Rejected outcome or a missing value is a successful result.
  virtual std::optional<OpResult> execute_atomic(const std::string &key,
                                                 const AtomicOp &op,
                                                 StoreError *err = nullptr) = 0;

  // Read-only snapshot of the persisted record, for diagnostics and tests.
  virtual bool peek(const std::string &key, std::optional<StoredRecord> *out,
                    StoreError *err = nullptr) = 0;

  virtual std::string info() const = 0;
};

} // namespace tscache
