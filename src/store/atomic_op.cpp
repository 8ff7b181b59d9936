#include "tscache/store.hpp"

namespace tscache {

AtomicOp AtomicOp::set(Bytes value, LogicalTimestamp ts) {
  AtomicOp op;
  op.kind = OpKind::Set;
  op.ts = ts;
  op.value = std::move(value);
  return op;
}

AtomicOp AtomicOp::invalidate(LogicalTimestamp ts) {
  AtomicOp op;
  op.kind = OpKind::Invalidate;
  op.ts = ts;
  return op;
}

AtomicOp AtomicOp::get() { return AtomicOp{}; }

OpEffect apply_op(const AtomicOp &op, const std::optional<CacheRecord> &current) {
  OpEffect effect;
  const CacheRecord base = current.value_or(CacheRecord{});

  switch (op.kind) {
  case OpKind::Set:
    // Strictly older than the last invalidation: the row may predate the
    // mutation that caused it. Strictly older than the stored value: a newer
    // row already won.
    if (op.ts < base.invalidate_ts ||
        (base.value.has_value() && op.ts < base.write_ts)) {
      effect.result.outcome = WriteOutcome::Rejected;
      return effect;
    }
    effect.write = true;
    effect.next = base;
    effect.next.value = op.value;
    effect.next.write_ts = op.ts;
    effect.retention = Retention::Clear;
    effect.result.outcome = WriteOutcome::Accepted;
    return effect;

  case OpKind::Invalidate:
    if (op.ts < base.invalidate_ts) {
      effect.result.outcome = WriteOutcome::Rejected;
      return effect;
    }
    effect.write = true;
    effect.next = base;
    effect.next.invalidate_ts = op.ts;
    // Only tombstones expire; a record holding a value keeps its invalidation
    // timestamp for as long as the value exists.
    effect.retention =
        effect.next.value.has_value() ? Retention::Keep : Retention::Arm;
    effect.result.outcome = WriteOutcome::Accepted;
    return effect;

  case OpKind::Get:
    if (current.has_value() && current->visible())
      effect.result.value = current->value;
    return effect;
  }
  return effect;
}

} // namespace tscache
