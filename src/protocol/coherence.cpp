#include "tscache/coherence.hpp"

#include <sstream>

namespace tscache {
namespace {
void keep_first(StoreError *first, const StoreError &e) {
  if (first && first->kind == ErrorKind::None)
    *first = e;
}
} // namespace

CoherenceProtocol::CoherenceProtocol(IAtomicStore &store) : store_(store) {}

std::optional<WriteOutcome>
CoherenceProtocol::write(const std::string &key, const AtomicOp &op,
                         std::atomic<std::uint64_t> &accepted,
                         std::atomic<std::uint64_t> &rejected, StoreError *err) {
  auto res = store_.execute_atomic(key, op, err);
  if (!res) {
    ++store_errors_;
    return std::nullopt;
  }
  if (res->outcome == WriteOutcome::Accepted)
    ++accepted;
  else
    ++rejected;
  return res->outcome;
}

std::optional<WriteOutcome> CoherenceProtocol::set(const std::string &key,
                                                   const Bytes &value,
                                                   LogicalTimestamp ts,
                                                   StoreError *err) {
  return write(key, AtomicOp::set(value, ts), sets_accepted_, sets_rejected_,
               err);
}

std::optional<WriteOutcome>
CoherenceProtocol::invalidate(const std::string &key, LogicalTimestamp ts,
                              StoreError *err) {
  return write(key, AtomicOp::invalidate(ts), invalidations_accepted_,
               invalidations_rejected_, err);
}

std::optional<Lookup> CoherenceProtocol::get(const std::string &key,
                                             StoreError *err) {
  auto res = store_.execute_atomic(key, AtomicOp::get(), err);
  if (!res) {
    ++store_errors_;
    return std::nullopt;
  }
  Lookup lookup;
  if (res->value.has_value()) {
    ++hits_;
    lookup.hit = true;
    lookup.value = std::move(*res->value);
  } else {
    ++misses_;
  }
  return lookup;
}

std::vector<std::optional<WriteOutcome>>
CoherenceProtocol::set_batch(const std::vector<std::pair<std::string, Bytes>> &items,
                             LogicalTimestamp ts, StoreError *err,
                             std::vector<StoreError> *errors) {
  std::vector<std::optional<WriteOutcome>> out;
  out.reserve(items.size());
  if (errors)
    errors->assign(items.size(), StoreError{});
  for (std::size_t i = 0; i < items.size(); ++i) {
    StoreError e;
    out.push_back(set(items[i].first, items[i].second, ts, &e));
    if (out.back())
      continue;
    keep_first(err, e);
    if (errors)
      (*errors)[i] = std::move(e);
  }
  return out;
}

std::vector<std::optional<WriteOutcome>>
CoherenceProtocol::invalidate_batch(const std::vector<std::string> &keys,
                                    LogicalTimestamp ts, StoreError *err) {
  std::vector<std::optional<WriteOutcome>> out;
  out.reserve(keys.size());
  for (const auto &key : keys) {
    StoreError e;
    out.push_back(invalidate(key, ts, &e));
    if (!out.back())
      keep_first(err, e);
  }
  return out;
}

std::vector<std::optional<Lookup>>
CoherenceProtocol::get_many(const std::vector<std::string> &keys,
                            StoreError *err) {
  std::vector<std::optional<Lookup>> out;
  out.reserve(keys.size());
  for (const auto &key : keys) {
    StoreError e;
    out.push_back(get(key, &e));
    if (!out.back())
      keep_first(err, e);
  }
  return out;
}

ProtocolStats CoherenceProtocol::stats() const {
  ProtocolStats s;
  s.sets_accepted = sets_accepted_.load();
  s.sets_rejected = sets_rejected_.load();
  s.invalidations_accepted = invalidations_accepted_.load();
  s.invalidations_rejected = invalidations_rejected_.load();
  s.hits = hits_.load();
  s.misses = misses_.load();
  s.store_errors = store_errors_.load();
  return s;
}

std::string CoherenceProtocol::info() const {
  const auto s = stats();
  std::ostringstream os;
  os << store_.info();
  os << "sets_accepted:" << s.sets_accepted << "\n";
  os << "sets_rejected:" << s.sets_rejected << "\n";
  os << "invalidations_accepted:" << s.invalidations_accepted << "\n";
  os << "invalidations_rejected:" << s.invalidations_rejected << "\n";
  os << "hits:" << s.hits << "\n";
  os << "misses:" << s.misses << "\n";
  os << "store_errors:" << s.store_errors << "\n";
  return os.str();
}

} // namespace tscache
