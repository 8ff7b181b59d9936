#include "tscache/local_store.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

namespace tscache {

LocalStore::LocalStore(LocalStoreConfig cfg) : cfg_(std::move(cfg)) {
  cfg_.shards = std::max<std::size_t>(1, cfg_.shards);
  shards_.reserve(cfg_.shards);
  for (std::size_t i = 0; i < cfg_.shards; ++i)
    shards_.push_back(std::make_unique<Shard>());
}

std::optional<OpResult> LocalStore::execute_atomic(const std::string &key,
                                                   const AtomicOp &op,
                                                   StoreError *err) {
  ++ops_;
  auto &shard = shard_for(key);
  std::lock_guard<std::mutex> lock(shard.mu);
  const auto now = Clock::now();

  std::optional<CacheRecord> current;
  Slot *slot = live_slot(shard, key, now);
  if (slot) {
    CacheRecord rec;
    std::string why;
    if (!decode_record(slot->fields, &rec, &why)) {
      ++corrupt_records_;
      set_error(err, ErrorKind::Corrupt, key + ": " + why);
      return std::nullopt;
    }
    current = std::move(rec);
  }

  OpEffect effect = apply_op(op, current);
  if (!effect.write)
    return effect.result;

  if (!slot)
    slot = &shard.slots[key];
  slot->fields = encode_record(effect.next);
  if (effect.retention == Retention::Arm) {
    arm_expiry(shard, key, *slot, now);
  } else if (effect.retention == Retention::Clear && slot->deadline) {
    slot->deadline.reset();
    ++shard.expiry_generation[key];
  }
  return effect.result;
}

bool LocalStore::peek(const std::string &key, std::optional<StoredRecord> *out,
                      StoreError *err) {
  auto &shard = shard_for(key);
  std::lock_guard<std::mutex> lock(shard.mu);
  const auto now = Clock::now();
  Slot *slot = live_slot(shard, key, now);
  if (!slot) {
    if (out)
      out->reset();
    return true;
  }
  StoredRecord stored;
  std::string why;
  if (!decode_record(slot->fields, &stored.record, &why)) {
    ++corrupt_records_;
    set_error(err, ErrorKind::Corrupt, key + ": " + why);
    return false;
  }
  if (slot->deadline) {
    stored.retention_ms = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(*slot->deadline -
                                                              now)
            .count());
  }
  if (out)
    *out = std::move(stored);
  return true;
}

void LocalStore::put_raw(const std::string &key, FieldMap fields) {
  auto &shard = shard_for(key);
  std::lock_guard<std::mutex> lock(shard.mu);
  auto &slot = shard.slots[key];
  slot.fields = std::move(fields);
  slot.deadline.reset();
  ++shard.expiry_generation[key];
}

void LocalStore::tick() {
  const auto now = Clock::now();
  for (auto &shard_ptr : shards_) {
    auto &shard = *shard_ptr;
    std::lock_guard<std::mutex> lock(shard.mu);
    std::size_t cleaned = 0;
    while (!shard.expiry_heap.empty() && cleaned < cfg_.ttl_cleanup_per_tick) {
      const auto &node = shard.expiry_heap.top();
      if (node.deadline > now)
        break;
      const auto key = node.key;
      const auto gen = node.generation;
      shard.expiry_heap.pop();
      auto it = shard.slots.find(key);
      if (it == shard.slots.end())
        continue;
      if (shard.expiry_generation[key] != gen)
        continue;
      if (it->second.deadline && *it->second.deadline <= now) {
        erase_slot(shard, key);
        ++expirations_;
      }
      ++cleaned;
    }
  }
}

std::size_t LocalStore::size() const {
  std::size_t n = 0;
  for (const auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mu);
    n += shard->slots.size();
  }
  return n;
}

LocalStoreStats LocalStore::stats() const {
  LocalStoreStats s;
  s.ops = ops_.load();
  s.expirations = expirations_.load();
  s.corrupt_records = corrupt_records_.load();
  return s;
}

std::string LocalStore::info() const {
  const auto s = stats();
  std::ostringstream os;
  os << "store:" << name() << "\n";
  os << "shards:" << shards_.size() << "\n";
  os << "keys:" << size() << "\n";
  os << "tombstone_ttl_ms:" << cfg_.tombstone_ttl_ms << "\n";
  os << "ops:" << s.ops << "\n";
  os << "expirations:" << s.expirations << "\n";
  os << "corrupt_records:" << s.corrupt_records << "\n";
  return os.str();
}

LocalStore::Shard &LocalStore::shard_for(const std::string &key) const {
  return *shards_[std::hash<std::string>{}(key) % shards_.size()];
}

LocalStore::Slot *LocalStore::live_slot(Shard &shard, const std::string &key,
                                        TimePoint now) {
  auto it = shard.slots.find(key);
  if (it == shard.slots.end())
    return nullptr;
  if (it->second.deadline && *it->second.deadline <= now) {
    erase_slot(shard, key);
    ++expirations_;
    return nullptr;
  }
  return &it->second;
}

void LocalStore::arm_expiry(Shard &shard, const std::string &key, Slot &slot,
                            TimePoint now) {
  slot.deadline = now + std::chrono::milliseconds(cfg_.tombstone_ttl_ms);
  const auto gen = ++shard.expiry_generation[key];
  shard.expiry_heap.push({*slot.deadline, key, gen});
}

void LocalStore::erase_slot(Shard &shard, const std::string &key) {
  shard.slots.erase(key);
  shard.expiry_generation.erase(key);
}

} // namespace tscache
