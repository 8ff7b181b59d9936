#pragma once

#include "tscache/coherence.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tscache {

template <typename Row> struct RowCodec {
  std::function<Bytes(const Row &)> encode;
  std::function<bool(const Bytes &, Row &, std::string *)> decode;
};

struct PipelineConfig {
  // Serve get failures from the source of truth instead of failing the read.
  bool bypass_on_cache_error{true};
  std::ostream *log{&std::cerr};
};

struct PipelineStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t bypasses{0};
  std::uint64_t populated{0};
  std::uint64_t populate_rejected{0};
  std::uint64_t populate_failures{0};
  std::uint64_t invalidations{0};
  std::uint64_t invalidate_failures{0};
  std::uint64_t decode_failures{0};
};

// Read-through / write-through orchestration around a relational source of
// truth. The source is reached only through the callbacks passed to each
// call; the pipeline holds no row state and may be shared between threads.
//
// Read timestamps are taken before the source is queried and mutation
// timestamps after the mutation has committed, so a read that raced an
// update always carries the older timestamp and is rejected by the cache.
template <typename Row> class PopulationPipeline {
public:
  using KeyFn = std::function<std::string(const Row &)>;
  using FetchFn = std::function<bool(std::vector<Row> &, std::string *)>;
  using FetchKeysFn = std::function<bool(const std::vector<std::string> &,
                                         std::vector<Row> &, std::string *)>;
  using MutateFn = std::function<bool(std::string *)>;
  using TimestampFn = std::function<LogicalTimestamp()>;

  PopulationPipeline(CoherenceProtocol &protocol, RowCodec<Row> codec,
                     PipelineConfig cfg = {},
                     TimestampFn clock = &LogicalTimestamp::now)
      : protocol_(protocol), codec_(std::move(codec)), cfg_(cfg),
        clock_(std::move(clock)) {}

  // Runs fetch and writes every returned row to the cache under key_of(row),
  // all sharing the pre-fetch timestamp. Rows are returned even when caching
  // fails; the failure is logged, counted and reported as false.
  bool populate(const FetchFn &fetch, const KeyFn &key_of,
                std::vector<Row> *rows, std::string *err = nullptr) {
    const auto ts = clock_();
    std::vector<Row> fetched;
    if (!fetch(fetched, err))
      return false;

    std::vector<std::pair<std::string, Bytes>> items;
    items.reserve(fetched.size());
    for (const auto &row : fetched)
      items.emplace_back(key_of(row), codec_.encode(row));

    StoreError first;
    std::vector<StoreError> errors;
    auto outcomes = protocol_.set_batch(items, ts, &first, &errors);
    std::size_t failed = 0;
    for (std::size_t i = 0; i < outcomes.size(); ++i)
      failed += record_set(items[i].first, outcomes[i], errors[i]) ? 0 : 1;

    if (rows)
      *rows = std::move(fetched);
    if (failed > 0) {
      set_err(err, std::to_string(failed) + " of " + std::to_string(items.size()) +
                       " rows not cached: " + first.message);
      return false;
    }
    return true;
  }

  // Cache first; on a miss fetch from the source and, if populate is set,
  // cache the first returned row under key. *out stays empty when the source
  // has no row either.
  bool read_through(const std::string &key, const FetchFn &fetch, bool populate,
                    std::optional<Row> *out, std::string *err = nullptr) {
    if (out)
      out->reset();
    const auto ts = clock_();
    bool cacheable = true;
    std::optional<Row> cached;
    if (!lookup_one(key, &cached, &cacheable, err))
      return false;
    if (cached.has_value()) {
      if (out)
        *out = std::move(cached);
      return true;
    }

    std::vector<Row> fetched;
    if (!fetch(fetched, err))
      return false;
    if (fetched.empty())
      return true;
    if (populate && cacheable) {
      StoreError se;
      record_set(key, protocol_.set(key, codec_.encode(fetched.front()), ts, &se),
                 se);
    }
    if (out)
      *out = std::move(fetched.front());
    return true;
  }

  // Batched read-through. Keys that miss are fetched from the source in one
  // call; returned rows are matched back to keys with key_of. out[i]
  // corresponds to keys[i].
  bool read_through_many(const std::vector<std::string> &keys,
                         const FetchKeysFn &fetch_missing, const KeyFn &key_of,
                         bool populate, std::vector<std::optional<Row>> *out,
                         std::string *err = nullptr) {
    std::vector<std::optional<Row>> result(keys.size());
    const auto ts = clock_();
    std::vector<std::string> missing;
    std::vector<bool> cacheable(keys.size(), true);

    for (std::size_t i = 0; i < keys.size(); ++i) {
      bool ok = true;
      if (!lookup_one(keys[i], &result[i], &ok, err))
        return false;
      cacheable[i] = ok;
      if (!result[i].has_value())
        missing.push_back(keys[i]);
    }

    if (!missing.empty()) {
      std::vector<Row> fetched;
      if (!fetch_missing(missing, fetched, err))
        return false;
      std::unordered_map<std::string, Row> by_key;
      for (auto &row : fetched) {
        auto k = key_of(row);
        by_key.emplace(std::move(k), std::move(row));
      }
      std::vector<std::pair<std::string, Bytes>> items;
      for (std::size_t i = 0; i < keys.size(); ++i) {
        if (result[i].has_value())
          continue;
        auto it = by_key.find(keys[i]);
        if (it == by_key.end())
          continue;
        if (populate && cacheable[i])
          items.emplace_back(keys[i], codec_.encode(it->second));
        result[i] = it->second;
      }
      if (!items.empty()) {
        std::vector<StoreError> errors;
        auto outcomes = protocol_.set_batch(items, ts, nullptr, &errors);
        for (std::size_t i = 0; i < outcomes.size(); ++i)
          record_set(items[i].first, outcomes[i], errors[i]);
      }
    }
    if (out)
      *out = std::move(result);
    return true;
  }

  // Runs the mutation, then invalidates every key with a timestamp taken
  // after it committed. An invalidation failure is returned: the mutation
  // is already durable and the cache may still serve the old row until the
  // caller retries.
  bool update(const MutateFn &mutate, const std::vector<std::string> &keys,
              std::string *err = nullptr) {
    if (!mutate(err))
      return false;
    const auto ts = clock_();
    std::size_t failed = 0;
    std::string first;
    for (const auto &key : keys) {
      StoreError e;
      if (protocol_.invalidate(key, ts, &e)) {
        ++invalidations_;
        continue;
      }
      ++failed;
      ++invalidate_failures_;
      log_line("invalidate failed key=" + key + " ts=" + ts.to_string() +
               " error=" + error_kind_name(e.kind) + " " + e.message);
      if (first.empty())
        first = key + ": " + e.message;
    }
    if (failed > 0) {
      set_err(err, "mutation committed but " + std::to_string(failed) +
                       " invalidation(s) failed, first " + first);
      return false;
    }
    return true;
  }

  PipelineStats stats() const {
    PipelineStats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.bypasses = bypasses_.load();
    s.populated = populated_.load();
    s.populate_rejected = populate_rejected_.load();
    s.populate_failures = populate_failures_.load();
    s.invalidations = invalidations_.load();
    s.invalidate_failures = invalidate_failures_.load();
    s.decode_failures = decode_failures_.load();
    return s;
  }

  std::string info() const {
    const auto s = stats();
    std::ostringstream os;
    os << "pipeline_hits:" << s.hits << "\n";
    os << "pipeline_misses:" << s.misses << "\n";
    os << "pipeline_bypasses:" << s.bypasses << "\n";
    os << "pipeline_populated:" << s.populated << "\n";
    os << "pipeline_populate_rejected:" << s.populate_rejected << "\n";
    os << "pipeline_populate_failures:" << s.populate_failures << "\n";
    os << "pipeline_invalidations:" << s.invalidations << "\n";
    os << "pipeline_invalidate_failures:" << s.invalidate_failures << "\n";
    os << "pipeline_decode_failures:" << s.decode_failures << "\n";
    return os.str();
  }

private:
  static void set_err(std::string *err, const std::string &msg) {
    if (err)
      *err = msg;
  }

  void log_line(const std::string &line) {
    if (!cfg_.log)
      return;
    std::lock_guard<std::mutex> lock(log_mu_);
    *cfg_.log << "tscache pipeline: " << line << "\n";
  }

  // Cache half of a read-through. A hit leaves the decoded row in *out. A
  // store or decode failure is degraded (or fails the read when bypass is
  // off); *cacheable is cleared only when the store itself failed.
  bool lookup_one(const std::string &key, std::optional<Row> *out,
                  bool *cacheable, std::string *err) {
    StoreError e;
    auto lookup = protocol_.get(key, &e);
    if (!lookup) {
      *cacheable = false;
      return degrade(key, e, err);
    }
    if (!lookup->hit) {
      ++misses_;
      return true;
    }
    Row row;
    std::string why;
    if (!codec_.decode(lookup->value, row, &why)) {
      ++decode_failures_;
      return degrade(key, {ErrorKind::Serialization, why}, err);
    }
    ++hits_;
    if (out)
      *out = std::move(row);
    return true;
  }

  // A get failed. Either fall through to the source or fail the read.
  bool degrade(const std::string &key, const StoreError &e, std::string *err) {
    log_line("get failed key=" + key + " error=" + error_kind_name(e.kind) +
             " " + e.message + (cfg_.bypass_on_cache_error ? " (bypassing cache)" : ""));
    if (!cfg_.bypass_on_cache_error) {
      set_err(err, std::string(error_kind_name(e.kind)) + " " + e.message);
      return false;
    }
    ++bypasses_;
    return true;
  }

  bool record_set(const std::string &key, const std::optional<WriteOutcome> &o,
                  const StoreError &e) {
    if (!o) {
      ++populate_failures_;
      log_line("set failed key=" + key + " error=" + error_kind_name(e.kind) +
               " " + e.message);
      return false;
    }
    if (*o == WriteOutcome::Accepted)
      ++populated_;
    else
      ++populate_rejected_;
    return true;
  }

  CoherenceProtocol &protocol_;
  RowCodec<Row> codec_;
  PipelineConfig cfg_;
  TimestampFn clock_;
  std::mutex log_mu_;
  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> bypasses_{0};
  std::atomic<std::uint64_t> populated_{0};
  std::atomic<std::uint64_t> populate_rejected_{0};
  std::atomic<std::uint64_t> populate_failures_{0};
  std::atomic<std::uint64_t> invalidations_{0};
  std::atomic<std::uint64_t> invalidate_failures_{0};
  std::atomic<std::uint64_t> decode_failures_{0};
};

} // namespace tscache
