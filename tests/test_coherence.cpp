#include "tscache/coherence.hpp"
#include "tscache/local_store.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <random>
#include <thread>
#include <vector>

using namespace tscache;

namespace {
LogicalTimestamp ts(std::int64_t sec, std::int32_t nsec = 0) { return {sec, nsec}; }

std::string value_of(CoherenceProtocol &p, const std::string &key) {
  StoreError err;
  auto l = p.get(key, &err);
  REQUIRE(l.has_value());
  return l->hit ? to_string(l->value) : std::string("<miss>");
}
} // namespace

TEST_CASE("scenario: set, invalidate, stale set, fresh set", "[coherence]") {
  LocalStore store;
  CoherenceProtocol p(store);

  REQUIRE(p.set("a", to_bytes("v1"), ts(100)) == WriteOutcome::Accepted);
  CHECK(value_of(p, "a") == "v1");
  REQUIRE(p.invalidate("a", ts(150)) == WriteOutcome::Accepted);
  CHECK(value_of(p, "a") == "<miss>");
  CHECK(p.set("a", to_bytes("v2"), ts(120)) == WriteOutcome::Rejected);
  CHECK(value_of(p, "a") == "<miss>");
  CHECK(p.set("a", to_bytes("v3"), ts(150)) == WriteOutcome::Accepted);
  CHECK(value_of(p, "a") == "v3");
}

TEST_CASE("writes are ordered by timestamp, not call order", "[coherence]") {
  LocalStore store;
  CoherenceProtocol p(store);

  REQUIRE(p.set("fwd", to_bytes("v1"), ts(10)));
  REQUIRE(p.set("fwd", to_bytes("v2"), ts(10, 1)));
  CHECK(value_of(p, "fwd") == "v2");

  REQUIRE(p.set("rev", to_bytes("v2"), ts(10, 1)));
  CHECK(p.set("rev", to_bytes("v1"), ts(10)) == WriteOutcome::Rejected);
  CHECK(value_of(p, "rev") == "v2");
}

TEST_CASE("a set older than the invalidation is rejected", "[coherence]") {
  LocalStore store;
  CoherenceProtocol p(store);
  REQUIRE(p.invalidate("k", ts(20)) == WriteOutcome::Accepted);
  CHECK(p.set("k", to_bytes("v"), ts(19, 999999999)) == WriteOutcome::Rejected);
  CHECK(value_of(p, "k") == "<miss>");
}

TEST_CASE("equal timestamps: the write survives the invalidation", "[coherence]") {
  LocalStore store;
  CoherenceProtocol p(store);
  REQUIRE(p.invalidate("k", ts(20, 7)) == WriteOutcome::Accepted);
  CHECK(p.set("k", to_bytes("v"), ts(20, 7)) == WriteOutcome::Accepted);
  CHECK(value_of(p, "k") == "v");
}

TEST_CASE("replaying a call leaves the same record", "[coherence]") {
  LocalStore store;
  CoherenceProtocol p(store);

  REQUIRE(p.set("k", to_bytes("v"), ts(5)) == WriteOutcome::Accepted);
  std::optional<StoredRecord> once;
  REQUIRE(store.peek("k", &once));
  REQUIRE(p.set("k", to_bytes("v"), ts(5)) == WriteOutcome::Accepted);
  std::optional<StoredRecord> twice;
  REQUIRE(store.peek("k", &twice));
  REQUIRE(once.has_value());
  REQUIRE(twice.has_value());
  CHECK(once->record.value == twice->record.value);
  CHECK(once->record.write_ts == twice->record.write_ts);
  CHECK(once->record.invalidate_ts == twice->record.invalidate_ts);

  REQUIRE(p.invalidate("k", ts(6)) == WriteOutcome::Accepted);
  REQUIRE(p.invalidate("k", ts(6)) == WriteOutcome::Accepted);
  REQUIRE(store.peek("k", &twice));
  CHECK(twice->record.invalidate_ts == ts(6));
  CHECK(twice->record.write_ts == ts(5));
}

TEST_CASE("the invalidation timestamp only moves forward", "[coherence]") {
  LocalStore store;
  CoherenceProtocol p(store);
  REQUIRE(p.invalidate("k", ts(200)) == WriteOutcome::Accepted);
  CHECK(p.invalidate("k", ts(150)) == WriteOutcome::Rejected);
  CHECK(p.invalidate("k", ts(100)) == WriteOutcome::Rejected);
  CHECK(p.invalidate("k", ts(199, 999999999)) == WriteOutcome::Rejected);

  std::optional<StoredRecord> rec;
  REQUIRE(store.peek("k", &rec));
  REQUIRE(rec.has_value());
  CHECK(rec->record.invalidate_ts == ts(200));
}

TEST_CASE("get on an untouched key is a miss and writes nothing", "[coherence]") {
  LocalStore store;
  CoherenceProtocol p(store);
  CHECK(value_of(p, "never") == "<miss>");
  CHECK(store.size() == 0);
  std::optional<StoredRecord> rec;
  REQUIRE(store.peek("never", &rec));
  CHECK_FALSE(rec.has_value());
}

TEST_CASE("a stale value stays stored but hidden", "[coherence]") {
  LocalStore store;
  CoherenceProtocol p(store);
  REQUIRE(p.set("k", to_bytes("v1"), ts(1)));
  REQUIRE(p.invalidate("k", ts(2)));
  CHECK(value_of(p, "k") == "<miss>");
  std::optional<StoredRecord> rec;
  REQUIRE(store.peek("k", &rec));
  REQUIRE(rec.has_value());
  REQUIRE(rec->record.value.has_value());
  CHECK(to_string(*rec->record.value) == "v1");
}

TEST_CASE("concurrent sets converge on the highest timestamp",
          "[coherence][concurrency]") {
  LocalStore store;
  CoherenceProtocol p(store);
  constexpr int threads = 8;
  constexpr int per_thread = 500;

  std::vector<std::thread> pool;
  for (int t = 0; t < threads; ++t) {
    pool.emplace_back([&p, t] {
      std::vector<int> order(per_thread);
      for (int i = 0; i < per_thread; ++i)
        order[static_cast<std::size_t>(i)] = i;
      std::mt19937 rng(static_cast<unsigned>(t));
      std::shuffle(order.begin(), order.end(), rng);
      for (int i : order) {
        const std::int64_t n = static_cast<std::int64_t>(i) * threads + t;
        p.set("hot", to_bytes(std::to_string(n)), ts(1000, static_cast<std::int32_t>(n)));
      }
    });
  }
  for (auto &th : pool)
    th.join();

  CHECK(value_of(p, "hot") == std::to_string(threads * per_thread - 1));
  const auto s = p.stats();
  CHECK(s.sets_accepted + s.sets_rejected ==
        static_cast<std::uint64_t>(threads * per_thread));
  CHECK(s.store_errors == 0);
}

TEST_CASE("batch calls return one result per key", "[coherence][batch]") {
  LocalStore store;
  CoherenceProtocol p(store);
  REQUIRE(p.invalidate("b", ts(50)));

  StoreError err;
  auto sets = p.set_batch({{"a", to_bytes("1")}, {"b", to_bytes("2")},
                           {"c", to_bytes("3")}},
                          ts(40), &err);
  REQUIRE(sets.size() == 3);
  CHECK(sets[0] == WriteOutcome::Accepted);
  CHECK(sets[1] == WriteOutcome::Rejected);
  CHECK(sets[2] == WriteOutcome::Accepted);
  CHECK(err.kind == ErrorKind::None);

  auto invs = p.invalidate_batch({"a", "b"}, ts(45), &err);
  REQUIRE(invs.size() == 2);
  CHECK(invs[0] == WriteOutcome::Accepted);
  CHECK(invs[1] == WriteOutcome::Rejected);

  auto gets = p.get_many({"a", "b", "c", "d"}, &err);
  REQUIRE(gets.size() == 4);
  for (const auto &g : gets)
    REQUIRE(g.has_value());
  CHECK_FALSE(gets[0]->hit);
  CHECK_FALSE(gets[1]->hit);
  CHECK(gets[2]->hit);
  CHECK(to_string(gets[2]->value) == "3");
  CHECK_FALSE(gets[3]->hit);
}

TEST_CASE("batch calls keep going past a failing key", "[coherence][batch]") {
  LocalStore store;
  CoherenceProtocol p(store);
  store.put_raw("broken", {{"ts_sec", "1"}});

  StoreError err;
  auto sets = p.set_batch({{"ok1", to_bytes("1")}, {"broken", to_bytes("2")},
                           {"ok2", to_bytes("3")}},
                          ts(1), &err);
  REQUIRE(sets.size() == 3);
  CHECK(sets[0] == WriteOutcome::Accepted);
  CHECK_FALSE(sets[1].has_value());
  CHECK(sets[2] == WriteOutcome::Accepted);
  CHECK(err.kind == ErrorKind::Corrupt);
  CHECK(err.message.find("broken") != std::string::npos);
}

TEST_CASE("batch errors are reported per key", "[coherence][batch]") {
  LocalStore store;
  CoherenceProtocol p(store);
  store.put_raw("first", {{"v", "x"}});
  store.put_raw("second", {{"ts_sec", "1"}});

  StoreError err;
  std::vector<StoreError> errors;
  auto sets = p.set_batch({{"first", to_bytes("1")}, {"ok", to_bytes("2")},
                           {"second", to_bytes("3")}},
                          ts(1), &err, &errors);
  REQUIRE(sets.size() == 3);
  REQUIRE(errors.size() == 3);
  CHECK(errors[0].kind == ErrorKind::Corrupt);
  CHECK(errors[0].message.find("first: value without write timestamp") !=
        std::string::npos);
  CHECK(errors[1].kind == ErrorKind::None);
  CHECK(errors[2].kind == ErrorKind::Corrupt);
  CHECK(errors[2].message.find("second: incomplete timestamp pair") !=
        std::string::npos);
  CHECK(err.message == errors[0].message);
}

TEST_CASE("protocol stats and info", "[coherence][info]") {
  LocalStore store;
  CoherenceProtocol p(store);
  REQUIRE(p.set("k", to_bytes("v"), ts(1)));
  REQUIRE(p.invalidate("k", ts(2)));
  REQUIRE(p.set("k", to_bytes("v"), ts(1)) == WriteOutcome::Rejected);
  REQUIRE(p.invalidate("k", ts(1)) == WriteOutcome::Rejected);
  REQUIRE(p.get("k"));
  REQUIRE(p.set("k", to_bytes("v"), ts(3)));
  REQUIRE(p.get("k"));

  const auto s = p.stats();
  CHECK(s.sets_accepted == 2);
  CHECK(s.sets_rejected == 1);
  CHECK(s.invalidations_accepted == 1);
  CHECK(s.invalidations_rejected == 1);
  CHECK(s.hits == 1);
  CHECK(s.misses == 1);
  CHECK(s.store_errors == 0);

  const auto info = p.info();
  CHECK(info.find("store:local") != std::string::npos);
  CHECK(info.find("sets_accepted:2") != std::string::npos);
  CHECK(info.find("misses:1") != std::string::npos);
}
