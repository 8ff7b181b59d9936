#include "tscache/redis_store.hpp"
#include "tscache/record.hpp"

#include <sstream>

namespace tscache {
namespace {

// Shared by the set, invalidate and get scripts. Validation mirrors
// decode_record(): a malformed hash is reported, never read as empty.
const char *kPrelude = R"lua(
local function read_pair(sec, nsec, name)
  if sec == false and nsec == false then
    return 0, 0, false, nil
  end
  if sec == false or nsec == false then
    return 0, 0, false, 'incomplete timestamp pair ' .. name
  end
  if not string.match(sec, '^-?%d+$') or not string.match(nsec, '^-?%d+$') then
    return 0, 0, false, 'non-integer ' .. name
  end
  local s = tonumber(sec)
  local n = tonumber(nsec)
  if n < 0 or n >= 1000000000 then
    return 0, 0, false, name .. ' out of range'
  end
  return s, n, true, nil
end

local function load_record(key)
  local f = redis.call('HMGET', key, 'ts_sec', 'ts_nsec', 'inv_sec', 'inv_nsec', 'v')
  local rec = {}
  local err
  rec.ts_sec, rec.ts_nsec, rec.has_ts, err = read_pair(f[1], f[2], 'ts_sec/ts_nsec')
  if err then return nil, err end
  rec.inv_sec, rec.inv_nsec, rec.has_inv, err = read_pair(f[3], f[4], 'inv_sec/inv_nsec')
  if err then return nil, err end
  rec.v = f[5]
  if rec.v ~= false and not rec.has_ts then
    return nil, 'value without write timestamp'
  end
  if rec.v == false and rec.has_ts then
    return nil, 'write timestamp without value'
  end
  return rec, nil
end

local function older(s1, n1, s2, n2)
  return s1 < s2 or (s1 == s2 and n1 < n2)
end
)lua";

// KEYS[1] = key, ARGV = value, sec, nsec
const char *kSetBody = R"lua(
local rec, err = load_record(KEYS[1])
if err then return redis.error_reply('CORRUPT ' .. KEYS[1] .. ': ' .. err) end
local sec = tonumber(ARGV[2])
local nsec = tonumber(ARGV[3])
if older(sec, nsec, rec.inv_sec, rec.inv_nsec) then
  return 0
end
if rec.v ~= false and older(sec, nsec, rec.ts_sec, rec.ts_nsec) then
  return 0
end
redis.call('HSET', KEYS[1], 'ts_sec', ARGV[2], 'ts_nsec', ARGV[3], 'v', ARGV[1])
redis.call('PERSIST', KEYS[1])
return 1
)lua";

// KEYS[1] = key, ARGV = sec, nsec, retention ms
const char *kInvalidateBody = R"lua(
local rec, err = load_record(KEYS[1])
if err then return redis.error_reply('CORRUPT ' .. KEYS[1] .. ': ' .. err) end
if older(tonumber(ARGV[1]), tonumber(ARGV[2]), rec.inv_sec, rec.inv_nsec) then
  return 0
end
redis.call('HSET', KEYS[1], 'inv_sec', ARGV[1], 'inv_nsec', ARGV[2])
if rec.v == false then
  redis.call('PEXPIRE', KEYS[1], ARGV[3])
end
return 1
)lua";

const char *kGetBody = R"lua(
local rec, err = load_record(KEYS[1])
if err then return redis.error_reply('CORRUPT ' .. KEYS[1] .. ': ' .. err) end
if rec.v == false then return false end
if older(rec.ts_sec, rec.ts_nsec, rec.inv_sec, rec.inv_nsec) then return false end
return rec.v
)lua";

const char *kPeekBody = R"lua(
return {redis.call('HGETALL', KEYS[1]), redis.call('PTTL', KEYS[1])}
)lua";

bool starts_with(const std::string &s, const char *prefix) {
  return s.rfind(prefix, 0) == 0;
}

// Maps a server error reply to the error taxonomy.
void error_from_reply(const RespValue &reply, StoreError *err) {
  if (starts_with(reply.str, "CORRUPT") ||
      reply.str.find("WRONGTYPE") != std::string::npos) {
    set_error(err, ErrorKind::Corrupt, reply.str);
    return;
  }
  set_error(err, ErrorKind::Unavailable, "redis: " + reply.str);
}

std::string ts_sec(const LogicalTimestamp &ts) { return std::to_string(ts.seconds); }
std::string ts_nsec(const LogicalTimestamp &ts) {
  return std::to_string(ts.nanoseconds);
}

} // namespace

RedisStore::RedisStore(RedisStoreConfig cfg) : cfg_(std::move(cfg)) {}

const std::string &RedisStore::set_script() {
  static const std::string s = std::string(kPrelude) + kSetBody;
  return s;
}
const std::string &RedisStore::invalidate_script() {
  static const std::string s = std::string(kPrelude) + kInvalidateBody;
  return s;
}
const std::string &RedisStore::get_script() {
  static const std::string s = std::string(kPrelude) + kGetBody;
  return s;
}
const std::string &RedisStore::peek_script() {
  static const std::string s = kPeekBody;
  return s;
}

const std::string &RedisStore::script_source(Script script) {
  switch (script) {
  case Script::Set:
    return set_script();
  case Script::Invalidate:
    return invalidate_script();
  case Script::Get:
    return get_script();
  case Script::Peek:
    return peek_script();
  }
  return peek_script();
}

std::optional<OpResult> RedisStore::execute_atomic(const std::string &key,
                                                   const AtomicOp &op,
                                                   StoreError *err) {
  std::optional<RespValue> reply;
  switch (op.kind) {
  case OpKind::Set:
    reply = run_script(Script::Set,
                       {key, to_string(op.value), ts_sec(op.ts), ts_nsec(op.ts)},
                       err);
    break;
  case OpKind::Invalidate:
    reply = run_script(Script::Invalidate,
                       {key, ts_sec(op.ts), ts_nsec(op.ts),
                        std::to_string(cfg_.tombstone_ttl_ms)},
                       err);
    break;
  case OpKind::Get:
    reply = run_script(Script::Get, {key}, err);
    break;
  }
  if (!reply)
    return std::nullopt;
  if (reply->is_error()) {
    if (starts_with(reply->str, "CORRUPT"))
      ++corrupt_records_;
    error_from_reply(*reply, err);
    return std::nullopt;
  }

  OpResult result;
  if (op.kind == OpKind::Get) {
    if (reply->type == RespType::Bulk)
      result.value = to_bytes(reply->str);
    else if (!reply->is_null()) {
      set_error(err, ErrorKind::Unavailable, "redis: unexpected get reply");
      return std::nullopt;
    }
    return result;
  }
  if (reply->type != RespType::Integer) {
    set_error(err, ErrorKind::Unavailable, "redis: unexpected write reply");
    return std::nullopt;
  }
  result.outcome =
      reply->integer == 1 ? WriteOutcome::Accepted : WriteOutcome::Rejected;
  return result;
}

bool RedisStore::peek(const std::string &key, std::optional<StoredRecord> *out,
                      StoreError *err) {
  auto reply = run_script(Script::Peek, {key}, err);
  if (!reply)
    return false;
  if (reply->is_error()) {
    error_from_reply(*reply, err);
    return false;
  }
  if (reply->type != RespType::Array || reply->elements.size() != 2 ||
      reply->elements[0].type != RespType::Array ||
      reply->elements[1].type != RespType::Integer) {
    set_error(err, ErrorKind::Unavailable, "redis: unexpected peek reply");
    return false;
  }
  const auto &pairs = reply->elements[0].elements;
  if (pairs.empty()) {
    if (out)
      out->reset();
    return true;
  }
  FieldMap fields;
  for (std::size_t i = 0; i + 1 < pairs.size(); i += 2)
    fields[pairs[i].str] = pairs[i + 1].str;

  StoredRecord stored;
  std::string why;
  if (!decode_record(fields, &stored.record, &why)) {
    ++corrupt_records_;
    set_error(err, ErrorKind::Corrupt, key + ": " + why);
    return false;
  }
  const long long pttl = reply->elements[1].integer;
  if (pttl >= 0)
    stored.retention_ms = static_cast<std::uint64_t>(pttl);
  if (out)
    *out = std::move(stored);
  return true;
}

bool RedisStore::ping(StoreError *err) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!conn_.connected()) {
    std::string why;
    if (!conn_.connect(cfg_.host, cfg_.port, cfg_.connect_timeout_ms,
                       cfg_.io_timeout_ms, &why)) {
      set_error(err, ErrorKind::Unavailable, "redis: " + why);
      return false;
    }
    ++reconnects_;
    shas_.clear();
  }
  std::string why;
  auto reply = conn_.command({"PING"}, &why);
  if (!reply) {
    set_error(err, ErrorKind::Unavailable, "redis: " + why);
    return false;
  }
  if (reply->is_error()) {
    set_error(err, ErrorKind::Unavailable, "redis: " + reply->str);
    return false;
  }
  return true;
}

std::optional<RespValue>
RedisStore::run_script(Script script,
                       const std::vector<std::string> &keys_and_args,
                       StoreError *err) {
  std::lock_guard<std::mutex> lock(mu_);
  ++calls_;
  std::string last_error = "not attempted";
  bool maybe_applied = false;

  bool reloaded = false;
  std::size_t attempt = 0;
  while (attempt <= cfg_.max_retries) {
    StoreError ready_err;
    if (!ensure_ready(&ready_err)) {
      last_error = ready_err.message;
      if (++attempt <= cfg_.max_retries)
        ++retries_;
      continue;
    }

    std::vector<std::string> args;
    args.reserve(keys_and_args.size() + 3);
    args.push_back("EVALSHA");
    args.push_back(shas_[static_cast<std::size_t>(script)]);
    args.push_back("1");
    args.insert(args.end(), keys_and_args.begin(), keys_and_args.end());

    std::string why;
    bool sent = false;
    auto reply = conn_.command(args, &why, &sent);
    if (!reply) {
      ++transport_errors_;
      maybe_applied = maybe_applied || sent;
      last_error = why;
      if (++attempt <= cfg_.max_retries)
        ++retries_;
      continue;
    }
    if (reply->is_error() && starts_with(reply->str, "NOSCRIPT") && !reloaded) {
      // Script cache was flushed server-side; reload once and resend.
      reloaded = true;
      shas_.clear();
      continue;
    }
    return reply;
  }

  std::string msg = "redis " + cfg_.host + ":" + std::to_string(cfg_.port) +
                    ": " + last_error;
  if (maybe_applied)
    msg += " (outcome unknown, re-read the key)";
  set_error(err, ErrorKind::Unavailable, msg);
  return std::nullopt;
}

bool RedisStore::ensure_ready(StoreError *err) {
  if (!conn_.connected()) {
    std::string why;
    if (!conn_.connect(cfg_.host, cfg_.port, cfg_.connect_timeout_ms,
                       cfg_.io_timeout_ms, &why)) {
      ++transport_errors_;
      set_error(err, ErrorKind::Unavailable, why);
      return false;
    }
    ++reconnects_;
    shas_.clear();
  }
  if (shas_.empty())
    return load_scripts(err);
  return true;
}

bool RedisStore::load_scripts(StoreError *err) {
  std::vector<std::string> shas;
  for (auto script : {Script::Set, Script::Invalidate, Script::Get, Script::Peek}) {
    std::string why;
    auto reply = conn_.command({"SCRIPT", "LOAD", script_source(script)}, &why);
    if (!reply) {
      ++transport_errors_;
      set_error(err, ErrorKind::Unavailable, why);
      return false;
    }
    if (reply->type != RespType::Bulk) {
      set_error(err, ErrorKind::Unavailable,
                "SCRIPT LOAD failed: " + (reply->is_error() ? reply->str : "bad reply"));
      return false;
    }
    shas.push_back(reply->str);
  }
  ++script_loads_;
  shas_ = std::move(shas);
  return true;
}

RedisStoreStats RedisStore::stats() const {
  RedisStoreStats s;
  s.calls = calls_.load();
  s.retries = retries_.load();
  s.reconnects = reconnects_.load();
  s.script_loads = script_loads_.load();
  s.transport_errors = transport_errors_.load();
  s.corrupt_records = corrupt_records_.load();
  return s;
}

std::string RedisStore::info() const {
  const auto s = stats();
  std::ostringstream os;
  os << "store:" << name() << "\n";
  os << "redis_endpoint:" << cfg_.host << ":" << cfg_.port << "\n";
  os << "tombstone_ttl_ms:" << cfg_.tombstone_ttl_ms << "\n";
  os << "calls:" << s.calls << "\n";
  os << "retries:" << s.retries << "\n";
  os << "reconnects:" << s.reconnects << "\n";
  os << "script_loads:" << s.script_loads << "\n";
  os << "transport_errors:" << s.transport_errors << "\n";
  os << "corrupt_records:" << s.corrupt_records << "\n";
  return os.str();
}

} // namespace tscache
