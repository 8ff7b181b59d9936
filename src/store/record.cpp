#include "tscache/record.hpp"

#include <charconv>

namespace tscache {
namespace {
bool parse_i64(const std::string &s, std::int64_t &out) {
  if (s.empty())
    return false;
  const char *first = s.data();
  const char *last = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

bool fail(std::string *err, const std::string &msg) {
  if (err)
    *err = msg;
  return false;
}

// Reads a (sec, nsec) field pair. Both absent is fine; exactly one present
// or an unparsable number is not.
bool read_pair(const FieldMap &fields, const char *sec_field,
               const char *nsec_field, bool *present, LogicalTimestamp *out,
               std::string *err) {
  auto s = fields.find(sec_field);
  auto n = fields.find(nsec_field);
  *present = s != fields.end() || n != fields.end();
  if (!*present)
    return true;
  if (s == fields.end() || n == fields.end())
    return fail(err, std::string("incomplete timestamp pair ") + sec_field +
                         "/" + nsec_field);
  std::int64_t sec = 0;
  std::int64_t nsec = 0;
  if (!parse_i64(s->second, sec))
    return fail(err, std::string("non-integer ") + sec_field);
  if (!parse_i64(n->second, nsec))
    return fail(err, std::string("non-integer ") + nsec_field);
  if (nsec < 0 || nsec >= 1000000000)
    return fail(err, std::string(nsec_field) + " out of range");
  out->seconds = sec;
  out->nanoseconds = static_cast<std::int32_t>(nsec);
  return true;
}
} // namespace

FieldMap encode_record(const CacheRecord &record) {
  FieldMap fields;
  if (record.value.has_value()) {
    fields[kFieldWriteSec] = std::to_string(record.write_ts.seconds);
    fields[kFieldWriteNsec] = std::to_string(record.write_ts.nanoseconds);
    fields[kFieldValue] = to_string(*record.value);
  }
  if (!record.invalidate_ts.is_zero()) {
    fields[kFieldInvalidateSec] = std::to_string(record.invalidate_ts.seconds);
    fields[kFieldInvalidateNsec] =
        std::to_string(record.invalidate_ts.nanoseconds);
  }
  return fields;
}

bool decode_record(const FieldMap &fields, CacheRecord *out, std::string *err) {
  CacheRecord rec;
  bool has_write = false;
  bool has_inv = false;
  if (!read_pair(fields, kFieldWriteSec, kFieldWriteNsec, &has_write,
                 &rec.write_ts, err))
    return false;
  if (!read_pair(fields, kFieldInvalidateSec, kFieldInvalidateNsec, &has_inv,
                 &rec.invalidate_ts, err))
    return false;

  auto v = fields.find(kFieldValue);
  const bool has_value = v != fields.end();
  if (has_value != has_write)
    return fail(err, has_value ? "value without write timestamp"
                               : "write timestamp without value");
  if (has_value)
    rec.value = to_bytes(v->second);

  if (out)
    *out = std::move(rec);
  return true;
}

} // namespace tscache
