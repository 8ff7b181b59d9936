#pragma once

#include "tscache/types.hpp"

#include <string>
#include <unordered_map>

namespace tscache {

// Field names shared with the server-side scripts of the Redis store.
inline constexpr const char *kFieldWriteSec = "ts_sec";
inline constexpr const char *kFieldWriteNsec = "ts_nsec";
inline constexpr const char *kFieldInvalidateSec = "inv_sec";
inline constexpr const char *kFieldInvalidateNsec = "inv_nsec";
inline constexpr const char *kFieldValue = "v";

using FieldMap = std::unordered_map<std::string, std::string>;

FieldMap encode_record(const CacheRecord &record);
bool decode_record(const FieldMap &fields, CacheRecord *out,
                   std::string *err = nullptr);

} // namespace tscache
