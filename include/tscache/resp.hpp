#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tscache {

// Server side: splits a byte stream into command argument vectors.
class RespParser {
public:
  void feed(const std::string& data);
  std::optional<std::vector<std::string>> next_command();

private:
  bool parse_bulk_string(std::size_t& pos, std::string& out) const;
  std::string buffer_;
};

enum class RespType { Simple, Error, Integer, Bulk, Null, Array };

struct RespValue {
  RespType type{RespType::Null};
  std::string str;
  long long integer{0};
  std::vector<RespValue> elements;

  bool is_error() const { return type == RespType::Error; }
  bool is_null() const { return type == RespType::Null; }
};

// Client side: decodes replies. A malformed stream is unrecoverable and is
// reported through malformed(); the connection must be dropped.
class RespReplyParser {
public:
  void feed(const char* data, std::size_t len);
  std::optional<RespValue> next_reply();
  bool malformed() const { return malformed_; }
  void reset();

private:
  enum class Parse { Ok, Incomplete, Bad };
  Parse parse_value(std::size_t& pos, RespValue& out, int depth) const;
  Parse parse_line(std::size_t& pos, std::string& line) const;

  std::string buffer_;
  bool malformed_{false};
};

std::string resp_simple(const std::string& s);
std::string resp_error(const std::string& s);
std::string resp_error_kind(const std::string& kind, const std::string& s);
std::string resp_integer(long long v);
std::string resp_bulk(const std::string& s);
std::string resp_null();
std::string resp_array(const std::vector<std::string>& items);
std::string resp_command(const std::vector<std::string>& args);

} // namespace tscache
