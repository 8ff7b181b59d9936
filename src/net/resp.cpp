#include "tscache/resp.hpp"

#include <charconv>

namespace tscache {
namespace {
constexpr long long kMaxBulkLen = 64LL * 1024 * 1024;
constexpr long long kMaxArrayLen = 1024 * 1024;
constexpr int kMaxDepth = 8;

bool parse_ll(const std::string& s, long long& out) {
  if (s.empty()) return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}
} // namespace

void RespParser::feed(const std::string& data) { buffer_ += data; }

std::optional<std::vector<std::string>> RespParser::next_command() {
  if (buffer_.empty()) return std::nullopt;
  if (buffer_[0] != '*') {
    auto pos = buffer_.find("\r\n");
    if (pos == std::string::npos) return std::nullopt;
    buffer_.erase(0, pos + 2);
    return std::vector<std::string>{"__MALFORMED__"};
  }
  auto crlf = buffer_.find("\r\n");
  if (crlf == std::string::npos) return std::nullopt;
  long long argc = 0;
  if (!parse_ll(buffer_.substr(1, crlf - 1), argc) || argc < 0 || argc > 1024) {
    buffer_.erase(0, crlf + 2);
    return std::vector<std::string>{"__MALFORMED__"};
  }
  std::size_t pos = crlf + 2;
  std::vector<std::string> out;
  for (long long i = 0; i < argc; ++i) {
    std::string token;
    if (!parse_bulk_string(pos, token)) return std::nullopt;
    out.push_back(std::move(token));
  }
  buffer_.erase(0, pos);
  return out;
}

bool RespParser::parse_bulk_string(std::size_t& pos, std::string& out) const {
  if (pos >= buffer_.size() || buffer_[pos] != '$') return false;
  auto crlf = buffer_.find("\r\n", pos);
  if (crlf == std::string::npos) return false;
  long long len = 0;
  if (!parse_ll(buffer_.substr(pos + 1, crlf - (pos + 1)), len)) return false;
  if (len < 0 || len > 8 * 1024 * 1024) return false;
  std::size_t data_start = crlf + 2;
  std::size_t data_end = data_start + static_cast<std::size_t>(len);
  if (data_end + 2 > buffer_.size()) return false;
  if (buffer_.compare(data_end, 2, "\r\n") != 0) return false;
  out = buffer_.substr(data_start, static_cast<std::size_t>(len));
  pos = data_end + 2;
  return true;
}

void RespReplyParser::feed(const char* data, std::size_t len) {
  buffer_.append(data, len);
}

void RespReplyParser::reset() {
  buffer_.clear();
  malformed_ = false;
}

std::optional<RespValue> RespReplyParser::next_reply() {
  if (malformed_ || buffer_.empty()) return std::nullopt;
  std::size_t pos = 0;
  RespValue v;
  switch (parse_value(pos, v, 0)) {
    case Parse::Ok:
      buffer_.erase(0, pos);
      return v;
    case Parse::Incomplete:
      return std::nullopt;
    case Parse::Bad:
      malformed_ = true;
      return std::nullopt;
  }
  return std::nullopt;
}

RespReplyParser::Parse RespReplyParser::parse_line(std::size_t& pos,
                                                   std::string& line) const {
  auto crlf = buffer_.find("\r\n", pos);
  if (crlf == std::string::npos) return Parse::Incomplete;
  line = buffer_.substr(pos, crlf - pos);
  pos = crlf + 2;
  return Parse::Ok;
}

RespReplyParser::Parse RespReplyParser::parse_value(std::size_t& pos,
                                                    RespValue& out,
                                                    int depth) const {
  if (depth > kMaxDepth) return Parse::Bad;
  if (pos >= buffer_.size()) return Parse::Incomplete;
  const char tag = buffer_[pos];
  std::size_t p = pos + 1;
  std::string line;
  if (auto r = parse_line(p, line); r != Parse::Ok) return r;

  switch (tag) {
    case '+':
      out.type = RespType::Simple;
      out.str = std::move(line);
      break;
    case '-':
      out.type = RespType::Error;
      out.str = std::move(line);
      break;
    case ':':
      out.type = RespType::Integer;
      if (!parse_ll(line, out.integer)) return Parse::Bad;
      break;
    case '$': {
      long long len = 0;
      if (!parse_ll(line, len) || len < -1 || len > kMaxBulkLen) return Parse::Bad;
      if (len == -1) {
        out.type = RespType::Null;
        break;
      }
      const std::size_t end = p + static_cast<std::size_t>(len);
      if (end + 2 > buffer_.size()) return Parse::Incomplete;
      if (buffer_.compare(end, 2, "\r\n") != 0) return Parse::Bad;
      out.type = RespType::Bulk;
      out.str = buffer_.substr(p, static_cast<std::size_t>(len));
      p = end + 2;
      break;
    }
    case '*': {
      long long n = 0;
      if (!parse_ll(line, n) || n < -1 || n > kMaxArrayLen) return Parse::Bad;
      if (n == -1) {
        out.type = RespType::Null;
        break;
      }
      out.type = RespType::Array;
      out.elements.clear();
      out.elements.reserve(static_cast<std::size_t>(n));
      for (long long i = 0; i < n; ++i) {
        RespValue child;
        if (auto r = parse_value(p, child, depth + 1); r != Parse::Ok) return r;
        out.elements.push_back(std::move(child));
      }
      break;
    }
    default:
      return Parse::Bad;
  }
  pos = p;
  return Parse::Ok;
}

std::string resp_simple(const std::string& s) { return "+" + s + "\r\n"; }
std::string resp_error(const std::string& s) { return "-ERR " + s + "\r\n"; }
std::string resp_error_kind(const std::string& kind, const std::string& s) {
  return "-" + kind + " " + s + "\r\n";
}
std::string resp_integer(long long v) { return ":" + std::to_string(v) + "\r\n"; }
std::string resp_bulk(const std::string& s) { return "$" + std::to_string(s.size()) + "\r\n" + s + "\r\n"; }
std::string resp_null() { return "$-1\r\n"; }
std::string resp_array(const std::vector<std::string>& items) {
  std::string out = "*" + std::to_string(items.size()) + "\r\n";
  for (const auto& i : items) out += i;
  return out;
}
std::string resp_command(const std::vector<std::string>& args) {
  std::vector<std::string> items;
  items.reserve(args.size());
  for (const auto& a : args) items.push_back(resp_bulk(a));
  return resp_array(items);
}

} // namespace tscache
