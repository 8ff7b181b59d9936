#include "tscache/resp.hpp"

#include <arpa/inet.h>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace {

void print_reply(const tscache::RespValue &v, const std::string &indent) {
  switch (v.type) {
  case tscache::RespType::Simple:
    std::cout << indent << v.str << "\n";
    break;
  case tscache::RespType::Error:
    std::cout << indent << "(error) " << v.str << "\n";
    break;
  case tscache::RespType::Integer:
    std::cout << indent << "(integer) " << v.integer << "\n";
    break;
  case tscache::RespType::Bulk:
    std::cout << indent << '"' << v.str << '"' << "\n";
    break;
  case tscache::RespType::Null:
    std::cout << indent << "(nil)\n";
    break;
  case tscache::RespType::Array:
    if (v.elements.empty())
      std::cout << indent << "(empty array)\n";
    for (std::size_t i = 0; i < v.elements.size(); ++i) {
      std::cout << indent << (i + 1) << ")\n";
      print_reply(v.elements[i], indent + "  ");
    }
    break;
  }
}

} // namespace

int main(int argc, char **argv) {
  std::string host = "127.0.0.1";
  int port = 6390;
  if (argc > 1)
    port = std::stoi(argv[1]);
  if (argc > 2)
    host = argv[2];

  int fd = socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<std::uint16_t>(port));
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    std::cerr << "bad address " << host << "\n";
    return 1;
  }
  if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    std::cerr << "connect failed\n";
    return 1;
  }

  tscache::RespReplyParser parser;
  std::string line;
  while (std::getline(std::cin, line)) {
    if (line == "quit")
      break;
    std::istringstream in(line);
    std::vector<std::string> args;
    for (std::string a; in >> a;)
      args.push_back(a);
    if (args.empty())
      continue;
    const std::string payload = tscache::resp_command(args);
    if (send(fd, payload.data(), payload.size(), 0) <= 0)
      break;

    std::optional<tscache::RespValue> reply;
    char buf[4096];
    while (!(reply = parser.next_reply())) {
      if (parser.malformed()) {
        std::cerr << "malformed reply\n";
        close(fd);
        return 1;
      }
      auto n = recv(fd, buf, sizeof(buf), 0);
      if (n <= 0) {
        close(fd);
        return 0;
      }
      parser.feed(buf, static_cast<std::size_t>(n));
    }
    print_reply(*reply, "");
  }
  close(fd);
  return 0;
}
