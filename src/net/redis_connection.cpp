#include "tscache/redis_store.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace tscache {
namespace {
void set_err(std::string *err, const std::string &msg) {
  if (err)
    *err = msg;
}

timeval to_timeval(std::uint64_t ms) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(ms / 1000);
  tv.tv_usec = static_cast<suseconds_t>((ms % 1000) * 1000);
  return tv;
}

int connect_with_timeout(const addrinfo *ai, std::uint64_t timeout_ms,
                         std::string *err) {
  int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
  if (fd < 0) {
    set_err(err, std::string("socket: ") + std::strerror(errno));
    return -1;
  }
  const int flags = fcntl(fd, F_GETFL, 0);
  fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
  if (rc < 0 && errno != EINPROGRESS) {
    set_err(err, std::string("connect: ") + std::strerror(errno));
    ::close(fd);
    return -1;
  }
  if (rc < 0) {
    pollfd pfd{fd, POLLOUT, 0};
    rc = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
    if (rc <= 0) {
      set_err(err, rc == 0 ? "connect: timed out"
                           : std::string("poll: ") + std::strerror(errno));
      ::close(fd);
      return -1;
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
    if (so_error != 0) {
      set_err(err, std::string("connect: ") + std::strerror(so_error));
      ::close(fd);
      return -1;
    }
  }
  fcntl(fd, F_SETFL, flags);
  return fd;
}
} // namespace

RedisConnection::~RedisConnection() { close(); }

bool RedisConnection::connect(const std::string &host, int port,
                              std::uint64_t connect_timeout_ms,
                              std::uint64_t io_timeout_ms, std::string *err) {
  close();
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *res = nullptr;
  const std::string port_str = std::to_string(port);
  const int gai = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
  if (gai != 0) {
    set_err(err, std::string("resolve ") + host + ": " + gai_strerror(gai));
    return false;
  }
  for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next) {
    fd_ = connect_with_timeout(ai, connect_timeout_ms, err);
    if (fd_ >= 0)
      break;
  }
  ::freeaddrinfo(res);
  if (fd_ < 0)
    return false;

  const timeval tv = to_timeval(io_timeout_ms);
  setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  int one = 1;
  setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  parser_.reset();
  return true;
}

void RedisConnection::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
  parser_.reset();
}

bool RedisConnection::send_all(const std::string &data, std::string *err) {
  std::size_t off = 0;
  while (off < data.size()) {
    const ssize_t w =
        ::send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
    if (w < 0 && errno == EINTR)
      continue;
    if (w <= 0) {
      set_err(err, w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)
                       ? "send: timed out"
                       : std::string("send: ") + std::strerror(errno));
      return false;
    }
    off += static_cast<std::size_t>(w);
  }
  return true;
}

std::optional<RespValue>
RedisConnection::command(const std::vector<std::string> &args, std::string *err,
                         bool *sent) {
  if (sent)
    *sent = false;
  if (fd_ < 0) {
    set_err(err, "not connected");
    return std::nullopt;
  }
  if (!send_all(resp_command(args), err)) {
    // A partial write may already be on the wire.
    if (sent)
      *sent = true;
    close();
    return std::nullopt;
  }
  if (sent)
    *sent = true;

  char buf[16384];
  while (true) {
    if (auto reply = parser_.next_reply())
      return reply;
    if (parser_.malformed()) {
      set_err(err, "malformed reply");
      close();
      return std::nullopt;
    }
    const ssize_t r = ::recv(fd_, buf, sizeof(buf), 0);
    if (r < 0 && errno == EINTR)
      continue;
    if (r <= 0) {
      if (r == 0)
        set_err(err, "connection closed by server");
      else if (errno == EAGAIN || errno == EWOULDBLOCK)
        set_err(err, "recv: timed out");
      else
        set_err(err, std::string("recv: ") + std::strerror(errno));
      close();
      return std::nullopt;
    }
    parser_.feed(buf, static_cast<std::size_t>(r));
  }
}

} // namespace tscache
