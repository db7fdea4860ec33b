// Repository: Mapcycle-enforcer
// Component: TCP Connect
// Purpose: Non-blocking TCP connect with a bounded wait.
// Copyright (c) 2026 RetroVue

#include "mapcycle/channel/TcpConnect.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace mapcycle::channel {

namespace {

int RemainingMs(std::chrono::steady_clock::time_point deadline) {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// 0 on success, else an errno value. ETIMEDOUT when the deadline passes.
int ConnectOne(int fd, const struct addrinfo* ai,
               std::chrono::steady_clock::time_point deadline) {
  if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) return 0;
  if (errno != EINPROGRESS) return errno;

  while (true) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    const int remaining = RemainingMs(deadline);
    if (remaining == 0) return ETIMEDOUT;

    const int ret = ::poll(&pfd, 1, remaining);
    if (ret < 0) {
      if (errno == EINTR) continue;
      return errno;
    }
    if (ret == 0) return ETIMEDOUT;

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) return errno;
    return so_error;
  }
}

}  // namespace

TcpConnectResult TcpConnect(const std::string& host, uint16_t port,
                            std::chrono::milliseconds timeout) {
  TcpConnectResult result;
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo* list = nullptr;
  const std::string service = std::to_string(port);
  const int gai = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &list);
  if (gai != 0) {
    result.error = "resolve " + host + ": " + gai_strerror(gai);
    return result;
  }

  for (const struct addrinfo* ai = list; ai != nullptr; ai = ai->ai_next) {
    const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) {
      result.error = std::string("socket: ") + std::strerror(errno);
      continue;
    }
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
      result.error = std::string("fcntl: ") + std::strerror(errno);
      ::close(fd);
      continue;
    }

    const int err = ConnectOne(fd, ai, deadline);
    if (err == 0) {
      int one = 1;
      ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
      result.fd = fd;
      result.timed_out = false;
      result.error.clear();
      break;
    }

    ::close(fd);
    result.timed_out = (err == ETIMEDOUT);
    result.error = "connect " + host + ":" + service + ": " + std::strerror(err);
    if (RemainingMs(deadline) == 0) {
      result.timed_out = true;
      break;
    }
  }

  ::freeaddrinfo(list);
  return result;
}

}  // namespace mapcycle::channel
