// Repository: Mapcycle-enforcer
// Component: Remote Console Client
// Purpose: Fallback channel client speaking the framed remote-console protocol.
// Copyright (c) 2026 RetroVue

#include "mapcycle/channel/RconClient.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "mapcycle/channel/ChannelError.hpp"
#include "mapcycle/channel/TcpConnect.hpp"
#include "mapcycle/util/Logger.hpp"

namespace mapcycle::channel {

using util::Logger;

namespace {

constexpr size_t kRecvChunk = 4096;

int RemainingMs(std::chrono::steady_clock::time_point deadline) {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

std::string TrimRight(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' ||
                        s.back() == '\t' || s.back() == '\0')) {
    s.pop_back();
  }
  return s;
}

std::string Trim(const std::string& s) {
  size_t begin = 0;
  while (begin < s.size() && (s[begin] == ' ' || s[begin] == '\t')) ++begin;
  return TrimRight(s.substr(begin));
}

void CheckMapIdentifier(const std::string& operation, const std::string& map) {
  if (map.empty()) {
    throw FallbackChannelError(operation, ChannelFailure::kRejected, "empty map identifier");
  }
  for (char c : map) {
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      throw FallbackChannelError(operation, ChannelFailure::kRejected,
                                 "map identifier '" + map + "' contains whitespace");
    }
  }
}

}  // namespace

RconClient::RconClient(RconSettings settings)
    : settings_(std::move(settings)), decoder_(settings_.password) {}

RconClient::~RconClient() { Close(); }

void RconClient::Connect() {
  if (IsConnected()) return;

  auto result = TcpConnect(settings_.host, settings_.port, settings_.timeout);
  if (!result.ok()) {
    throw FallbackChannelError(
        "connect", result.timed_out ? ChannelFailure::kTimeout : ChannelFailure::kTransport,
        result.error);
  }
  fd_ = result.fd;
  decoder_ = RconFrameDecoder(settings_.password);
  Logger::Debug("[RconClient] Connected to " + settings_.host + ":" +
                std::to_string(settings_.port));

  const std::string reply = Execute("login", "login " + settings_.password);
  if (reply != kRconSuccessReply) {
    Close();
    throw FallbackChannelError("login", ChannelFailure::kAuthentication,
                               "server answered '" + reply + "'");
  }
  Logger::Debug("[RconClient] Authenticated");
}

void RconClient::Close() {
  if (fd_ < 0) return;
  ::shutdown(fd_, SHUT_RDWR);
  ::close(fd_);
  fd_ = -1;
  Logger::Debug("[RconClient] Connection closed");
}

std::vector<std::string> RconClient::ListRotation() {
  const std::string reply = Execute("rotlist", "rotlist");
  if (reply == "FAIL") {
    throw FallbackChannelError("rotlist", ChannelFailure::kRejected, "server answered 'FAIL'");
  }

  std::vector<std::string> maps;
  size_t start = 0;
  while (start <= reply.size()) {
    size_t end = reply.find('\n', start);
    if (end == std::string::npos) end = reply.size();
    std::string line = Trim(reply.substr(start, end - start));
    if (!line.empty()) maps.push_back(std::move(line));
    start = end + 1;
  }
  return maps;
}

void RconClient::AddMap(const std::string& map) {
  CheckMapIdentifier("rotadd", map);
  ExpectSuccess("rotadd", "rotadd " + map);
}

void RconClient::RemoveMap(const std::string& map) {
  CheckMapIdentifier("rotdel", map);
  ExpectSuccess("rotdel", "rotdel " + map);
}

void RconClient::ExpectSuccess(const std::string& operation, const std::string& command) {
  const std::string reply = Execute(operation, command);
  if (reply != kRconSuccessReply) {
    throw FallbackChannelError(operation, ChannelFailure::kRejected,
                               "server answered '" + reply + "'");
  }
}

std::string RconClient::Execute(const std::string& operation, const std::string& command) {
  if (!IsConnected()) {
    throw FallbackChannelError(operation, ChannelFailure::kNotConnected, "not connected");
  }

  const auto now = std::chrono::steady_clock::now();
  if (now >= operation_deadline_) {
    throw FallbackChannelError(operation, ChannelFailure::kTimeout,
                               "operation deadline reached");
  }
  auto deadline = now + settings_.timeout;
  if (operation_deadline_ < deadline) deadline = operation_deadline_;
  const uint32_t request_id = next_request_id_++;

  SendAll(operation, EncodeRconFrame(RconFrame{request_id, command}, settings_.password),
          deadline);
  RconFrame reply = ReceiveFrame(operation, deadline);
  if (reply.request_id != request_id) {
    throw FallbackChannelError(operation, ChannelFailure::kMalformed,
                               "reply id " + std::to_string(reply.request_id) +
                                   " does not match request id " +
                                   std::to_string(request_id));
  }
  return TrimRight(std::move(reply.body));
}

void RconClient::SendAll(const std::string& operation, const std::vector<uint8_t>& bytes,
                         std::chrono::steady_clock::time_point deadline) {
  const uint8_t* ptr = bytes.data();
  size_t remaining = bytes.size();

  while (remaining > 0) {
    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    const int wait_ms = RemainingMs(deadline);
    if (wait_ms == 0) {
      throw FallbackChannelError(operation, ChannelFailure::kTimeout, "send timed out");
    }

    const int poll_ret = ::poll(&pfd, 1, wait_ms);
    if (poll_ret < 0) {
      if (errno == EINTR) continue;
      throw FallbackChannelError(operation, ChannelFailure::kTransport,
                                 std::string("poll: ") + std::strerror(errno));
    }
    if (poll_ret == 0) {
      throw FallbackChannelError(operation, ChannelFailure::kTimeout, "send timed out");
    }

    const ssize_t n = ::send(fd_, ptr, remaining, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
      throw FallbackChannelError(operation, ChannelFailure::kTransport,
                                 std::string("send: ") + std::strerror(errno));
    }
    ptr += n;
    remaining -= static_cast<size_t>(n);
  }
}

RconFrame RconClient::ReceiveFrame(const std::string& operation,
                                   std::chrono::steady_clock::time_point deadline) {
  uint8_t chunk[kRecvChunk];

  while (true) {
    auto frame = decoder_.Next();
    if (frame.has_value()) return std::move(*frame);
    if (decoder_.has_error()) {
      throw FallbackChannelError(operation, ChannelFailure::kMalformed, decoder_.error());
    }

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    const int wait_ms = RemainingMs(deadline);
    if (wait_ms == 0) {
      throw FallbackChannelError(operation, ChannelFailure::kTimeout, "reply timed out");
    }

    const int poll_ret = ::poll(&pfd, 1, wait_ms);
    if (poll_ret < 0) {
      if (errno == EINTR) continue;
      throw FallbackChannelError(operation, ChannelFailure::kTransport,
                                 std::string("poll: ") + std::strerror(errno));
    }
    if (poll_ret == 0) {
      throw FallbackChannelError(operation, ChannelFailure::kTimeout, "reply timed out");
    }

    const ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
      throw FallbackChannelError(operation, ChannelFailure::kTransport,
                                 std::string("recv: ") + std::strerror(errno));
    }
    if (n == 0) {
      throw FallbackChannelError(operation, ChannelFailure::kTransport,
                                 "connection closed by peer");
    }
    decoder_.Feed(chunk, static_cast<size_t>(n));
  }
}

}  // namespace mapcycle::channel
