// Repository: Mapcycle-enforcer
// Component: TCP Connect
// Purpose: Non-blocking TCP connect with a bounded wait.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_CHANNEL_TCP_CONNECT_HPP_
#define MAPCYCLE_CHANNEL_TCP_CONNECT_HPP_

#include <chrono>
#include <cstdint>
#include <string>

namespace mapcycle::channel {

struct TcpConnectResult {
  int fd = -1;             // connected socket, O_NONBLOCK set; caller closes
  bool timed_out = false;
  std::string error;       // empty on success

  bool ok() const { return fd >= 0; }
};

// Resolves `host` and tries each address in turn until one connects or the
// overall timeout elapses. Never throws.
TcpConnectResult TcpConnect(const std::string& host, uint16_t port,
                            std::chrono::milliseconds timeout);

}  // namespace mapcycle::channel

#endif  // MAPCYCLE_CHANNEL_TCP_CONNECT_HPP_
