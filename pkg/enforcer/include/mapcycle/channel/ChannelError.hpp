// Repository: Mapcycle-enforcer
// Component: Channel Errors
// Purpose: Failure taxonomy shared by the primary and fallback control channels.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_CHANNEL_CHANNEL_ERROR_HPP_
#define MAPCYCLE_CHANNEL_CHANNEL_ERROR_HPP_

#include <stdexcept>
#include <string>
#include <utility>

namespace mapcycle::channel {

enum class ChannelFailure {
  kTransport,       // connect/send/receive failed (transient)
  kTimeout,         // operation exceeded its timeout (transient)
  kHttpStatus,      // non-success HTTP status
  kRejected,        // server answered but refused the operation
  kMalformed,       // response could not be parsed
  kAuthentication,  // credentials refused
  kNotConnected,    // operation on a closed connection
};

const char* ChannelFailureName(ChannelFailure failure);

// Transient network failures. The reconciler treats them like any other
// failure of the same channel; the flag only feeds log lines.
inline bool IsTransient(ChannelFailure failure) {
  return failure == ChannelFailure::kTransport || failure == ChannelFailure::kTimeout;
}

// Base class. Carries which channel failed, which operation was attempted,
// and the underlying cause.
class ChannelError : public std::runtime_error {
 public:
  ChannelError(std::string channel, std::string operation, ChannelFailure failure,
               std::string cause);

  const std::string& channel() const { return channel_; }
  const std::string& operation() const { return operation_; }
  ChannelFailure failure() const { return failure_; }
  const std::string& cause() const { return cause_; }
  bool transient() const { return IsTransient(failure_); }

 private:
  std::string channel_;
  std::string operation_;
  ChannelFailure failure_;
  std::string cause_;
};

// Raised by the HTTP API client. Triggers failover.
class PrimaryChannelError : public ChannelError {
 public:
  PrimaryChannelError(std::string operation, ChannelFailure failure, std::string cause)
      : ChannelError("primary", std::move(operation), failure, std::move(cause)) {}
};

// Raised by the remote-console client. Terminal for the tick.
class FallbackChannelError : public ChannelError {
 public:
  FallbackChannelError(std::string operation, ChannelFailure failure, std::string cause)
      : ChannelError("fallback", std::move(operation), failure, std::move(cause)) {}
};

}  // namespace mapcycle::channel

#endif  // MAPCYCLE_CHANNEL_CHANNEL_ERROR_HPP_
