// Repository: Mapcycle-enforcer
// Component: Channel Errors
// Purpose: Failure taxonomy shared by the primary and fallback control channels.
// Copyright (c) 2026 RetroVue

#include "mapcycle/channel/ChannelError.hpp"

#include <utility>

namespace mapcycle::channel {

const char* ChannelFailureName(ChannelFailure failure) {
  switch (failure) {
    case ChannelFailure::kTransport:      return "TRANSPORT";
    case ChannelFailure::kTimeout:        return "TIMEOUT";
    case ChannelFailure::kHttpStatus:     return "HTTP_STATUS";
    case ChannelFailure::kRejected:       return "REJECTED";
    case ChannelFailure::kMalformed:      return "MALFORMED";
    case ChannelFailure::kAuthentication: return "AUTHENTICATION";
    case ChannelFailure::kNotConnected:   return "NOT_CONNECTED";
  }
  return "UNKNOWN";
}

ChannelError::ChannelError(std::string channel, std::string operation,
                           ChannelFailure failure, std::string cause)
    : std::runtime_error(channel + " channel " + operation + " failed (" +
                         ChannelFailureName(failure) + "): " + cause),
      channel_(std::move(channel)),
      operation_(std::move(operation)),
      failure_(failure),
      cause_(std::move(cause)) {}

}  // namespace mapcycle::channel
