// Repository: Mapcycle-enforcer
// Component: Rotation Channel Interface
// Purpose: Capability interface the reconciler drives; one variant per control path.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_CHANNEL_IROTATION_CHANNEL_HPP_
#define MAPCYCLE_CHANNEL_IROTATION_CHANNEL_HPP_

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace mapcycle::channel {

// Read and mutate the server's rotation queue.
//
// Semantics every implementation follows:
//   ListRotation  returns the queue in server order.
//   RemoveMaps    removes one occurrence (the first) per listed identifier,
//                 processed in list order.
//   AddMaps       appends each identifier to the end of the queue, in order.
//   SetDeadline   bounds every remote operation issued after the call; an
//                 operation that cannot finish by then fails with kTimeout.
//
// Failures throw a ChannelError subclass. Implementations never retry.
class IRotationChannel {
 public:
  virtual ~IRotationChannel() = default;

  // "primary" or "fallback"; used in results and log lines.
  virtual const char* Name() const = 0;

  virtual std::vector<std::string> ListRotation() = 0;
  virtual void RemoveMaps(const std::vector<std::string>& maps) = 0;
  virtual void AddMaps(const std::vector<std::string>& maps) = 0;

  // Channels whose own timeout already bounds a whole batch may ignore it.
  virtual void SetDeadline(std::chrono::steady_clock::time_point) {}
};

// Opens a fresh, connected channel. The returned object closes its
// connection when destroyed. Throws ChannelError when connecting fails.
using RotationChannelFactory = std::function<std::unique_ptr<IRotationChannel>()>;

}  // namespace mapcycle::channel

#endif  // MAPCYCLE_CHANNEL_IROTATION_CHANNEL_HPP_
