// Repository: Mapcycle-enforcer
// Component: Fallback Rotation Channel
// Purpose: IRotationChannel over an authenticated remote-console session.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_CHANNEL_RCON_ROTATION_CHANNEL_HPP_
#define MAPCYCLE_CHANNEL_RCON_ROTATION_CHANNEL_HPP_

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "mapcycle/channel/IRotationChannel.hpp"
#include "mapcycle/channel/RconClient.hpp"

namespace mapcycle::channel {

// Owns one RconClient for the duration of a reconciliation attempt. The
// session closes when the channel is destroyed.
class RconRotationChannel : public IRotationChannel {
 public:
  // Takes a connected client.
  explicit RconRotationChannel(std::unique_ptr<RconClient> client);
  ~RconRotationChannel() override;

  const char* Name() const override { return "fallback"; }

  std::vector<std::string> ListRotation() override;
  void RemoveMaps(const std::vector<std::string>& maps) override;
  void AddMaps(const std::vector<std::string>& maps) override;
  void SetDeadline(std::chrono::steady_clock::time_point deadline) override;

 private:
  std::unique_ptr<RconClient> client_;
};

// Factory handed to the reconciler: each call opens and authenticates a new
// session.
RotationChannelFactory MakeRconChannelFactory(RconSettings settings);

}  // namespace mapcycle::channel

#endif  // MAPCYCLE_CHANNEL_RCON_ROTATION_CHANNEL_HPP_
