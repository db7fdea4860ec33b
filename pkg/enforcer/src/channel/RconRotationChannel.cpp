// Repository: Mapcycle-enforcer
// Component: Fallback Rotation Channel
// Purpose: IRotationChannel over an authenticated remote-console session.
// Copyright (c) 2026 RetroVue

#include "mapcycle/channel/RconRotationChannel.hpp"

#include <utility>

#include "mapcycle/util/Logger.hpp"

namespace mapcycle::channel {

using util::Logger;

RconRotationChannel::RconRotationChannel(std::unique_ptr<RconClient> client)
    : client_(std::move(client)) {}

RconRotationChannel::~RconRotationChannel() {
  if (client_) client_->Close();
}

std::vector<std::string> RconRotationChannel::ListRotation() {
  return client_->ListRotation();
}

void RconRotationChannel::RemoveMaps(const std::vector<std::string>& maps) {
  for (const auto& map : maps) {
    Logger::Debug("[RconRotationChannel] rotdel " + map);
    client_->RemoveMap(map);
  }
}

void RconRotationChannel::AddMaps(const std::vector<std::string>& maps) {
  for (const auto& map : maps) {
    Logger::Debug("[RconRotationChannel] rotadd " + map);
    client_->AddMap(map);
  }
}

void RconRotationChannel::SetDeadline(std::chrono::steady_clock::time_point deadline) {
  client_->SetOperationDeadline(deadline);
}

RotationChannelFactory MakeRconChannelFactory(RconSettings settings) {
  return [settings]() -> std::unique_ptr<IRotationChannel> {
    auto client = std::make_unique<RconClient>(settings);
    client->Connect();
    return std::make_unique<RconRotationChannel>(std::move(client));
  };
}

}  // namespace mapcycle::channel
