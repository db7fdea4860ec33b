// Repository: Mapcycle-enforcer
// Component: Primary Rotation Channel
// Purpose: IRotationChannel over the server management HTTP API.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_CHANNEL_HTTP_ROTATION_CHANNEL_HPP_
#define MAPCYCLE_CHANNEL_HTTP_ROTATION_CHANNEL_HPP_

#include <memory>
#include <string>
#include <vector>

#include "mapcycle/channel/IHttpTransport.hpp"
#include "mapcycle/channel/IRotationChannel.hpp"

namespace mapcycle::channel {

constexpr char kDefaultApiRoot[] = "/api/";

constexpr char kGetRotationEndpoint[] = "get_map_rotation";
constexpr char kAddMapsEndpoint[] = "add_maps_to_rotation";
constexpr char kRemoveMapsEndpoint[] = "remove_maps_from_rotation";

// Endpoints (relative to base_url + api_root):
//   GET  get_map_rotation            -> {"result": [...], "failed": false}
//   POST remove_maps_from_rotation   {"map_names": [...]}
//   POST add_maps_to_rotation        {"map_names": [...]}
//
// Listing entries are either identifier strings or objects carrying the
// identifier under "id". Any transport error, non-2xx status, "failed": true
// or unparsable body throws PrimaryChannelError.
class HttpRotationChannel : public IRotationChannel {
 public:
  HttpRotationChannel(std::string base_url, std::string api_root,
                      std::shared_ptr<IHttpTransport> transport);

  const char* Name() const override { return "primary"; }

  std::vector<std::string> ListRotation() override;
  void RemoveMaps(const std::vector<std::string>& maps) override;
  void AddMaps(const std::vector<std::string>& maps) override;

  // base_url + api_root + endpoint with exactly one '/' at each seam.
  std::string EndpointUrl(const std::string& endpoint) const;

 private:
  // Performs the request and returns the body of a 2xx response.
  std::string Call(const std::string& operation, HttpMethod method,
                   const std::string& endpoint, const std::string& body);
  void PostMapNames(const std::string& endpoint, const std::vector<std::string>& maps);

  std::string base_url_;
  std::string api_root_;
  std::shared_ptr<IHttpTransport> transport_;
};

}  // namespace mapcycle::channel

#endif  // MAPCYCLE_CHANNEL_HTTP_ROTATION_CHANNEL_HPP_
