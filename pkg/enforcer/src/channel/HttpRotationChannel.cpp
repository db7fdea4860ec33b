// Repository: Mapcycle-enforcer
// Component: Primary Rotation Channel
// Purpose: IRotationChannel over the server management HTTP API.
// Copyright (c) 2026 RetroVue

#include "mapcycle/channel/HttpRotationChannel.hpp"

#include <sstream>
#include <utility>

#include <json/json.h>

#include "mapcycle/channel/ChannelError.hpp"
#include "mapcycle/util/Logger.hpp"

namespace mapcycle::channel {

using util::Logger;

namespace {

constexpr size_t kMaxErrorSnippet = 200;

std::string Snippet(const std::string& body) {
  if (body.size() <= kMaxErrorSnippet) return body;
  return body.substr(0, kMaxErrorSnippet) + "...";
}

// Parses the {"result": ..., "failed": bool, "error": ...} envelope and
// returns "result". jsoncpp throws on some inputs (nesting past its stack
// limit) instead of reporting them; those are malformed too.
Json::Value ParseEnvelope(const std::string& operation, const std::string& body) {
  Json::Value root;
  Json::CharReaderBuilder builder;
  std::string errs;
  std::istringstream stream(body);
  bool parsed = false;
  try {
    parsed = Json::parseFromStream(builder, stream, &root, &errs);
  } catch (const Json::Exception& e) {
    throw PrimaryChannelError(operation, ChannelFailure::kMalformed,
                              std::string("response is not JSON: ") + e.what());
  }
  if (!parsed) {
    throw PrimaryChannelError(operation, ChannelFailure::kMalformed,
                              "response is not JSON: " + errs);
  }
  if (!root.isObject()) {
    throw PrimaryChannelError(operation, ChannelFailure::kMalformed,
                              "response is not a JSON object");
  }
  const Json::Value& failed = root["failed"];
  if (failed.isBool() && failed.asBool()) {
    std::string reason = "server reported failure";
    const Json::Value& error = root["error"];
    if (error.isString() && !error.asString().empty()) reason += ": " + error.asString();
    throw PrimaryChannelError(operation, ChannelFailure::kRejected, reason);
  }
  return root["result"];
}

std::string TrimSlashes(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && s[begin] == '/') ++begin;
  while (end > begin && s[end - 1] == '/') --end;
  return s.substr(begin, end - begin);
}

}  // namespace

HttpRotationChannel::HttpRotationChannel(std::string base_url, std::string api_root,
                                         std::shared_ptr<IHttpTransport> transport)
    : base_url_(std::move(base_url)),
      api_root_(std::move(api_root)),
      transport_(std::move(transport)) {}

std::string HttpRotationChannel::EndpointUrl(const std::string& endpoint) const {
  std::string url = base_url_;
  while (!url.empty() && url.back() == '/') url.pop_back();
  const std::string root = TrimSlashes(api_root_);
  if (!root.empty()) url += "/" + root;
  url += "/" + TrimSlashes(endpoint);
  return url;
}

std::string HttpRotationChannel::Call(const std::string& operation, HttpMethod method,
                                      const std::string& endpoint, const std::string& body) {
  HttpRequest request;
  request.method = method;
  request.url = EndpointUrl(endpoint);
  request.body = body;

  Logger::Debug("[HttpRotationChannel] " +
                std::string(method == HttpMethod::kGet ? "GET " : "POST ") + request.url +
                (body.empty() ? "" : " " + body));

  HttpResponse response = transport_->Perform(request);
  if (!response.transport_ok()) {
    throw PrimaryChannelError(
        operation, response.timed_out ? ChannelFailure::kTimeout : ChannelFailure::kTransport,
        response.error);
  }
  if (response.status == 401 || response.status == 403) {
    throw PrimaryChannelError(operation, ChannelFailure::kAuthentication,
                              "HTTP " + std::to_string(response.status));
  }
  if (response.status < 200 || response.status >= 300) {
    throw PrimaryChannelError(operation, ChannelFailure::kHttpStatus,
                              "HTTP " + std::to_string(response.status) + ": " +
                                  Snippet(response.body));
  }
  return std::move(response.body);
}

std::vector<std::string> HttpRotationChannel::ListRotation() {
  const std::string body = Call(kGetRotationEndpoint, HttpMethod::kGet, kGetRotationEndpoint, "");
  const Json::Value result = ParseEnvelope(kGetRotationEndpoint, body);
  if (!result.isArray()) {
    throw PrimaryChannelError(kGetRotationEndpoint, ChannelFailure::kMalformed,
                              "'result' is not an array");
  }

  std::vector<std::string> maps;
  maps.reserve(result.size());
  try {
    for (const auto& entry : result) {
      if (entry.isString()) {
        maps.push_back(entry.asString());
      } else if (entry.isObject() && entry["id"].isString()) {
        maps.push_back(entry["id"].asString());
      } else {
        throw PrimaryChannelError(kGetRotationEndpoint, ChannelFailure::kMalformed,
                                  "rotation entry has no map identifier");
      }
    }
  } catch (const Json::Exception& e) {
    throw PrimaryChannelError(kGetRotationEndpoint, ChannelFailure::kMalformed, e.what());
  }
  return maps;
}

void HttpRotationChannel::RemoveMaps(const std::vector<std::string>& maps) {
  PostMapNames(kRemoveMapsEndpoint, maps);
}

void HttpRotationChannel::AddMaps(const std::vector<std::string>& maps) {
  PostMapNames(kAddMapsEndpoint, maps);
}

void HttpRotationChannel::PostMapNames(const std::string& endpoint,
                                       const std::vector<std::string>& maps) {
  if (maps.empty()) return;

  Json::Value payload(Json::objectValue);
  Json::Value& names = payload["map_names"];
  names = Json::Value(Json::arrayValue);
  for (const auto& map : maps) names.append(map);

  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";
  const std::string body = Call(endpoint, HttpMethod::kPost, endpoint,
                                Json::writeString(writer, payload));
  ParseEnvelope(endpoint, body);
}

}  // namespace mapcycle::channel
