// Repository: Mapcycle-enforcer
// Component: HTTP Transport Interface
// Purpose: Request/response seam between the primary channel and libcurl.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_CHANNEL_IHTTP_TRANSPORT_HPP_
#define MAPCYCLE_CHANNEL_IHTTP_TRANSPORT_HPP_

#include <string>

namespace mapcycle::channel {

enum class HttpMethod { kGet, kPost };

struct HttpRequest {
  HttpMethod method = HttpMethod::kGet;
  std::string url;
  std::string body;  // JSON; POST only
};

struct HttpResponse {
  long status = 0;
  std::string body;
  std::string error;       // transport-level failure; empty when a response arrived
  bool timed_out = false;

  bool transport_ok() const { return error.empty(); }
};

// Performs one request. Never throws; transport problems are reported in
// HttpResponse::error.
class IHttpTransport {
 public:
  virtual ~IHttpTransport() = default;
  virtual HttpResponse Perform(const HttpRequest& request) = 0;
};

}  // namespace mapcycle::channel

#endif  // MAPCYCLE_CHANNEL_IHTTP_TRANSPORT_HPP_
