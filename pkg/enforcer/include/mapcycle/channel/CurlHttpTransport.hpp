// Repository: Mapcycle-enforcer
// Component: libcurl HTTP Transport
// Purpose: Persistent-handle HTTP transport with bearer authentication.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_CHANNEL_CURL_HTTP_TRANSPORT_HPP_
#define MAPCYCLE_CHANNEL_CURL_HTTP_TRANSPORT_HPP_

#include <chrono>
#include <mutex>
#include <string>

#include "mapcycle/channel/IHttpTransport.hpp"

namespace mapcycle::channel {

struct CurlTransportSettings {
  std::string bearer_token;
  std::chrono::milliseconds timeout{10000};
  bool verify_tls = false;
};

// Reuses one CURL easy handle across requests so the connection to the
// management API stays open between ticks. curl_global_init must have run
// before construction (the service main does it).
class CurlHttpTransport : public IHttpTransport {
 public:
  explicit CurlHttpTransport(CurlTransportSettings settings);
  ~CurlHttpTransport() override;

  CurlHttpTransport(const CurlHttpTransport&) = delete;
  CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

  HttpResponse Perform(const HttpRequest& request) override;

 private:
  CurlTransportSettings settings_;
  std::mutex mutex_;
  void* handle_ = nullptr;  // CURL*
};

}  // namespace mapcycle::channel

#endif  // MAPCYCLE_CHANNEL_CURL_HTTP_TRANSPORT_HPP_
