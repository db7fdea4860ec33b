// Repository: Mapcycle-enforcer
// Component: libcurl HTTP Transport
// Purpose: Persistent-handle HTTP transport with bearer authentication.
// Copyright (c) 2026 RetroVue

#include "mapcycle/channel/CurlHttpTransport.hpp"

#include <utility>

#include <curl/curl.h>

#include "mapcycle/util/Logger.hpp"

namespace mapcycle::channel {

using util::Logger;

namespace {

size_t AppendBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

}  // namespace

CurlHttpTransport::CurlHttpTransport(CurlTransportSettings settings)
    : settings_(std::move(settings)), handle_(curl_easy_init()) {
  if (handle_ == nullptr) {
    Logger::Error("[CurlHttpTransport] curl_easy_init failed");
  }
}

CurlHttpTransport::~CurlHttpTransport() {
  if (handle_ != nullptr) {
    curl_easy_cleanup(static_cast<CURL*>(handle_));
    handle_ = nullptr;
  }
}

HttpResponse CurlHttpTransport::Perform(const HttpRequest& request) {
  std::lock_guard<std::mutex> lock(mutex_);
  HttpResponse response;

  CURL* curl = static_cast<CURL*>(handle_);
  if (curl == nullptr) {
    response.error = "curl init failed";
    return response;
  }

  // Options from the previous request must not leak into this one; the
  // connection cache survives curl_easy_reset.
  curl_easy_reset(curl);

  struct curl_slist* headers = nullptr;
  const std::string auth = "Authorization: Bearer " + settings_.bearer_token;
  headers = curl_slist_append(headers, auth.c_str());
  headers = curl_slist_append(headers, "Accept: application/json");
  if (request.method == HttpMethod::kPost) {
    headers = curl_slist_append(headers, "Content-Type: application/json");
  }

  const long verify = settings_.verify_tls ? 1L : 0L;
  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(settings_.timeout.count()));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(settings_.timeout.count()));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, settings_.verify_tls ? 2L : 0L);
  if (request.method == HttpMethod::kPost) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
  } else {
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  }
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &AppendBody);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

  const CURLcode res = curl_easy_perform(curl);
  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  curl_slist_free_all(headers);

  response.status = status;
  if (res != CURLE_OK) {
    response.error = std::string("curl error: ") + curl_easy_strerror(res);
    response.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
  }
  return response;
}

}  // namespace mapcycle::channel
