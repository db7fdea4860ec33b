// Repository: Mapcycle-enforcer
// Component: Remote Console Client
// Purpose: Fallback channel client speaking the framed remote-console protocol.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_CHANNEL_RCON_CLIENT_HPP_
#define MAPCYCLE_CHANNEL_RCON_CLIENT_HPP_

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "mapcycle/channel/RconFrameCodec.hpp"

namespace mapcycle::channel {

struct RconSettings {
  std::string host;
  uint16_t port = 0;
  std::string password;
  std::chrono::milliseconds timeout{5000};  // per operation
};

constexpr char kRconSuccessReply[] = "SUCCESS";

// One authenticated TCP session. Not thread-safe; used by one tick at a time.
//
// Conversation:
//   Connect()        TCP connect, then "login <password>" -> "SUCCESS"
//   ListRotation()   "rotlist"      -> newline-separated identifiers
//   AddMap(m)        "rotadd <m>"   -> "SUCCESS"
//   RemoveMap(m)     "rotdel <m>"   -> "SUCCESS"
//
// Every failure throws FallbackChannelError. The destructor closes the
// socket.
class RconClient {
 public:
  explicit RconClient(RconSettings settings);
  ~RconClient();

  RconClient(const RconClient&) = delete;
  RconClient& operator=(const RconClient&) = delete;

  void Connect();
  void Close();
  bool IsConnected() const { return fd_ >= 0; }

  std::vector<std::string> ListRotation();
  void AddMap(const std::string& map);
  void RemoveMap(const std::string& map);

  // Caps every later operation at min(now + timeout, deadline).
  void SetOperationDeadline(std::chrono::steady_clock::time_point deadline) {
    operation_deadline_ = deadline;
  }

 private:
  // Sends one command frame and returns the reply body (trailing whitespace
  // trimmed).
  std::string Execute(const std::string& operation, const std::string& command);

  void SendAll(const std::string& operation, const std::vector<uint8_t>& bytes,
               std::chrono::steady_clock::time_point deadline);
  RconFrame ReceiveFrame(const std::string& operation,
                         std::chrono::steady_clock::time_point deadline);
  void ExpectSuccess(const std::string& operation, const std::string& command);

  RconSettings settings_;
  int fd_ = -1;
  uint32_t next_request_id_ = 1;
  RconFrameDecoder decoder_;
  std::chrono::steady_clock::time_point operation_deadline_ =
      std::chrono::steady_clock::time_point::max();
};

}  // namespace mapcycle::channel

#endif  // MAPCYCLE_CHANNEL_RCON_CLIENT_HPP_
