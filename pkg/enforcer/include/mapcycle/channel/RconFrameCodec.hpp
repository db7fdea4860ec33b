// Repository: Mapcycle-enforcer
// Component: Remote Console Frame Codec
// Purpose: XOR-obfuscated length-prefixed framing for the fallback console protocol.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_CHANNEL_RCON_FRAME_CODEC_HPP_
#define MAPCYCLE_CHANNEL_RCON_FRAME_CODEC_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mapcycle::channel {

// Wire frame:
//
//   +-------------------+-------------------+------------------------+
//   | request_id  (u32) | body_length (u32) | body (body_length)     |
//   +-------------------+-------------------+------------------------+
//
// Both header fields are little-endian. The body is XORed byte-for-byte
// with the password, cycling through its bytes; the key offset restarts at
// zero for each frame. The header is never obfuscated.
constexpr size_t kRconHeaderSize = 8;

// Larger bodies are treated as a corrupt stream.
constexpr uint32_t kRconMaxBodySize = 1u << 20;

struct RconFrame {
  uint32_t request_id = 0;
  std::string body;  // plaintext
};

// In-place symmetric transform. Empty key leaves data unchanged.
void XorWithKey(std::string& data, const std::string& key);

// Header plus obfuscated body, ready for send().
std::vector<uint8_t> EncodeRconFrame(const RconFrame& frame, const std::string& key);

// Incremental decoder. Feed whatever recv() returned; complete frames come
// out of Next() in arrival order.
class RconFrameDecoder {
 public:
  explicit RconFrameDecoder(std::string key);

  void Feed(const uint8_t* data, size_t size);

  // Next complete frame, or nullopt when more bytes are needed.
  // Sets error() and returns nullopt once a header declares an oversize body;
  // the decoder is unusable afterwards.
  std::optional<RconFrame> Next();

  bool has_error() const { return !error_.empty(); }
  const std::string& error() const { return error_; }

  size_t buffered() const { return buffer_.size(); }

 private:
  std::string key_;
  std::vector<uint8_t> buffer_;
  std::string error_;
};

}  // namespace mapcycle::channel

#endif  // MAPCYCLE_CHANNEL_RCON_FRAME_CODEC_HPP_
