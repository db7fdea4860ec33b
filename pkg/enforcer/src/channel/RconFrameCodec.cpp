// Repository: Mapcycle-enforcer
// Component: Remote Console Frame Codec
// Purpose: XOR-obfuscated length-prefixed framing for the fallback console protocol.
// Copyright (c) 2026 RetroVue

#include "mapcycle/channel/RconFrameCodec.hpp"

#include <utility>

namespace mapcycle::channel {

namespace {

void PutU32Le(std::vector<uint8_t>& out, uint32_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

uint32_t GetU32Le(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

}  // namespace

void XorWithKey(std::string& data, const std::string& key) {
  if (key.empty()) return;
  for (size_t i = 0; i < data.size(); ++i) {
    data[i] = static_cast<char>(static_cast<uint8_t>(data[i]) ^
                                static_cast<uint8_t>(key[i % key.size()]));
  }
}

std::vector<uint8_t> EncodeRconFrame(const RconFrame& frame, const std::string& key) {
  std::string body = frame.body;
  XorWithKey(body, key);

  std::vector<uint8_t> out;
  out.reserve(kRconHeaderSize + body.size());
  PutU32Le(out, frame.request_id);
  PutU32Le(out, static_cast<uint32_t>(body.size()));
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

RconFrameDecoder::RconFrameDecoder(std::string key) : key_(std::move(key)) {}

void RconFrameDecoder::Feed(const uint8_t* data, size_t size) {
  if (has_error() || size == 0) return;
  buffer_.insert(buffer_.end(), data, data + size);
}

std::optional<RconFrame> RconFrameDecoder::Next() {
  if (has_error() || buffer_.size() < kRconHeaderSize) return std::nullopt;

  const uint32_t request_id = GetU32Le(buffer_.data());
  const uint32_t body_length = GetU32Le(buffer_.data() + 4);
  if (body_length > kRconMaxBodySize) {
    error_ = "frame body length " + std::to_string(body_length) + " exceeds limit";
    buffer_.clear();
    return std::nullopt;
  }
  if (buffer_.size() < kRconHeaderSize + body_length) return std::nullopt;

  RconFrame frame;
  frame.request_id = request_id;
  frame.body.assign(reinterpret_cast<const char*>(buffer_.data() + kRconHeaderSize),
                    body_length);
  XorWithKey(frame.body, key_);
  buffer_.erase(buffer_.begin(),
                buffer_.begin() + static_cast<std::ptrdiff_t>(kRconHeaderSize + body_length));
  return frame;
}

}  // namespace mapcycle::channel
