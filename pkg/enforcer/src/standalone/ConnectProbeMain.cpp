// Repository: Mapcycle-enforcer
// Component: Connect Probe
// Purpose: Check that the fallback console port accepts TCP connections.
// Copyright (c) 2026 RetroVue
//
// This binary is for diagnostics only. It opens a TCP connection and closes
// it again; it never sends a byte.

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include <unistd.h>

#include "mapcycle/channel/TcpConnect.hpp"

namespace {

constexpr uint16_t kDefaultPort = 7779;
constexpr auto kConnectTimeout = std::chrono::seconds(10);

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " <host> [port]\n"
            << "\n"
            << "Attempts a TCP connection with a " << kConnectTimeout.count()
            << " s timeout and prints SUCCESS or FAIL.\n"
            << "Default port: " << kDefaultPort << "\n";
}

bool ParsePort(const std::string& text, uint16_t* port) {
  char* end = nullptr;
  const long value = std::strtol(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0' || value < 1 || value > 65535) return false;
  *port = static_cast<uint16_t>(value);
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2 || argc > 3) {
    PrintUsage(argv[0]);
    return 2;
  }
  const std::string arg1 = argv[1];
  if (arg1 == "--help" || arg1 == "-h") {
    PrintUsage(argv[0]);
    return 0;
  }

  uint16_t port = kDefaultPort;
  if (argc == 3 && !ParsePort(argv[2], &port)) {
    std::cerr << "Error: invalid port '" << argv[2] << "'\n\n";
    PrintUsage(argv[0]);
    return 2;
  }

  std::cout << "Connecting to " << arg1 << ":" << port << " ..." << std::endl;
  auto result = mapcycle::channel::TcpConnect(arg1, port, kConnectTimeout);
  if (!result.ok()) {
    std::cout << "FAIL: " << result.error << (result.timed_out ? " (timed out)" : "")
              << std::endl;
    return 1;
  }
  ::close(result.fd);
  std::cout << "SUCCESS: " << arg1 << ":" << port << " accepts connections" << std::endl;
  return 0;
}
