// Repository: Mapcycle-enforcer
// Component: Enforcer Service Entry Point
// Purpose: Load configuration, wire channels and run the enforcement loop until signalled.
// Copyright (c) 2026 RetroVue
//
// EXIT CODES:
//   0        --once tick succeeded
//   1        --once tick failed, or a startup step other than configuration failed
//   2        configuration error (environment, config file, schedule document)
//   128 + N  stopped by signal N (SIGINT, SIGTERM)

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <curl/curl.h>

#include "control/EnforcerControlService.h"
#include "mapcycle/channel/CurlHttpTransport.hpp"
#include "mapcycle/channel/HttpRotationChannel.hpp"
#include "mapcycle/channel/RconRotationChannel.hpp"
#include "mapcycle/reconcile/Reconciler.hpp"
#include "mapcycle/runtime/EnforcementLoop.hpp"
#include "mapcycle/runtime/EnforcerConfig.hpp"
#include "mapcycle/runtime/ZonedClock.hpp"
#include "mapcycle/schedule/ScheduleDocumentLoader.hpp"
#include "mapcycle/util/ConfigError.hpp"
#include "mapcycle/util/Logger.hpp"

namespace {

using mapcycle::util::ConfigError;
using mapcycle::util::Logger;

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitConfigError = 2;
constexpr auto kSignalPollInterval = std::chrono::milliseconds(200);

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<int> g_termination_signal{0};

void SignalHandler(int signo) {
  if (signo == SIGINT || signo == SIGTERM) {
    g_termination_signal.store(signo, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  bool once = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Keeps the game server's map rotation in line with the weekly schedule.\n"
            << "Settings come from the environment (and CONFIG_PATH, when set).\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --once     Run a single enforcement tick and exit (0 = success, 1 = failure)\n"
            << "  --help     Show this help message\n"
            << "\n"
            << "REQUIRED ENVIRONMENT:\n"
            << "  CRCON_HTTP_BASE_URL, CRCON_HTTP_BEARER_TOKEN\n"
            << "\n"
            << "OPTIONAL ENVIRONMENT:\n"
            << "  WEEKLY_ROTATION_PATH (default ./weekly_rotation.json), TIMEZONE (default UTC),\n"
            << "  LOG_LEVEL, ROTATION_NAME, ROTATION_CYCLE_ANCHOR, CRCON_HTTP_API_ROOT,\n"
            << "  CRCON_HTTP_TIMEOUT, CRCON_HTTP_VERIFY, RCON_HOST, RCON_PORT, RCON_PASSWORD,\n"
            << "  RCON_TIMEOUT, ENFORCE_INTERVAL_SECONDS, TICK_TIMEOUT_SECONDS,\n"
            << "  FOLLOW_BLOCK_TRANSITIONS, CONTROL_LISTEN_ADDRESS, CONFIG_PATH\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--once") {
      args.once = true;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }
  args.valid = true;
  return args;
}

// curl_global_init/cleanup bracket for the process lifetime.
class CurlGlobalScope {
 public:
  CurlGlobalScope() : ok_(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK) {}
  ~CurlGlobalScope() {
    if (ok_) curl_global_cleanup();
  }
  bool ok() const { return ok_; }

 private:
  bool ok_;
};

}  // namespace

int main(int argc, char* argv[]) {
  using namespace mapcycle;

  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return kExitOk;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return kExitConfigError;
  }

  // ===========================================================================
  // Configuration
  // ===========================================================================
  runtime::EnforcerConfig config;
  std::shared_ptr<const schedule::ScheduleDocument> document;
  try {
    config = runtime::LoadEnforcerConfig(runtime::ProcessEnvironment());
    Logger::SetLevel(config.log_level);
    runtime::ApplyProcessTimeZone(config.timezone);
    document = std::make_shared<const schedule::ScheduleDocument>(
        schedule::ScheduleDocumentLoader::LoadFile(config.schedule_path));
  } catch (const ConfigError& e) {
    Logger::Error(std::string("[Enforcer] Configuration error: ") + e.what());
    return kExitConfigError;
  }

  Logger::Info("[Enforcer] Configuration:\n" + config.Describe());
  if (config.resolver.forced_rotation.has_value() && !document->UsesExplicitSchedule() &&
      !document->FindRotation(*config.resolver.forced_rotation).has_value()) {
    Logger::Warn("[Enforcer] ROTATION_NAME '" + *config.resolver.forced_rotation +
                 "' names no rotation in " + config.schedule_path +
                 "; every tick will fail to resolve");
  }

  // ===========================================================================
  // Channels and engine
  // ===========================================================================
  CurlGlobalScope curl_scope;
  if (!curl_scope.ok()) {
    Logger::Error("[Enforcer] curl_global_init failed");
    return kExitFailure;
  }

  auto transport = std::make_shared<channel::CurlHttpTransport>(config.primary.transport);
  auto primary = std::make_shared<channel::HttpRotationChannel>(
      config.primary.base_url, config.primary.api_root, transport);
  channel::RotationChannelFactory fallback_factory;
  if (config.fallback.has_value()) {
    fallback_factory = channel::MakeRconChannelFactory(*config.fallback);
  }
  auto reconciler = std::make_shared<reconcile::Reconciler>(primary, fallback_factory);

  auto clock = std::make_shared<runtime::ZonedClock>();

  runtime::EnforcementLoopOptions loop_options;
  loop_options.interval = config.enforce_interval;
  loop_options.tick_timeout = config.tick_timeout;
  loop_options.follow_block_transitions = config.follow_block_transitions;
  auto loop = std::make_shared<runtime::EnforcementLoop>(document, config.resolver, clock,
                                                         reconciler, loop_options);

  if (args.once) {
    const runtime::TickReport report = loop->RunTick();
    Logger::Info(std::string("[Enforcer] Single tick finished: ") +
                 runtime::TickOutcomeName(report.outcome));
    return report.ok() ? kExitOk : kExitFailure;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  // ===========================================================================
  // Control service (optional)
  // ===========================================================================
  std::unique_ptr<control::ControlServer> control_server;
  if (!config.control_listen_address.empty()) {
    control::ControlServiceInfo info;
    info.primary_endpoint = primary->EndpointUrl("");
    info.fallback_configured = config.fallback.has_value();
    info.timezone = config.timezone;
    control_server = std::make_unique<control::ControlServer>(
        config.control_listen_address,
        std::make_shared<control::EnforcerControlImpl>(loop, info));
    if (!control_server->Start()) {
      return kExitFailure;
    }
  }

  // ===========================================================================
  // Run until signalled
  // ===========================================================================
  loop->Start();
  while (g_termination_signal.load(std::memory_order_acquire) == 0) {
    std::this_thread::sleep_for(kSignalPollInterval);
  }

  const int signo = g_termination_signal.load(std::memory_order_acquire);
  Logger::Info("[Enforcer] Received signal " + std::to_string(signo) + ", shutting down");
  loop->RequestStop();
  loop->Join();
  if (control_server) control_server->Shutdown();

  Logger::Info("[Enforcer] Shutdown complete");
  return 128 + signo;
}
