// Repository: Mapcycle-enforcer
// Component: Configuration Error
// Purpose: Startup-fatal error for invalid schedule documents or settings.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_UTIL_CONFIG_ERROR_HPP_
#define MAPCYCLE_UTIL_CONFIG_ERROR_HPP_

#include <stdexcept>
#include <string>

namespace mapcycle::util {

// Raised only while the process is starting up (schedule document, service
// config file, environment). Never raised from inside an enforcement tick.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace mapcycle::util

#endif  // MAPCYCLE_UTIL_CONFIG_ERROR_HPP_
