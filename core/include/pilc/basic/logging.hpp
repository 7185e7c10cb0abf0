// pilc/basic/logging.hpp - Process-wide logger setup
//
// All pilc components log through spdlog's default logger. Witness
// generation reports per-row progress at debug level and per-identity
// outcomes at trace level.
//
#pragma once

#include <string>

namespace pilc
{

struct LogConfig
{
  /// One of: trace, debug, info, warn, error, critical, off
  std::string level = "warn";
  std::string pattern = "[%l] %v";
};

/// Apply a log configuration to the default spdlog logger.
/// Unknown level names fall back to "off".
void configure_logging(const LogConfig & config);

}  // namespace pilc
