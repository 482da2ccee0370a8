#pragma once

#include <cstdlib>
#include <string_view>

#include <spdlog/spdlog.h>

namespace proofenv::common {

/// Exit status used for unusable arguments or configuration.
inline constexpr auto kConfigurationExitCode = 2;

/// Log `message` at critical level, flush every sink and exit the process.
///
/// Only tools call this; library code reports failures as data.
[[noreturn]] inline void critical(const std::string_view message,
                                  const int exit_code = kConfigurationExitCode) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::exit(exit_code);
}

}  // namespace proofenv::common
