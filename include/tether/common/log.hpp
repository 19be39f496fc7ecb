#pragma once

#include <string_view>

#include <spdlog/spdlog.h>

namespace tether::common {

// Name of the spdlog logger shared by every engine in the process.
inline constexpr std::string_view kLoggerName = "tether";

// Returns the tether logger, creating it (stderr, colored) on first use.
// Reuses a logger of the same name if the host already registered one.
auto Logger() -> spdlog::logger&;

// Returns true if `level` names a spdlog level
// ("trace", "debug", "info", "warn", "error", "critical", "off").
auto IsValidLogLevel(std::string_view level) -> bool;

// Sets the level of the tether logger. Unknown names are ignored.
void SetLogLevel(std::string_view level);

}  // namespace tether::common
