#include "tether/common/log.hpp"

#include <algorithm>
#include <array>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace tether::common {

namespace {

constexpr std::array<std::string_view, 7> kLevelNames = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

auto CreateLogger() -> std::shared_ptr<spdlog::logger> {
  if (auto existing = spdlog::get(std::string(kLoggerName))) {
    return existing;
  }
  auto logger = spdlog::stderr_color_mt(std::string(kLoggerName));
  logger->set_pattern("[%n][%l] %v");
  logger->set_level(spdlog::level::warn);
  return logger;
}

}  // namespace

auto Logger() -> spdlog::logger& {
  static std::shared_ptr<spdlog::logger> logger = CreateLogger();
  return *logger;
}

auto IsValidLogLevel(std::string_view level) -> bool {
  return std::ranges::find(kLevelNames, level) != kLevelNames.end();
}

void SetLogLevel(std::string_view level) {
  if (!IsValidLogLevel(level)) {
    return;
  }
  Logger().set_level(spdlog::level::from_str(std::string(level)));
}

}  // namespace tether::common
