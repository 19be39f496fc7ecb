#include "tether/config/engine_config.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// NOLINTNEXTLINE(misc-include-cleaner): yaml.h is the public API
#include <yaml-cpp/yaml.h>

#include "tether/common/log.hpp"

namespace tether::config {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kConfigFileName = "tether.yaml";
constexpr const char* kLogLevelEnv = "TETHER_LOG_LEVEL";

void ValidateKeys(
    const YAML::Node& node, std::initializer_list<std::string_view> allowed,
    const fs::path& file) {
  for (const auto& pair : node) {
    auto key = pair.first.as<std::string>();
    if (std::ranges::find(allowed, key) == allowed.end()) {
      throw ConfigError(
          file, pair.first.Mark().line + 1,
          std::format("unknown key '{}'", key));
    }
  }
}

auto ReadCount(const YAML::Node& node, std::string_view key, const fs::path& file)
    -> uint32_t {
  try {
    return node.as<uint32_t>();
  } catch (const YAML::BadConversion&) {
    throw ConfigError(
        file, node.Mark().line + 1,
        std::format("'{}' must be a non-negative integer", key));
  }
}

auto ReadBool(const YAML::Node& node, std::string_view key, const fs::path& file)
    -> bool {
  try {
    return node.as<bool>();
  } catch (const YAML::BadConversion&) {
    throw ConfigError(
        file, node.Mark().line + 1, std::format("'{}' must be a boolean", key));
  }
}

auto ReadString(
    const YAML::Node& node, std::string_view key, const fs::path& file)
    -> std::string {
  if (!node.IsScalar()) {
    throw ConfigError(
        file, node.Mark().line + 1, std::format("'{}' must be a string", key));
  }
  return node.as<std::string>();
}

}  // namespace

ConfigError::ConfigError(fs::path file, int line, const std::string& detail)
    : std::runtime_error(
          line > 0 ? std::format("{}:{}: {}", file.string(), line, detail)
                   : std::format("{}: {}", file.string(), detail)),
      file_(std::move(file)),
      line_(line) {
}

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> EngineOptions {
  EngineOptions options;

  YAML::Node root;
  try {
    // NOLINTNEXTLINE(misc-include-cleaner): LoadFile is provided by yaml.h
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::BadFile&) {
    throw ConfigError(config_path, 0, "cannot open file");
  } catch (const YAML::ParserException& e) {
    throw ConfigError(config_path, e.mark.line + 1, e.msg);
  }

  // An empty file keeps every default.
  if (root.IsNull()) {
    return options;
  }
  if (!root.IsMap()) {
    throw ConfigError(
        config_path, root.Mark().line + 1, "top level must be a mapping");
  }

  ValidateKeys(
      root,
      {"max_reentrant_rounds", "max_reaction_depth", "sweep_grace_passes",
       "enable_trace", "log_level"},
      config_path);

  if (auto node = root["max_reentrant_rounds"]) {
    options.max_reentrant_rounds =
        ReadCount(node, "max_reentrant_rounds", config_path);
    if (options.max_reentrant_rounds == 0) {
      throw ConfigError(
          config_path, node.Mark().line + 1,
          "'max_reentrant_rounds' must be at least 1");
    }
  }
  if (auto node = root["max_reaction_depth"]) {
    options.max_reaction_depth =
        ReadCount(node, "max_reaction_depth", config_path);
  }
  if (auto node = root["sweep_grace_passes"]) {
    options.sweep_grace_passes =
        ReadCount(node, "sweep_grace_passes", config_path);
  }
  if (auto node = root["enable_trace"]) {
    options.enable_trace = ReadBool(node, "enable_trace", config_path);
  }
  if (auto node = root["log_level"]) {
    auto level = ReadString(node, "log_level", config_path);
    if (!common::IsValidLogLevel(level)) {
      throw ConfigError(
          config_path, node.Mark().line + 1,
          std::format("unknown log level '{}'", level));
    }
    options.log_level = std::move(level);
  }

  return options;
}

void ApplyEnvironment(EngineOptions& options) {
  const char* level = std::getenv(kLogLevelEnv);
  if (level == nullptr) {
    return;
  }
  if (!common::IsValidLogLevel(level)) {
    common::Logger().warn("ignoring {}='{}': unknown level", kLogLevelEnv, level);
    return;
  }
  options.log_level = level;
}

}  // namespace tether::config
