#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace tether::config {

struct EngineOptions {
  // Scheduler rounds per flush before TooManyReentrantUpdatesError.
  uint32_t max_reentrant_rounds = 10;
  // Nesting limit for derived atoms recomputing each other.
  uint32_t max_reaction_depth = 32;
  // Renders an identity may be skipped before it is evicted.
  uint32_t sweep_grace_passes = 0;
  bool enable_trace = false;
  std::string log_level = "warn";
};

// Malformed tether.yaml. `line` is 1-based, 0 when unknown.
class ConfigError : public std::runtime_error {
 public:
  ConfigError(std::filesystem::path file, int line, const std::string& detail);

  [[nodiscard]] auto File() const -> const std::filesystem::path& {
    return file_;
  }
  [[nodiscard]] auto Line() const -> int {
    return line_;
  }

 private:
  std::filesystem::path file_;
  int line_;
};

// Search for tether.yaml starting from dir, going up to parent dirs
// Returns nullopt if not found
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse tether.yaml. Missing keys keep their defaults.
// Throws ConfigError on parse errors, unknown keys or bad values.
auto LoadConfig(const std::filesystem::path& config_path) -> EngineOptions;

// Applies TETHER_LOG_LEVEL when it names a valid level.
void ApplyEnvironment(EngineOptions& options);

}  // namespace tether::config
