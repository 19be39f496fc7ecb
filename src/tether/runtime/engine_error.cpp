#include "tether/runtime/engine_error.hpp"

#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace tether::runtime {

auto ErrorKindName(ErrorKind kind) -> const char* {
  switch (kind) {
    case ErrorKind::kTypeMismatch:
      return "TypeMismatch";
    case ErrorKind::kStaleHandleRead:
      return "StaleHandleRead";
    case ErrorKind::kTooManyReentrantUpdates:
      return "TooManyReentrantUpdates";
    case ErrorKind::kNoActiveRender:
      return "NoActiveRender";
    case ErrorKind::kNestedPhase:
      return "NestedPhase";
    case ErrorKind::kUnknownComponent:
      return "UnknownComponent";
  }
  return "";
}

EngineError::EngineError(ErrorKind kind, const std::string& detail)
    : std::runtime_error(std::format("{}: {}", ErrorKindName(kind), detail)),
      kind_(kind) {
}

TypeMismatchError::TypeMismatchError(
    std::string where, std::string_view stored_type,
    std::string_view requested_type)
    : EngineError(
          ErrorKind::kTypeMismatch,
          std::format(
              "{} holds '{}' but was read as '{}' (was a hook called "
              "conditionally?)",
              where, stored_type, requested_type)),
      where_(std::move(where)),
      stored_type_(stored_type),
      requested_type_(requested_type) {
}

TooManyReentrantUpdatesError::TooManyReentrantUpdatesError(
    uint32_t rounds, std::vector<std::string> chain)
    : EngineError(
          ErrorKind::kTooManyReentrantUpdates,
          fmt::format(
              "updates did not settle after {} rounds: {}", rounds,
              fmt::join(chain, " -> "))),
      rounds_(rounds),
      chain_(std::move(chain)) {
}

}  // namespace tether::runtime
