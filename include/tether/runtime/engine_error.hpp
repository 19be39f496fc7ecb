#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "tether/runtime/engine_types.hpp"

namespace tether::runtime {

// Fatal error kinds. Each aborts the current phase and propagates to the host.
enum class ErrorKind : uint8_t {
  kTypeMismatch,             // A call-site or atom was read as another type
  kStaleHandleRead,          // Read of a disposed atom
  kTooManyReentrantUpdates,  // Write cycle exceeded the reentrancy cap
  kNoActiveRender,           // Hook called outside a unit render
  kNestedPhase,              // RunPass/Dispatch started inside a phase
  kUnknownComponent,         // ComponentId never issued by this engine
};

auto ErrorKindName(ErrorKind kind) -> const char*;

class EngineError : public std::runtime_error {
 public:
  EngineError(ErrorKind kind, const std::string& detail);

  [[nodiscard]] auto Kind() const -> ErrorKind {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

// A call-site's hook type changed between passes, usually because a hook
// before it was called conditionally. `where` names the cell ("state 0/2",
// "atom 'count'").
class TypeMismatchError : public EngineError {
 public:
  TypeMismatchError(
      std::string where, std::string_view stored_type,
      std::string_view requested_type);

  [[nodiscard]] auto Where() const -> const std::string& {
    return where_;
  }
  [[nodiscard]] auto StoredType() const -> const std::string& {
    return stored_type_;
  }
  [[nodiscard]] auto RequestedType() const -> const std::string& {
    return requested_type_;
  }

 private:
  std::string where_;
  std::string stored_type_;
  std::string requested_type_;
};

// Reentrant updates did not settle. `chain` lists the unit names rendered in
// the offending rounds, oldest first.
class TooManyReentrantUpdatesError : public EngineError {
 public:
  TooManyReentrantUpdatesError(
      uint32_t rounds, std::vector<std::string> chain);

  [[nodiscard]] auto Rounds() const -> uint32_t {
    return rounds_;
  }
  [[nodiscard]] auto Chain() const -> const std::vector<std::string>& {
    return chain_;
  }

 private:
  uint32_t rounds_;
  std::vector<std::string> chain_;
};

}  // namespace tether::runtime
