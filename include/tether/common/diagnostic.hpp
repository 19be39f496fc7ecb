#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tether {

// Recoverable conditions. Fatal ones are exceptions (see engine_error.hpp).
enum class DiagKind : uint8_t {
  kStaleHandleWrite,  // Write to a disposed atom; the write was dropped
  kIdentityDrift,     // Call structure of a unit changed shape between renders
};

enum class DiagSeverity : uint8_t {
  kDebug,
  kWarning,
};

struct Diagnostic {
  DiagKind kind;
  DiagSeverity severity;
  std::string message;

  auto operator==(const Diagnostic&) const -> bool = default;

  static auto StaleHandleWrite(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = DiagKind::kStaleHandleWrite,
        .severity = DiagSeverity::kWarning,
        .message = std::move(msg),
    };
  }

  static auto IdentityDrift(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = DiagKind::kIdentityDrift,
        .severity = DiagSeverity::kDebug,
        .message = std::move(msg),
    };
  }
};

// Returns a short lowercase name for the kind ("stale-handle-write").
auto DiagKindName(DiagKind kind) -> const char*;

// Collects recoverable diagnostics reported by the engine and forwards each
// one to the tether logger. Not thread-safe. Diagnostics are stored in order
// of reporting.
class DiagnosticSink {
 public:
  void Report(Diagnostic diag);

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

  [[nodiscard]] auto Count(DiagKind kind) const -> size_t;

  void Clear() {
    diagnostics_.clear();
  }

 private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace tether
