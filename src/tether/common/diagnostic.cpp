#include "tether/common/diagnostic.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

#include "tether/common/log.hpp"

namespace tether {

auto DiagKindName(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kStaleHandleWrite:
      return "stale-handle-write";
    case DiagKind::kIdentityDrift:
      return "identity-drift";
  }
  return "";
}

void DiagnosticSink::Report(Diagnostic diag) {
  auto& logger = common::Logger();
  switch (diag.severity) {
    case DiagSeverity::kDebug:
      logger.debug("{}: {}", DiagKindName(diag.kind), diag.message);
      break;
    case DiagSeverity::kWarning:
      logger.warn("{}: {}", DiagKindName(diag.kind), diag.message);
      break;
  }
  diagnostics_.push_back(std::move(diag));
}

auto DiagnosticSink::Count(DiagKind kind) const -> size_t {
  return static_cast<size_t>(
      std::ranges::count_if(diagnostics_, [kind](const Diagnostic& d) {
        return d.kind == kind;
      }));
}

}  // namespace tether
