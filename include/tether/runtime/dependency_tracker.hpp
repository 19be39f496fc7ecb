#pragma once

#include <cstddef>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "tether/runtime/call_id.hpp"
#include "tether/runtime/engine_types.hpp"

namespace tether::runtime {

class AtomRegistry;

// Records which atoms each render invocation reads.
//
// Begin(id) opens a recording frame, every atom read while it is the innermost
// frame is recorded against `id`, and End(id) commits the frame by replacing
// id's previous subscription set wholesale: atoms no longer read lose `id` as
// a subscriber, newly read atoms gain it. A read that stops happening stops
// notifying on the very next render; there is no unsubscribe API.
class DependencyTracker {
 public:
  explicit DependencyTracker(AtomRegistry& atoms) : atoms_(atoms) {
  }

  DependencyTracker(const DependencyTracker&) = delete;
  auto operator=(const DependencyTracker&) -> DependencyTracker& = delete;
  DependencyTracker(DependencyTracker&&) = delete;
  auto operator=(DependencyTracker&&) -> DependencyTracker& = delete;

  void Begin(const CallId& identity);

  // No-op when no frame is open (reads outside a render are untracked).
  void Record(AtomHandle atom);

  // Throws InternalError if `identity` is not the innermost open frame.
  void End(const CallId& identity);

  // Pops the innermost frame without committing it, if it belongs to
  // `identity`. Used when a render or nested scope unwinds.
  void Discard(const CallId& identity) noexcept;

  // Drops every committed subscription of `identity`.
  void Forget(const CallId& identity);

  // Discards open frames without committing. Committed edges are kept.
  void Abort() {
    frames_.clear();
  }

  [[nodiscard]] auto IsRecording() const -> bool {
    return !frames_.empty();
  }

  // Identity of the innermost open frame, or nullptr.
  [[nodiscard]] auto CurrentIdentity() const -> const CallId*;

  // Committed dependencies of `identity`, in first-read order.
  [[nodiscard]] auto DependenciesOf(const CallId& identity) const
      -> std::vector<AtomHandle>;

  [[nodiscard]] auto TrackedIdentityCount() const -> size_t {
    return committed_.size();
  }

 private:
  struct Frame {
    CallId identity;
    std::vector<AtomHandle> reads;
    absl::flat_hash_set<AtomHandle> seen;
  };

  AtomRegistry& atoms_;
  std::vector<Frame> frames_;
  absl::flat_hash_map<CallId, std::vector<AtomHandle>> committed_;
};

}  // namespace tether::runtime
