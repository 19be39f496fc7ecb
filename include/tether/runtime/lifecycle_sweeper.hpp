#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "tether/runtime/call_id.hpp"
#include "tether/runtime/engine_types.hpp"

namespace tether::runtime {

struct SweepResult {
  std::vector<CallId> evicted;  // Sorted by CallId
  size_t visited = 0;           // Identities visited by this render
  size_t previously_visited = 0;
};

// Tracks which identities each unit visits per render and evicts the ones
// that stopped being visited. An identity survives `grace_passes`
// consecutive renders of its unit without a visit; the default 0 evicts at
// the end of the first render that skips it.
class LifecycleSweeper {
 public:
  explicit LifecycleSweeper(uint32_t grace_passes = 0)
      : grace_passes_(grace_passes) {
  }

  LifecycleSweeper(const LifecycleSweeper&) = delete;
  auto operator=(const LifecycleSweeper&) -> LifecycleSweeper& = delete;
  LifecycleSweeper(LifecycleSweeper&&) = delete;
  auto operator=(LifecycleSweeper&&) -> LifecycleSweeper& = delete;

  // Throws InternalError if `root` is already rendering.
  void BeginRender(ComponentId root);

  // Marks `id` as visited by the render of id.Root(). Throws InternalError
  // if that unit is not rendering.
  void Visit(const CallId& id);

  // Reconciles the render of `root` against the identities it kept alive.
  auto EndRender(ComponentId root) -> SweepResult;

  // Forgets every identity of `root` and returns them, sorted.
  auto EvictAll(ComponentId root) -> std::vector<CallId>;

  // Ends a render that threw. Identities it visited join the live set with
  // no misses, so a later sweep or EvictAll still reaches the state they
  // created. No-op if `root` is not rendering.
  void AbandonRender(ComponentId root) noexcept;

  // AbandonRender for every unit still rendering after a fatal error.
  void AbortRenders() noexcept;

  [[nodiscard]] auto IsRendering(ComponentId root) const -> bool;
  [[nodiscard]] auto IsLive(const CallId& id) const -> bool;
  [[nodiscard]] auto LiveCount(ComponentId root) const -> size_t;

  [[nodiscard]] auto GracePasses() const -> uint32_t {
    return grace_passes_;
  }
  void SetGracePasses(uint32_t grace_passes) {
    grace_passes_ = grace_passes;
  }

 private:
  struct RootState {
    // Identity -> consecutive renders it was not visited in.
    absl::flat_hash_map<CallId, uint32_t> live;
    absl::flat_hash_set<CallId> visited;
    size_t last_visited = 0;
    bool rendering = false;
  };

  static void KeepVisited(RootState& state) noexcept;

  uint32_t grace_passes_;
  absl::flat_hash_map<ComponentId, RootState> roots_;
};

}  // namespace tether::runtime
