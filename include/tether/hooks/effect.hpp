#pragma once

#include <optional>
#include <type_traits>
#include <utility>

#include "tether/runtime/call_id.hpp"
#include "tether/runtime/engine.hpp"
#include "tether/runtime/engine_types.hpp"

namespace tether::hooks {

namespace detail {

template <typename Deps>
struct EffectCell {
  std::optional<Deps> deps;
};

}  // namespace detail

// Runs `effect` after the unit's render whenever `deps` changed since the
// last run (always on the first render). If `effect` returns a callable, it
// is the cleanup: run before the next run and when the call-site is evicted.
template <typename Deps, typename F>
void UseEffect(runtime::Engine& engine, Deps deps, F effect) {
  using Cell = detail::EffectCell<Deps>;
  runtime::CallId id = engine.NextId();
  auto& cell = engine.GetOrInit<Cell>(id, [] { return Cell{}; });
  if (cell.deps.has_value() && *cell.deps == deps) {
    return;
  }

  // Deps are stored when the effect runs. An effect dropped by an aborted
  // phase is queued again by the next render.
  runtime::ComponentId unit = id.Root();
  engine.QueueEffect(
      unit, [&engine, id = std::move(id), deps = std::move(deps),
             effect = std::move(effect)]() mutable {
        if (auto* ran = engine.GetStateStore().Get<Cell>(id)) {
          ran->deps.emplace(std::move(deps));
        }
        if (auto cleanup = engine.TakeCleanup(id)) {
          cleanup();
        }
        if constexpr (std::is_void_v<std::invoke_result_t<F&>>) {
          effect();
        } else {
          engine.RegisterEffect(id, runtime::CleanupFn(effect()));
        }
      });
}

}  // namespace tether::hooks
