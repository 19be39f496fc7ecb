#pragma once

#include <string_view>
#include <utility>

#include "tether/runtime/engine.hpp"
#include "tether/runtime/engine_types.hpp"

namespace tether::hooks {

// Handle to a derived atom.
template <typename T>
class Reaction {
 public:
  Reaction(runtime::Engine& engine, runtime::ComponentId unit)
      : engine_(&engine), unit_(unit) {
  }

  // Tracked read of the latest computed value. Throws
  // EngineError(kStaleHandleRead) after Remove().
  [[nodiscard]] auto Get() const -> const T& {
    return engine_->ReadAtom<T>(engine_->ReactionOutput(unit_));
  }

  [[nodiscard]] auto Peek() const -> const T& {
    return engine_->PeekAtom<T>(engine_->ReactionOutput(unit_));
  }

  template <typename F>
  auto GetWith(F&& fn) const -> decltype(auto) {
    return std::forward<F>(fn)(Get());
  }

  void ForceRecompute() const {
    engine_->ForceRecompute(unit_);
  }

  [[nodiscard]] auto Exists() const -> bool {
    return engine_->IsMounted(unit_);
  }

  // True until the first read or ForceRecompute of a suspended reaction.
  [[nodiscard]] auto IsSuspended() const -> bool {
    return engine_->IsSuspended(unit_);
  }

  // Drops the reaction, its state and its value.
  void Remove() const {
    engine_->Unmount(unit_);
  }

  [[nodiscard]] auto Unit() const -> runtime::ComponentId {
    return unit_;
  }

 private:
  runtime::Engine* engine_;
  runtime::ComponentId unit_;
};

namespace detail {

template <typename T, typename F>
auto PublishingCompute(F compute) -> runtime::RenderFn {
  return [compute = std::move(compute)](runtime::Engine& e) {
    e.PublishReactionValue<T>(compute(e));
  };
}

}  // namespace detail

// Derived atom named `name`, computed as compute(engine) now and again
// whenever an atom or reaction it read changes. `compute` may use hooks;
// their state belongs to the reaction. Defining an existing name returns the
// existing reaction.
template <typename T, typename F>
auto DefineReaction(runtime::Engine& engine, std::string_view name, F compute)
    -> Reaction<T> {
  runtime::ComponentId unit = engine.DefineReaction(
      name, detail::PublishingCompute<T>(std::move(compute)));
  return Reaction<T>(engine, unit);
}

// Like DefineReaction, but nothing is computed until the reaction is first
// read or recomputed. Until then it reacts to no source.
template <typename T, typename F>
auto DefineSuspendedReaction(
    runtime::Engine& engine, std::string_view name, F compute) -> Reaction<T> {
  runtime::ComponentId unit = engine.DefineReaction(
      name, detail::PublishingCompute<T>(std::move(compute)),
      /*start_suspended=*/true);
  return Reaction<T>(engine, unit);
}

}  // namespace tether::hooks
