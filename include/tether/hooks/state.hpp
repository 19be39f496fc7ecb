#pragma once

#include <concepts>
#include <format>
#include <utility>

#include "tether/runtime/call_id.hpp"
#include "tether/runtime/engine.hpp"
#include "tether/runtime/engine_error.hpp"

namespace tether::hooks {

// Accessor for a state cell created by UseState. Copyable; stays bound to the
// call-site identity, so it can be captured by effects and event handlers.
template <typename T>
class StateAccess {
 public:
  StateAccess(runtime::Engine& engine, runtime::CallId id)
      : engine_(&engine), id_(std::move(id)) {
  }

  // Throws EngineError(kStaleHandleRead) once the call-site was evicted.
  [[nodiscard]] auto Get() const -> const T& {
    return Cell();
  }

  template <typename F>
  auto GetWith(F&& fn) const -> decltype(auto) {
    return std::forward<F>(fn)(Cell());
  }

  // Stores `value` and re-renders the owning unit if it differs.
  void Set(T value) {
    T& cell = Cell();
    if constexpr (std::equality_comparable<T>) {
      if (cell == value) {
        return;
      }
    }
    cell = std::move(value);
    engine_->RequestRender(id_.Root());
  }

  // Stores `value` without re-rendering.
  void InertSet(T value) {
    Cell() = std::move(value);
  }

  template <typename F>
  void Update(F&& fn) {
    std::forward<F>(fn)(Cell());
    engine_->RequestRender(id_.Root());
  }

  [[nodiscard]] auto Exists() const -> bool {
    return engine_->GetStateStore().Contains(id_);
  }

  [[nodiscard]] auto Id() const -> const runtime::CallId& {
    return id_;
  }

 private:
  auto Cell() const -> T& {
    T* value = engine_->GetStateStore().Get<T>(id_);
    if (value == nullptr) {
      throw runtime::EngineError(
          runtime::ErrorKind::kStaleHandleRead,
          std::format("state {} was evicted", id_.ToString()));
    }
    return *value;
  }

  runtime::Engine* engine_;
  runtime::CallId id_;
};

// State cell at the next call-site, initialized with `initial` on the first
// render that reaches it.
template <typename T>
auto UseState(runtime::Engine& engine, T initial) -> StateAccess<T> {
  runtime::CallId id = engine.NextId();
  engine.GetOrInit<T>(id, [&] { return std::move(initial); });
  return StateAccess<T>(engine, std::move(id));
}

}  // namespace tether::hooks
