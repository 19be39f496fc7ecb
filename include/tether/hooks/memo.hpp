#pragma once

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

#include "tether/hooks/state.hpp"
#include "tether/runtime/call_id.hpp"
#include "tether/runtime/engine.hpp"

namespace tether::hooks {

namespace detail {

template <typename Deps, typename T>
struct MemoCell {
  std::optional<Deps> deps;
  std::optional<T> value;
};

}  // namespace detail

// Caches fn() until `deps` compares unequal to the deps of the previous
// render. Use a std::tuple for several dependencies.
template <typename Deps, typename F>
auto UseMemo(runtime::Engine& engine, Deps deps, F&& fn)
    -> const std::invoke_result_t<F&>& {
  using T = std::invoke_result_t<F&>;
  runtime::CallId id = engine.NextId();
  auto& memo = engine.GetOrInit<detail::MemoCell<Deps, T>>(
      id, [] { return detail::MemoCell<Deps, T>{}; });
  if (!memo.deps.has_value() || !(*memo.deps == deps)) {
    memo.value.emplace(fn());
    memo.deps.emplace(std::move(deps));
  }
  return *memo.value;
}

// Mutable cell that never triggers a render.
template <typename T>
auto UseRef(runtime::Engine& engine, T initial) -> T& {
  runtime::CallId id = engine.NextId();
  return engine.GetOrInit<T>(id, [&] { return std::move(initial); });
}

template <typename S, typename A>
class ReducerAccess {
 public:
  using ReduceFn = std::function<S(const S&, const A&)>;

  ReducerAccess(StateAccess<S> state, ReduceFn reduce)
      : state_(std::move(state)), reduce_(std::move(reduce)) {
  }

  [[nodiscard]] auto Get() const -> const S& {
    return state_.Get();
  }

  // Replaces the state with reduce(state, action); re-renders if it changed.
  void Dispatch(const A& action) {
    state_.Set(reduce_(state_.Get(), action));
  }

 private:
  StateAccess<S> state_;
  ReduceFn reduce_;
};

template <typename A, typename S, typename R>
auto UseReducer(runtime::Engine& engine, R reducer, S initial)
    -> ReducerAccess<S, A> {
  return ReducerAccess<S, A>(
      UseState<S>(engine, std::move(initial)), std::move(reducer));
}

// Runs `fn` the first time this call-site renders. Returns true if it ran.
auto DoOnce(runtime::Engine& engine, const std::function<void()>& fn) -> bool;

}  // namespace tether::hooks
