#pragma once

#include <concepts>
#include <optional>
#include <type_traits>
#include <utility>

#include "tether/runtime/call_id.hpp"
#include "tether/runtime/engine.hpp"

namespace tether::hooks {

// Value type of anything with a tracked Get(): Atom, Reaction,
// ReversibleAtom.
template <typename Source>
using ObservedType =
    std::remove_cvref_t<decltype(std::declval<const Source&>().Get())>;

template <typename T>
struct Change {
  std::optional<T> previous;  // Empty on the first render of the call-site
  T current;
};

namespace detail {

template <typename T>
struct SeenValue {
  std::optional<T> value;
};

}  // namespace detail

// Reads `source` (tracked) and compares it with the value this call-site
// saw on its previous render. Returns the change, or nullopt if equal.
template <typename Source, typename T = ObservedType<Source>>
  requires std::equality_comparable<T>
auto ObserveChange(runtime::Engine& engine, const Source& source)
    -> std::optional<Change<T>> {
  runtime::CallId id = engine.NextId();
  auto& seen = engine.GetOrInit<detail::SeenValue<T>>(
      id, [] { return detail::SeenValue<T>{}; });
  const T& current = source.Get();
  if (seen.value.has_value() && *seen.value == current) {
    return std::nullopt;
  }
  Change<T> change{.previous = std::move(seen.value), .current = current};
  seen.value = current;
  return change;
}

// True on the first render and whenever the value changed since.
template <typename Source, typename T = ObservedType<Source>>
  requires std::equality_comparable<T>
auto HasChanged(runtime::Engine& engine, const Source& source) -> bool {
  return ObserveChange(engine, source).has_value();
}

// Like HasChanged, but the first render only records the value.
template <typename Source, typename T = ObservedType<Source>>
  requires std::equality_comparable<T>
auto HasUpdated(runtime::Engine& engine, const Source& source) -> bool {
  auto change = ObserveChange(engine, source);
  return change.has_value() && change->previous.has_value();
}

// Calls fn(previous, current) when ObserveChange reports a change.
template <typename Source, typename F, typename T = ObservedType<Source>>
  requires std::equality_comparable<T>
void OnChange(runtime::Engine& engine, const Source& source, F&& fn) {
  if (auto change = ObserveChange(engine, source)) {
    std::forward<F>(fn)(change->previous, change->current);
  }
}

// Calls fn() when HasUpdated would return true. Returns whether it ran, or
// fn's result when it returns a value.
template <typename Source, typename F, typename T = ObservedType<Source>>
  requires std::equality_comparable<T>
auto OnUpdate(runtime::Engine& engine, const Source& source, F&& fn) {
  using R = std::invoke_result_t<F&>;
  bool updated = HasUpdated(engine, source);
  if constexpr (std::is_void_v<R>) {
    if (updated) {
      fn();
    }
    return updated;
  } else {
    if (!updated) {
      return std::optional<R>();
    }
    return std::optional<R>(fn());
  }
}

}  // namespace tether::hooks
