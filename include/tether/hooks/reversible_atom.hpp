#pragma once

#include <concepts>
#include <optional>
#include <string_view>
#include <utility>

#include "tether/hooks/atom.hpp"
#include "tether/runtime/atom_registry.hpp"
#include "tether/runtime/engine.hpp"
#include "tether/runtime/engine_types.hpp"
#include "tether/runtime/history.hpp"

namespace tether::hooks {

// Atom whose changes are recorded in the engine's History. Undo and redo go
// through Engine::Undo/Redo/TravelTo and notify subscribers like any write.
template <typename T>
class ReversibleAtom {
 public:
  explicit ReversibleAtom(Atom<T> atom) : atom_(atom) {
  }

  [[nodiscard]] auto Get() const -> const T& {
    return atom_.Get();
  }
  [[nodiscard]] auto Peek() const -> const T& {
    return atom_.Peek();
  }
  template <typename F>
  auto GetWith(F&& fn) const -> decltype(auto) {
    return atom_.GetWith(std::forward<F>(fn));
  }

  // Records the change, then writes. Equal values record nothing.
  auto Set(T value) const -> runtime::WriteOutcome {
    if (!atom_.Exists()) {
      return atom_.Set(std::move(value));
    }
    T before = atom_.Peek();
    if constexpr (std::equality_comparable<T>) {
      if (before == value) {
        return runtime::WriteOutcome::kUnchanged;
      }
    }
    Record(std::move(before), value);
    return atom_.Set(std::move(value));
  }

  // Records the change, then stores `value` without notifying. Replaying
  // the command does not notify either.
  auto InertSet(T value) const -> runtime::WriteOutcome {
    if (!atom_.Exists()) {
      return atom_.InertSet(std::move(value));
    }
    T before = atom_.Peek();
    if constexpr (std::equality_comparable<T>) {
      if (before == value) {
        return runtime::WriteOutcome::kUnchanged;
      }
    }
    runtime::Engine& engine = atom_.GetEngine();
    runtime::AtomHandle handle = atom_.Handle();
    engine.GetHistory().Record(
        runtime::History::Command{
            .apply =
                [&engine, handle, after = value] {
                  engine.WriteAtomSilently<T>(handle, after);
                },
            .revert =
                [&engine, handle, before = std::move(before)] {
                  engine.WriteAtomSilently<T>(handle, before);
                },
        });
    return atom_.InertSet(std::move(value));
  }

  // Re-runs the initializer and records the change. Outside a phase the
  // reset runs as one, so readers render after the command is recorded.
  auto ResetToDefault() const -> runtime::WriteOutcome {
    runtime::Engine& engine = atom_.GetEngine();
    auto outcome = runtime::WriteOutcome::kUnchanged;
    auto reset = [&] {
      if (!atom_.Exists()) {
        outcome = atom_.ResetToDefault();
        return;
      }
      T before = atom_.Peek();
      outcome = atom_.ResetToDefault();
      if (outcome != runtime::WriteOutcome::kChanged) {
        return;
      }
      if constexpr (std::equality_comparable<T>) {
        if (before == atom_.Peek()) {
          return;
        }
      }
      Record(std::move(before), atom_.Peek());
    };
    if (engine.InPhase()) {
      reset();
    } else {
      engine.Dispatch(reset);
    }
    return outcome;
  }

  // Disposes the atom and returns its last value, or nullopt if it was
  // already gone. Not recorded: replaying earlier commands for it drops the
  // writes with a StaleHandleWrite diagnostic.
  auto Remove() const -> std::optional<T> {
    if (!atom_.Exists()) {
      return std::nullopt;
    }
    T last = atom_.Peek();
    atom_.Remove();
    return last;
  }

  template <typename F>
  auto Update(F&& fn) const -> runtime::WriteOutcome {
    T next = atom_.Peek();
    std::forward<F>(fn)(next);
    return Set(std::move(next));
  }

  [[nodiscard]] auto Exists() const -> bool {
    return atom_.Exists();
  }
  [[nodiscard]] auto AsAtom() const -> const Atom<T>& {
    return atom_;
  }

 private:
  void Record(T before, T after) const {
    runtime::Engine& engine = atom_.GetEngine();
    runtime::AtomHandle handle = atom_.Handle();
    engine.GetHistory().Record(
        runtime::History::Command{
            .apply =
                [&engine, handle, after = std::move(after)] {
                  engine.WriteAtom<T>(handle, after);
                },
            .revert =
                [&engine, handle, before = std::move(before)] {
                  engine.WriteAtom<T>(handle, before);
                },
        });
  }

  Atom<T> atom_;
};

template <typename T>
auto UseReversibleAtom(runtime::Engine& engine, T initial)
    -> ReversibleAtom<T> {
  return ReversibleAtom<T>(UseAtom<T>(engine, std::move(initial)));
}

template <typename T, typename F>
auto DefineReversibleAtom(
    runtime::Engine& engine, std::string_view name, F init)
    -> ReversibleAtom<T> {
  return ReversibleAtom<T>(DefineAtom<T>(engine, name, std::move(init)));
}

}  // namespace tether::hooks
