#pragma once

#include <string_view>
#include <utility>

#include "tether/runtime/atom_registry.hpp"
#include "tether/runtime/call_id.hpp"
#include "tether/runtime/engine.hpp"
#include "tether/runtime/engine_types.hpp"

namespace tether::hooks {

// Typed handle to an atom. Cheap to copy; does not own the atom.
template <typename T>
class Atom {
 public:
  Atom(runtime::Engine& engine, runtime::AtomHandle handle)
      : engine_(&engine), handle_(handle) {
  }

  // Tracked read: inside a render, the rendering scope subscribes.
  [[nodiscard]] auto Get() const -> const T& {
    return engine_->ReadAtom<T>(handle_);
  }

  [[nodiscard]] auto Peek() const -> const T& {
    return engine_->PeekAtom<T>(handle_);
  }

  template <typename F>
  auto GetWith(F&& fn) const -> decltype(auto) {
    return std::forward<F>(fn)(Get());
  }

  auto Set(T value) const -> runtime::WriteOutcome {
    return engine_->WriteAtom<T>(handle_, std::move(value));
  }

  // Stores `value` without notifying subscribers.
  auto InertSet(T value) const -> runtime::WriteOutcome {
    return engine_->WriteAtomSilently<T>(handle_, std::move(value));
  }

  template <typename F>
  auto Update(F&& fn) const -> runtime::WriteOutcome {
    return engine_->UpdateAtom<T>(handle_, std::forward<F>(fn));
  }

  auto ResetToDefault() const -> runtime::WriteOutcome {
    return engine_->ResetAtom(handle_);
  }

  // Disposes the atom. Later writes through any copy are dropped with a
  // diagnostic; reads throw.
  auto Remove() const -> bool {
    return engine_->DisposeAtom(handle_);
  }

  [[nodiscard]] auto Exists() const -> bool {
    return engine_->GetAtomRegistry().IsLive(handle_);
  }

  [[nodiscard]] auto Handle() const -> runtime::AtomHandle {
    return handle_;
  }
  [[nodiscard]] auto GetEngine() const -> runtime::Engine& {
    return *engine_;
  }

  auto operator==(const Atom& other) const -> bool {
    return handle_ == other.handle_;
  }

 private:
  runtime::Engine* engine_;
  runtime::AtomHandle handle_;
};

// Atom owned by the next call-site: created on its first render, disposed
// when the call-site is evicted. A removed atom is recreated on the next
// render.
template <typename T>
auto UseAtom(runtime::Engine& engine, T initial) -> Atom<T> {
  runtime::CallId id = engine.NextId();
  auto& handle = engine.GetOrInit<runtime::AtomHandle>(
      id, [] { return runtime::AtomHandle{}; });
  if (!engine.GetAtomRegistry().IsLive(handle)) {
    handle = engine.CreateAtom<T>(
        initial, runtime::AtomScope::OwnedBy(id), {},
        [initial] { return initial; });
  }
  return Atom<T>(engine, handle);
}

// Global atom registered under `name`. `init` runs on the first call only
// and again on ResetToDefault.
template <typename T, typename F>
auto DefineAtom(runtime::Engine& engine, std::string_view name, F init)
    -> Atom<T> {
  return Atom<T>(engine, engine.DefineAtom<T>(name, std::move(init)));
}

}  // namespace tether::hooks
