#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/container/flat_hash_map.h"
#include "tether/common/type_tag.hpp"
#include "tether/runtime/call_id.hpp"
#include "tether/runtime/dependency_tracker.hpp"
#include "tether/runtime/engine_error.hpp"
#include "tether/runtime/engine_types.hpp"
#include "tether/runtime/erased_value.hpp"

namespace tether::runtime {

// Owning scope of an atom. A global atom lives until disposed explicitly; an
// owned atom is disposed when its owner identity is swept.
struct AtomScope {
  std::optional<CallId> owner;

  static auto Global() -> AtomScope {
    return AtomScope{};
  }
  static auto OwnedBy(CallId id) -> AtomScope {
    return AtomScope{.owner = std::move(id)};
  }
};

enum class WriteOutcome : uint8_t {
  kChanged,    // Value replaced, subscribers notified
  kUnchanged,  // Equal to the current value, nothing notified
  kStale,      // Handle refers to a disposed atom, write dropped
  kSilent,     // Value replaced without notification
};

// Called after a changed write with the atom's subscribers at that moment.
using ChangeListener =
    std::function<void(AtomHandle atom, const std::vector<CallId>& subscribers)>;

// Called when a write targets a disposed atom.
using StaleWriteListener = std::function<void(AtomHandle atom)>;

// Registry of primitive reactive cells.
//
// Each atom holds a type-erased value, an optional initializer (for
// ResetToDefault) and a subscriber set ordered by CallId, so notification
// order is deterministic. Slots are recycled through a free list; the
// generation in AtomHandle tells live handles from stale ones.
//
// Reads through Read() are reported to the DependencyTracker; writes that
// change the value are reported to the ChangeListener, which the Engine uses
// to enqueue re-renders. Derived atoms are built on top of this by the
// Engine; the registry knows nothing about them.
class AtomRegistry {
 public:
  AtomRegistry() = default;

  AtomRegistry(const AtomRegistry&) = delete;
  auto operator=(const AtomRegistry&) -> AtomRegistry& = delete;
  AtomRegistry(AtomRegistry&&) = delete;
  auto operator=(AtomRegistry&&) -> AtomRegistry& = delete;

  void SetTracker(DependencyTracker* tracker) {
    tracker_ = tracker;
  }
  void SetChangeListener(ChangeListener listener) {
    change_listener_ = std::move(listener);
  }
  void SetStaleWriteListener(StaleWriteListener listener) {
    stale_listener_ = std::move(listener);
  }

  template <typename T>
  auto Create(
      T initial, AtomScope scope = AtomScope::Global(), std::string name = {},
      std::function<T()> initializer = {}) -> AtomHandle {
    Initializer erased_init;
    if (initializer) {
      erased_init = [init = std::move(initializer)]() {
        return MakeErased<T>(init());
      };
    }
    return Allocate(
        MakeErased<T>(std::move(initial)), std::move(scope), std::move(name),
        std::move(erased_init));
  }

  // Named global atom, created on first call only; later calls return the
  // existing handle without running `init`. `init` is kept for
  // ResetToDefault.
  template <typename T, typename F>
  auto Define(std::string_view name, F init) -> AtomHandle {
    if (auto existing = Find(name)) {
      return *existing;
    }
    std::function<T()> initializer = init;
    T initial = initializer();
    auto handle = Create<T>(
        std::move(initial), AtomScope::Global(), std::string(name),
        std::move(initializer));
    by_name_.insert_or_assign(std::string(name), handle);
    return handle;
  }

  // Live handle registered under `name` by Define.
  [[nodiscard]] auto Find(std::string_view name) const
      -> std::optional<AtomHandle>;

  // Tracked read: records a dependency edge for the current recording frame.
  // Throws EngineError(kStaleHandleRead) on a disposed handle and
  // TypeMismatchError if the atom holds another type.
  template <typename T>
  auto Read(AtomHandle handle) -> const T& {
    const T& value = Peek<T>(handle);
    if (tracker_ != nullptr) {
      tracker_->Record(handle);
    }
    return value;
  }

  // Untracked read with the same checks as Read.
  template <typename T>
  [[nodiscard]] auto Peek(AtomHandle handle) -> const T& {
    return CheckedValue<T>(RequireLive(handle, "read"));
  }

  // Untracked read returning nullptr on a disposed handle.
  template <typename T>
  [[nodiscard]] auto TryPeek(AtomHandle handle) -> const T* {
    Slot* slot = LiveSlot(handle);
    if (slot == nullptr) {
      return nullptr;
    }
    return &CheckedValue<T>(*slot);
  }

  // Replaces the value. Equality-comparable values equal to the current one
  // are not written and notify nobody; other types always count as changed.
  template <typename T>
  auto Write(AtomHandle handle, T value) -> WriteOutcome {
    Slot* slot = LiveSlot(handle);
    if (slot == nullptr) {
      ReportStale(handle);
      return WriteOutcome::kStale;
    }
    T& current = CheckedValue<T>(*slot);
    if constexpr (std::equality_comparable<T>) {
      if (current == value) {
        return WriteOutcome::kUnchanged;
      }
    }
    current = std::move(value);
    Notify(handle);
    return WriteOutcome::kChanged;
  }

  // Replaces the value without notifying subscribers.
  template <typename T>
  auto WriteSilently(AtomHandle handle, T value) -> WriteOutcome {
    Slot* slot = LiveSlot(handle);
    if (slot == nullptr) {
      ReportStale(handle);
      return WriteOutcome::kStale;
    }
    CheckedValue<T>(*slot) = std::move(value);
    return WriteOutcome::kSilent;
  }

  // Mutates the value in place and notifies. Always treated as a change.
  template <typename T, typename F>
  auto Update(AtomHandle handle, F&& fn) -> WriteOutcome {
    Slot* slot = LiveSlot(handle);
    if (slot == nullptr) {
      ReportStale(handle);
      return WriteOutcome::kStale;
    }
    std::forward<F>(fn)(CheckedValue<T>(*slot));
    Notify(handle);
    return WriteOutcome::kChanged;
  }

  // Re-runs the initializer given at creation and notifies. Atoms created
  // without one are left untouched (returns kUnchanged).
  auto ResetToDefault(AtomHandle handle) -> WriteOutcome;

  // Drops the value and subscribers and invalidates every handle to the
  // atom. Returns false if the handle was already stale.
  auto Dispose(AtomHandle handle) -> bool;

  // Disposes every atom whose scope is owned by `owner`. Returns the count.
  auto DisposeOwnedBy(const CallId& owner) -> size_t;

  [[nodiscard]] auto IsLive(AtomHandle handle) const -> bool;

  [[nodiscard]] auto NameOf(AtomHandle handle) const -> std::string;

  // Subscribers in CallId order. Empty for stale handles.
  [[nodiscard]] auto SubscribersOf(AtomHandle handle) const
      -> std::vector<CallId>;

  // Stale handles are ignored by both.
  void Subscribe(AtomHandle handle, const CallId& subscriber);
  void Unsubscribe(AtomHandle handle, const CallId& subscriber);

  [[nodiscard]] auto LiveCount() const -> size_t {
    return live_count_;
  }

 private:
  using Initializer = std::function<std::unique_ptr<ErasedValue>()>;

  struct Slot {
    uint32_t generation = 0;
    bool live = false;
    std::string name;
    std::optional<CallId> owner;
    std::unique_ptr<ErasedValue> value;
    Initializer initializer;
    absl::btree_set<CallId> subscribers;
  };

  auto Allocate(
      std::unique_ptr<ErasedValue> value, AtomScope scope, std::string name,
      Initializer initializer) -> AtomHandle;
  auto LiveSlot(AtomHandle handle) -> Slot*;
  [[nodiscard]] auto LiveSlot(AtomHandle handle) const -> const Slot*;
  auto RequireLive(AtomHandle handle, const char* operation) -> Slot&;
  [[nodiscard]] auto Describe(AtomHandle handle) const -> std::string;
  void Notify(AtomHandle handle);
  void ReportStale(AtomHandle handle);

  template <typename T>
  auto CheckedValue(Slot& slot) -> T& {
    T* value = slot.value->template As<T>();
    if (value == nullptr) {
      throw TypeMismatchError(
          slot.name.empty() ? "atom" : "atom '" + slot.name + "'",
          slot.value->Tag().Name(), common::TypeTag::Of<T>().Name());
    }
    return *value;
  }

  std::vector<Slot> slots_;
  std::vector<uint32_t> free_list_;
  size_t live_count_ = 0;
  absl::flat_hash_map<std::string, AtomHandle> by_name_;
  absl::flat_hash_map<CallId, std::vector<AtomHandle>> owned_;

  DependencyTracker* tracker_ = nullptr;
  ChangeListener change_listener_;
  StaleWriteListener stale_listener_;
};

}  // namespace tether::runtime
