#include "tether/runtime/atom_registry.hpp"

#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/strings/string_view.h"
#include "tether/runtime/call_id.hpp"
#include "tether/runtime/engine_error.hpp"

namespace tether::runtime {

auto AtomRegistry::Allocate(
    std::unique_ptr<ErasedValue> value, AtomScope scope, std::string name,
    Initializer initializer) -> AtomHandle {
  uint32_t index = 0;
  if (!free_list_.empty()) {
    index = free_list_.back();
    free_list_.pop_back();
  } else {
    index = static_cast<uint32_t>(slots_.size());
    slots_.emplace_back();
  }

  auto& slot = slots_[index];
  slot.live = true;
  slot.name = std::move(name);
  slot.owner = std::move(scope.owner);
  slot.value = std::move(value);
  slot.initializer = std::move(initializer);
  slot.subscribers.clear();
  ++live_count_;

  AtomHandle handle{.index = index, .generation = slot.generation};
  if (slot.owner.has_value()) {
    owned_[*slot.owner].push_back(handle);
  }
  return handle;
}

auto AtomRegistry::Find(std::string_view name) const
    -> std::optional<AtomHandle> {
  auto it = by_name_.find(absl::string_view(name.data(), name.size()));
  if (it == by_name_.end() || !IsLive(it->second)) {
    return std::nullopt;
  }
  return it->second;
}

auto AtomRegistry::ResetToDefault(AtomHandle handle) -> WriteOutcome {
  Slot* slot = LiveSlot(handle);
  if (slot == nullptr) {
    ReportStale(handle);
    return WriteOutcome::kStale;
  }
  if (!slot->initializer) {
    return WriteOutcome::kUnchanged;
  }
  auto fresh = slot->initializer();
  // The initializer may have created atoms and reallocated slots_.
  slot = LiveSlot(handle);
  if (slot == nullptr) {
    return WriteOutcome::kStale;
  }
  slot->value = std::move(fresh);
  Notify(handle);
  return WriteOutcome::kChanged;
}

auto AtomRegistry::Dispose(AtomHandle handle) -> bool {
  Slot* slot = LiveSlot(handle);
  if (slot == nullptr) {
    return false;
  }
  if (slot->owner.has_value()) {
    auto it = owned_.find(*slot->owner);
    if (it != owned_.end()) {
      std::erase(it->second, handle);
      if (it->second.empty()) {
        owned_.erase(it);
      }
    }
  }
  slot->live = false;
  ++slot->generation;
  slot->name.clear();
  slot->owner.reset();
  slot->value.reset();
  slot->initializer = nullptr;
  slot->subscribers.clear();
  free_list_.push_back(handle.index);
  --live_count_;
  return true;
}

auto AtomRegistry::DisposeOwnedBy(const CallId& owner) -> size_t {
  auto it = owned_.find(owner);
  if (it == owned_.end()) {
    return 0;
  }
  std::vector<AtomHandle> handles = std::move(it->second);
  owned_.erase(it);

  size_t count = 0;
  for (const auto& handle : handles) {
    Slot* slot = LiveSlot(handle);
    if (slot == nullptr) {
      continue;
    }
    slot->owner.reset();
    if (Dispose(handle)) {
      ++count;
    }
  }
  return count;
}

auto AtomRegistry::IsLive(AtomHandle handle) const -> bool {
  return LiveSlot(handle) != nullptr;
}

auto AtomRegistry::NameOf(AtomHandle handle) const -> std::string {
  const Slot* slot = LiveSlot(handle);
  if (slot == nullptr) {
    return {};
  }
  return slot->name;
}

auto AtomRegistry::SubscribersOf(AtomHandle handle) const
    -> std::vector<CallId> {
  const Slot* slot = LiveSlot(handle);
  if (slot == nullptr) {
    return {};
  }
  return {slot->subscribers.begin(), slot->subscribers.end()};
}

void AtomRegistry::Subscribe(AtomHandle handle, const CallId& subscriber) {
  if (Slot* slot = LiveSlot(handle)) {
    slot->subscribers.insert(subscriber);
  }
}

void AtomRegistry::Unsubscribe(AtomHandle handle, const CallId& subscriber) {
  if (Slot* slot = LiveSlot(handle)) {
    slot->subscribers.erase(subscriber);
  }
}

auto AtomRegistry::LiveSlot(AtomHandle handle) -> Slot* {
  if (handle.index >= slots_.size()) {
    return nullptr;
  }
  auto& slot = slots_[handle.index];
  if (!slot.live || slot.generation != handle.generation) {
    return nullptr;
  }
  return &slot;
}

auto AtomRegistry::LiveSlot(AtomHandle handle) const -> const Slot* {
  if (handle.index >= slots_.size()) {
    return nullptr;
  }
  const auto& slot = slots_[handle.index];
  if (!slot.live || slot.generation != handle.generation) {
    return nullptr;
  }
  return &slot;
}

auto AtomRegistry::RequireLive(AtomHandle handle, const char* operation)
    -> Slot& {
  Slot* slot = LiveSlot(handle);
  if (slot == nullptr) {
    throw EngineError(
        ErrorKind::kStaleHandleRead,
        std::format("{} of disposed {}", operation, Describe(handle)));
  }
  return *slot;
}

auto AtomRegistry::Describe(AtomHandle handle) const -> std::string {
  return std::format("atom #{}.{}", handle.index, handle.generation);
}

void AtomRegistry::Notify(AtomHandle handle) {
  if (!change_listener_) {
    return;
  }
  // Copy: listeners re-render units, which rewrites subscriber sets.
  std::vector<CallId> subscribers = SubscribersOf(handle);
  if (subscribers.empty()) {
    return;
  }
  change_listener_(handle, subscribers);
}

void AtomRegistry::ReportStale(AtomHandle handle) {
  if (stale_listener_) {
    stale_listener_(handle);
  }
}

}  // namespace tether::runtime
