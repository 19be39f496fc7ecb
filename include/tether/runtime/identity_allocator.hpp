#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "tether/runtime/call_id.hpp"
#include "tether/runtime/engine_types.hpp"

namespace tether::runtime {

class IdentityAllocator;

// Pops the scope (or restores the allocator state saved by EnterRoot) when
// destroyed, so every exit path, including exceptions, keeps the stack
// discipline. Move-only.
class ScopeGuard {
 public:
  ScopeGuard(ScopeGuard&& other) noexcept;
  ~ScopeGuard();

  ScopeGuard(const ScopeGuard&) = delete;
  auto operator=(const ScopeGuard&) -> ScopeGuard& = delete;
  auto operator=(ScopeGuard&&) -> ScopeGuard& = delete;

  // Pops now instead of at destruction. Idempotent.
  void Release() noexcept;

 private:
  friend class IdentityAllocator;

  enum class Kind : uint8_t { kScope, kRoot };

  ScopeGuard(IdentityAllocator* allocator, Kind kind, size_t restore_depth)
      : allocator_(allocator), kind_(kind), restore_depth_(restore_depth) {
  }

  IdentityAllocator* allocator_;
  Kind kind_;
  size_t restore_depth_;
};

// Topological identity allocator.
//
// Keeps a stack of nesting levels. Each level is a scope CallId plus the
// counter of sibling slots handed out inside it. NextId() returns
// scope + [counter++]; EnterScope() consumes a slot the same way and makes it
// the new innermost scope with a zeroed counter.
//
// Identities are stable across renders only if hooks and scopes are entered
// in the same order with the same nesting every time.
class IdentityAllocator {
 public:
  IdentityAllocator() = default;

  IdentityAllocator(const IdentityAllocator&) = delete;
  auto operator=(const IdentityAllocator&) -> IdentityAllocator& = delete;
  IdentityAllocator(IdentityAllocator&&) = delete;
  auto operator=(IdentityAllocator&&) -> IdentityAllocator& = delete;

  // Starts a fresh stack rooted at [root]. The previous stack (if a render of
  // another unit is in progress) is restored when the guard is released.
  [[nodiscard]] auto EnterRoot(ComponentId root) -> ScopeGuard;

  // Pushes a nesting level. Throws EngineError(kNoActiveRender) when no root
  // is active.
  [[nodiscard]] auto EnterScope() -> ScopeGuard;

  // Next identity at the current level. Throws EngineError(kNoActiveRender)
  // when no root is active.
  [[nodiscard]] auto NextId() -> CallId;

  [[nodiscard]] auto IsActive() const -> bool {
    return !levels_.empty();
  }

  // Innermost scope. Throws EngineError(kNoActiveRender) when inactive.
  [[nodiscard]] auto CurrentScope() const -> const CallId&;

  // Number of open levels, including the root level.
  [[nodiscard]] auto Depth() const -> size_t {
    return levels_.size();
  }

  // Drops every level and saved stack. Only used after a fatal error.
  void Reset();

 private:
  friend class ScopeGuard;

  struct Level {
    CallId scope;
    uint32_t next_slot = 0;
  };

  void PopTo(size_t depth) noexcept;
  void RestoreSaved() noexcept;
  void RequireActive(const char* operation) const;

  std::vector<Level> levels_;
  std::vector<std::vector<Level>> saved_;
};

}  // namespace tether::runtime
