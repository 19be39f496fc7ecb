#include "tether/runtime/identity_allocator.hpp"

#include <cstddef>
#include <format>
#include <utility>

#include "tether/runtime/call_id.hpp"
#include "tether/runtime/engine_error.hpp"

namespace tether::runtime {

ScopeGuard::ScopeGuard(ScopeGuard&& other) noexcept
    : allocator_(std::exchange(other.allocator_, nullptr)),
      kind_(other.kind_),
      restore_depth_(other.restore_depth_) {
}

ScopeGuard::~ScopeGuard() {
  Release();
}

void ScopeGuard::Release() noexcept {
  if (allocator_ == nullptr) {
    return;
  }
  switch (kind_) {
    case Kind::kScope:
      allocator_->PopTo(restore_depth_);
      break;
    case Kind::kRoot:
      allocator_->RestoreSaved();
      break;
  }
  allocator_ = nullptr;
}

auto IdentityAllocator::EnterRoot(ComponentId root) -> ScopeGuard {
  saved_.push_back(std::move(levels_));
  levels_.clear();
  levels_.push_back(Level{.scope = CallId::ForRoot(root), .next_slot = 0});
  return ScopeGuard(this, ScopeGuard::Kind::kRoot, 0);
}

auto IdentityAllocator::EnterScope() -> ScopeGuard {
  RequireActive("EnterScope");
  size_t restore_depth = levels_.size();
  CallId scope = NextId();
  levels_.push_back(Level{.scope = std::move(scope), .next_slot = 0});
  return ScopeGuard(this, ScopeGuard::Kind::kScope, restore_depth);
}

auto IdentityAllocator::NextId() -> CallId {
  RequireActive("NextId");
  auto& level = levels_.back();
  return level.scope.Child(level.next_slot++);
}

auto IdentityAllocator::CurrentScope() const -> const CallId& {
  RequireActive("CurrentScope");
  return levels_.back().scope;
}

void IdentityAllocator::Reset() {
  levels_.clear();
  saved_.clear();
}

void IdentityAllocator::PopTo(size_t depth) noexcept {
  if (levels_.size() > depth) {
    levels_.resize(depth);
  }
}

void IdentityAllocator::RestoreSaved() noexcept {
  if (saved_.empty()) {
    levels_.clear();
    return;
  }
  levels_ = std::move(saved_.back());
  saved_.pop_back();
}

void IdentityAllocator::RequireActive(const char* operation) const {
  if (levels_.empty()) {
    throw EngineError(
        ErrorKind::kNoActiveRender,
        std::format(
            "IdentityAllocator::{} called outside a component render; hooks "
            "may only run inside a render callback",
            operation));
  }
}

}  // namespace tether::runtime
