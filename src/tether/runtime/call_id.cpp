#include "tether/runtime/call_id.hpp"

#include <algorithm>
#include <string>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "tether/common/internal_error.hpp"

namespace tether::runtime {

auto CallId::Root() const -> ComponentId {
  if (path_.empty()) {
    throw common::InternalError("CallId::Root", "empty call id");
  }
  return path_.front();
}

auto CallId::Parent() const -> CallId {
  if (path_.size() <= 1) {
    throw common::InternalError(
        "CallId::Parent", "root or empty call id has no parent");
  }
  CallId parent = *this;
  parent.path_.pop_back();
  return parent;
}

auto CallId::IsAncestorOf(const CallId& other) const -> bool {
  if (path_.size() >= other.path_.size()) {
    return false;
  }
  return std::equal(path_.begin(), path_.end(), other.path_.begin());
}

auto CallId::ToString() const -> std::string {
  return fmt::format("{}", fmt::join(path_, "/"));
}

}  // namespace tether::runtime
