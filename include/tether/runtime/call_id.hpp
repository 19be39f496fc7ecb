#pragma once

#include <algorithm>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>

#include "absl/container/inlined_vector.h"
#include "tether/runtime/engine_types.hpp"

namespace tether::runtime {

// Positional identity of a hook call: the path of sibling indices from the
// unit's root scope down to the call. Path element 0 is the ComponentId of
// the unit that rendered it.
//
// Two calls get the same CallId across renders only if the call structure
// leading to them (branches taken, loop trip counts) is unchanged.
class CallId {
 public:
  CallId() = default;

  static auto ForRoot(ComponentId root) -> CallId {
    CallId id;
    id.path_.push_back(root);
    return id;
  }

  [[nodiscard]] auto Child(uint32_t slot) const -> CallId {
    CallId id = *this;
    id.path_.push_back(slot);
    return id;
  }

  // Throws InternalError on an empty id.
  [[nodiscard]] auto Root() const -> ComponentId;
  [[nodiscard]] auto Parent() const -> CallId;

  [[nodiscard]] auto IsEmpty() const -> bool {
    return path_.empty();
  }
  [[nodiscard]] auto Depth() const -> size_t {
    return path_.size();
  }
  [[nodiscard]] auto Path() const -> std::span<const uint32_t> {
    return {path_.data(), path_.size()};
  }

  // True if this id is a strict prefix of `other`.
  [[nodiscard]] auto IsAncestorOf(const CallId& other) const -> bool;

  // Slash separated form, e.g. "1/0/3".
  [[nodiscard]] auto ToString() const -> std::string;

  auto operator==(const CallId& other) const -> bool {
    return path_ == other.path_;
  }
  // Lexicographic over the path, so a scope sorts before its children.
  auto operator<=>(const CallId& other) const -> std::strong_ordering {
    return std::lexicographical_compare_three_way(
        path_.begin(), path_.end(), other.path_.begin(), other.path_.end());
  }

  template <typename H>
  friend auto AbslHashValue(H h, const CallId& id) -> H {
    return H::combine(std::move(h), id.path_);
  }

 private:
  absl::InlinedVector<uint32_t, 6> path_;
};

}  // namespace tether::runtime
