#include "tether/runtime/dependency_tracker.hpp"

#include <format>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "tether/common/internal_error.hpp"
#include "tether/runtime/atom_registry.hpp"
#include "tether/runtime/call_id.hpp"

namespace tether::runtime {

void DependencyTracker::Begin(const CallId& identity) {
  frames_.push_back(Frame{.identity = identity, .reads = {}, .seen = {}});
}

void DependencyTracker::Record(AtomHandle atom) {
  if (frames_.empty()) {
    return;
  }
  auto& frame = frames_.back();
  if (frame.seen.insert(atom).second) {
    frame.reads.push_back(atom);
  }
}

void DependencyTracker::End(const CallId& identity) {
  if (frames_.empty() || !(frames_.back().identity == identity)) {
    throw common::InternalError(
        "DependencyTracker::End",
        std::format(
            "frame mismatch: ending {} but innermost frame is {}",
            identity.ToString(),
            frames_.empty() ? "<none>" : frames_.back().identity.ToString()));
  }
  Frame frame = std::move(frames_.back());
  frames_.pop_back();

  auto it = committed_.find(identity);
  if (it != committed_.end()) {
    for (const auto& previous : it->second) {
      if (!frame.seen.contains(previous)) {
        atoms_.Unsubscribe(previous, identity);
      }
    }
  }
  for (const auto& atom : frame.reads) {
    atoms_.Subscribe(atom, identity);
  }

  if (frame.reads.empty()) {
    if (it != committed_.end()) {
      committed_.erase(it);
    }
    return;
  }
  committed_[identity] = std::move(frame.reads);
}

void DependencyTracker::Discard(const CallId& identity) noexcept {
  if (!frames_.empty() && frames_.back().identity == identity) {
    frames_.pop_back();
  }
}

void DependencyTracker::Forget(const CallId& identity) {
  auto it = committed_.find(identity);
  if (it == committed_.end()) {
    return;
  }
  for (const auto& atom : it->second) {
    atoms_.Unsubscribe(atom, identity);
  }
  committed_.erase(it);
}

auto DependencyTracker::CurrentIdentity() const -> const CallId* {
  if (frames_.empty()) {
    return nullptr;
  }
  return &frames_.back().identity;
}

auto DependencyTracker::DependenciesOf(const CallId& identity) const
    -> std::vector<AtomHandle> {
  auto it = committed_.find(identity);
  if (it == committed_.end()) {
    return {};
  }
  return it->second;
}

}  // namespace tether::runtime
