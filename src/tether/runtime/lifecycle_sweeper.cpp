#include "tether/runtime/lifecycle_sweeper.hpp"

#include <algorithm>
#include <cstddef>
#include <format>
#include <vector>

#include "tether/common/internal_error.hpp"
#include "tether/runtime/call_id.hpp"

namespace tether::runtime {

void LifecycleSweeper::BeginRender(ComponentId root) {
  auto& state = roots_[root];
  if (state.rendering) {
    throw common::InternalError(
        "LifecycleSweeper::BeginRender",
        std::format("unit {} is already rendering", root));
  }
  state.rendering = true;
  state.visited.clear();
}

void LifecycleSweeper::Visit(const CallId& id) {
  auto it = roots_.find(id.Root());
  if (it == roots_.end() || !it->second.rendering) {
    throw common::InternalError(
        "LifecycleSweeper::Visit",
        std::format("{} visited outside a render of its unit", id.ToString()));
  }
  it->second.visited.insert(id);
}

auto LifecycleSweeper::EndRender(ComponentId root) -> SweepResult {
  auto it = roots_.find(root);
  if (it == roots_.end() || !it->second.rendering) {
    throw common::InternalError(
        "LifecycleSweeper::EndRender",
        std::format("unit {} is not rendering", root));
  }
  auto& state = it->second;

  SweepResult result;
  result.visited = state.visited.size();
  result.previously_visited = state.last_visited;

  for (auto& [id, misses] : state.live) {
    if (state.visited.contains(id)) {
      misses = 0;
    } else if (++misses > grace_passes_) {
      result.evicted.push_back(id);
    }
  }
  for (const auto& id : result.evicted) {
    state.live.erase(id);
  }
  for (const auto& id : state.visited) {
    state.live.try_emplace(id, 0);
  }
  std::ranges::sort(result.evicted);

  state.last_visited = state.visited.size();
  state.visited.clear();
  state.rendering = false;
  return result;
}

auto LifecycleSweeper::EvictAll(ComponentId root) -> std::vector<CallId> {
  std::vector<CallId> evicted;
  auto it = roots_.find(root);
  if (it == roots_.end()) {
    return evicted;
  }
  evicted.reserve(it->second.live.size());
  for (const auto& [id, misses] : it->second.live) {
    evicted.push_back(id);
  }
  roots_.erase(it);
  std::ranges::sort(evicted);
  return evicted;
}

void LifecycleSweeper::AbandonRender(ComponentId root) noexcept {
  auto it = roots_.find(root);
  if (it == roots_.end() || !it->second.rendering) {
    return;
  }
  KeepVisited(it->second);
}

void LifecycleSweeper::AbortRenders() noexcept {
  for (auto& [root, state] : roots_) {
    if (state.rendering) {
      KeepVisited(state);
    }
  }
}

void LifecycleSweeper::KeepVisited(RootState& state) noexcept {
  for (const auto& id : state.visited) {
    state.live.insert_or_assign(id, 0);
  }
  state.visited.clear();
  state.rendering = false;
}

auto LifecycleSweeper::IsRendering(ComponentId root) const -> bool {
  auto it = roots_.find(root);
  return it != roots_.end() && it->second.rendering;
}

auto LifecycleSweeper::IsLive(const CallId& id) const -> bool {
  if (id.IsEmpty()) {
    return false;
  }
  auto it = roots_.find(id.Root());
  return it != roots_.end() && it->second.live.contains(id);
}

auto LifecycleSweeper::LiveCount(ComponentId root) const -> size_t {
  auto it = roots_.find(root);
  if (it == roots_.end()) {
    return 0;
  }
  return it->second.live.size();
}

}  // namespace tether::runtime
