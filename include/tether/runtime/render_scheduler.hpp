#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "tether/runtime/engine_types.hpp"

namespace tether::runtime {

// Idle -> Collecting -> Flushing -> Idle.
enum class SchedulerState : uint8_t {
  kIdle,        // Nothing pending
  kCollecting,  // Writes of the current phase are queueing render tasks
  kFlushing,    // Pending components are being re-rendered
};

auto SchedulerStateName(SchedulerState state) -> const char*;

inline constexpr uint32_t kDefaultMaxReentrantRounds = 10;

// Queues and batches re-render requests.
//
// Requests are deduplicated in insertion order, so any number of writes that
// touch a component within one phase produce a single render. Flush() renders
// each pending component once per round; writes made while flushing (effects,
// renders writing atoms) queue a follow-up round. A component still waiting
// in the current round is not queued again. Rounds are capped to fail fast on
// write cycles.
class RenderScheduler {
 public:
  using RenderCallback = std::function<void(ComponentId component)>;
  using LivenessCheck = std::function<bool(ComponentId component)>;
  using NameLookup = std::function<std::string(ComponentId component)>;

  explicit RenderScheduler(uint32_t max_rounds = kDefaultMaxReentrantRounds)
      : max_rounds_(max_rounds) {
  }

  RenderScheduler(const RenderScheduler&) = delete;
  auto operator=(const RenderScheduler&) -> RenderScheduler& = delete;
  RenderScheduler(RenderScheduler&&) = delete;
  auto operator=(RenderScheduler&&) -> RenderScheduler& = delete;

  void Enqueue(ComponentId component);

  // Renders until nothing is pending. Components for which `is_live` returns
  // false are skipped (unmounted since the request). Throws
  // TooManyReentrantUpdatesError when work is still pending after
  // max_rounds rounds; the pending set is discarded and the scheduler is
  // back to Idle whenever Flush exits, normally or not.
  void Flush(
      const RenderCallback& render, const LivenessCheck& is_live,
      const NameLookup& name_of);

  // Drops pending work and returns to Idle.
  void Clear();

  [[nodiscard]] auto State() const -> SchedulerState {
    return state_;
  }
  [[nodiscard]] auto HasPending() const -> bool {
    return !pending_.empty();
  }
  [[nodiscard]] auto Pending() const -> std::span<const ComponentId> {
    return pending_;
  }
  [[nodiscard]] auto IsPending(ComponentId component) const -> bool {
    return pending_set_.contains(component);
  }

  [[nodiscard]] auto MaxRounds() const -> uint32_t {
    return max_rounds_;
  }
  void SetMaxRounds(uint32_t max_rounds) {
    max_rounds_ = max_rounds;
  }

  [[nodiscard]] auto RoundsInLastFlush() const -> uint32_t {
    return rounds_in_last_flush_;
  }
  [[nodiscard]] auto TotalRenders() const -> size_t {
    return total_renders_;
  }
  [[nodiscard]] auto SkippedStaleTasks() const -> size_t {
    return skipped_stale_tasks_;
  }

 private:
  uint32_t max_rounds_;
  SchedulerState state_ = SchedulerState::kIdle;

  std::vector<ComponentId> pending_;
  absl::flat_hash_set<ComponentId> pending_set_;

  // Components of the round being flushed that have not rendered yet.
  absl::flat_hash_set<ComponentId> waiting_in_round_;

  uint32_t rounds_in_last_flush_ = 0;
  size_t total_renders_ = 0;
  size_t skipped_stale_tasks_ = 0;
};

}  // namespace tether::runtime
