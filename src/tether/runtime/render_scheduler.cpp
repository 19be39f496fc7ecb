#include "tether/runtime/render_scheduler.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "tether/common/internal_error.hpp"
#include "tether/common/log.hpp"
#include "tether/runtime/engine_error.hpp"

namespace tether::runtime {

auto SchedulerStateName(SchedulerState state) -> const char* {
  switch (state) {
    case SchedulerState::kIdle:
      return "idle";
    case SchedulerState::kCollecting:
      return "collecting";
    case SchedulerState::kFlushing:
      return "flushing";
  }
  return "";
}

void RenderScheduler::Enqueue(ComponentId component) {
  if (state_ == SchedulerState::kFlushing &&
      waiting_in_round_.contains(component)) {
    return;
  }
  if (pending_set_.insert(component).second) {
    pending_.push_back(component);
  }
  if (state_ == SchedulerState::kIdle) {
    state_ = SchedulerState::kCollecting;
  }
}

void RenderScheduler::Flush(
    const RenderCallback& render, const LivenessCheck& is_live,
    const NameLookup& name_of) {
  if (state_ == SchedulerState::kFlushing) {
    throw common::InternalError(
        "RenderScheduler::Flush", "flush started while already flushing");
  }
  state_ = SchedulerState::kFlushing;
  rounds_in_last_flush_ = 0;

  // Units rendered by rounds after the first; reported if the cap is hit.
  std::vector<std::string> chain;

  try {
    while (!pending_.empty()) {
      if (rounds_in_last_flush_ == max_rounds_) {
        for (ComponentId component : pending_) {
          chain.push_back(name_of(component));
        }
        throw TooManyReentrantUpdatesError(rounds_in_last_flush_, chain);
      }
      ++rounds_in_last_flush_;

      std::vector<ComponentId> batch = std::move(pending_);
      pending_.clear();
      pending_set_.clear();
      waiting_in_round_.insert(batch.begin(), batch.end());

      for (ComponentId component : batch) {
        waiting_in_round_.erase(component);
        if (!is_live(component)) {
          ++skipped_stale_tasks_;
          continue;
        }
        if (rounds_in_last_flush_ > 1) {
          chain.push_back(name_of(component));
        }
        ++total_renders_;
        render(component);
      }
    }
  } catch (...) {
    Clear();
    throw;
  }

  common::Logger().debug(
      "flush settled after {} round(s)", rounds_in_last_flush_);
  waiting_in_round_.clear();
  state_ = SchedulerState::kIdle;
}

void RenderScheduler::Clear() {
  pending_.clear();
  pending_set_.clear();
  waiting_in_round_.clear();
  state_ = SchedulerState::kIdle;
}

}  // namespace tether::runtime
