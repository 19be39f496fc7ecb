#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/cleanup/cleanup.h"
#include "absl/container/flat_hash_set.h"
#include "absl/container/inlined_vector.h"
#include "absl/strings/string_view.h"
#include "tether/common/log.hpp"
#include "tether/runtime/call_id.hpp"
#include "tether/runtime/engine.hpp"
#include "tether/runtime/engine_error.hpp"

namespace tether::runtime {

// Routes a changed atom to the units that read it. Components are queued on
// the scheduler; reactions recompute right away so their readers see the
// new value in the same phase.
void Engine::OnAtomChanged(
    AtomHandle /*atom*/, const std::vector<CallId>& subscribers) {
  absl::InlinedVector<ComponentId, 4> affected;
  absl::flat_hash_set<ComponentId> seen;
  for (const auto& subscriber : subscribers) {
    ComponentId unit = subscriber.Root();
    if (seen.insert(unit).second) {
      affected.push_back(unit);
    }
  }

  for (ComponentId unit : affected) {
    if (!IsUnitLive(unit)) {
      continue;
    }
    if (units_[unit]->kind == UnitKind::kReaction) {
      RecomputeReaction(unit);
    } else {
      scheduler_.Enqueue(unit);
    }
  }
}

auto Engine::DefineReaction(
    std::string_view name, RenderFn compute, bool start_suspended)
    -> ComponentId {
  if (auto it = reactions_by_name_.find(
          absl::string_view(name.data(), name.size()));
      it != reactions_by_name_.end() && IsUnitLive(it->second)) {
    return it->second;
  }
  ComponentId id =
      AddUnit(std::string(name), UnitKind::kReaction, std::move(compute));
  reactions_by_name_.insert_or_assign(std::string(name), id);
  if (start_suspended) {
    common::Logger().debug("reaction '{}' defined suspended", name);
    return id;
  }
  WithinPhase([&] { RecomputeReaction(id); });
  return id;
}

auto Engine::ReactionOutput(ComponentId reaction) -> AtomHandle {
  Unit& unit = RequireReaction(reaction);
  if (unit.live && !unit.output.IsValid()) {
    WithinPhase([&] { RecomputeReaction(reaction); });
  }
  return unit.output;
}

auto Engine::IsSuspended(ComponentId reaction) const -> bool {
  return IsUnitLive(reaction) &&
         units_[reaction]->kind == UnitKind::kReaction &&
         !units_[reaction]->output.IsValid();
}

void Engine::ForceRecompute(ComponentId reaction) {
  Unit& unit = RequireReaction(reaction);
  if (!unit.live) {
    return;
  }
  WithinPhase([&] { RecomputeReaction(reaction); });
}

void Engine::RecomputeReaction(ComponentId reaction) {
  Unit& unit = *units_[reaction];
  if (!unit.live) {
    return;
  }
  // A reaction invalidated by its own compute never settles.
  if (unit.rendering ||
      reaction_stack_.size() >= options_.max_reaction_depth) {
    throw TooManyReentrantUpdatesError(
        static_cast<uint32_t>(reaction_stack_.size()),
        ReactionChain(reaction));
  }

  reaction_stack_.push_back(reaction);
  {
    absl::Cleanup pop = [this] { reaction_stack_.pop_back(); };
    RenderUnit(reaction, 0);
  }

  if (!unit.output.IsValid() && unit.live) {
    common::Logger().warn(
        "reaction '{}' finished without publishing a value", unit.name);
  }
}

auto Engine::RequireReaction(ComponentId reaction) -> Unit& {
  Unit& unit = RequireUnit(reaction);
  if (unit.kind != UnitKind::kReaction) {
    throw EngineError(
        ErrorKind::kUnknownComponent,
        std::format("unit '{}' is not a reaction", unit.name));
  }
  return unit;
}

auto Engine::RenderingReaction() -> Unit& {
  if (allocator_.IsActive()) {
    Unit& unit = *units_[allocator_.CurrentScope().Root()];
    if (unit.kind == UnitKind::kReaction && unit.rendering) {
      return unit;
    }
  }
  throw EngineError(
      ErrorKind::kNoActiveRender,
      "reaction value published outside a reaction compute");
}

auto Engine::ReactionChain(ComponentId last) const
    -> std::vector<std::string> {
  std::vector<std::string> chain;
  chain.reserve(reaction_stack_.size() + 1);
  for (ComponentId unit : reaction_stack_) {
    chain.push_back(UnitName(unit));
  }
  chain.push_back(UnitName(last));
  return chain;
}

}  // namespace tether::runtime
