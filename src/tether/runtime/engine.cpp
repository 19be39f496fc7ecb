#include "tether/runtime/engine.hpp"

#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/cleanup/cleanup.h"
#include "tether/common/diagnostic.hpp"
#include "tether/common/log.hpp"
#include "tether/config/engine_config.hpp"
#include "tether/runtime/call_id.hpp"
#include "tether/runtime/engine_error.hpp"
#include "tether/runtime/lifecycle_sweeper.hpp"

namespace tether::runtime {

Engine::Engine(config::EngineOptions options)
    : options_(std::move(options)),
      tracker_(atoms_),
      scheduler_(options_.max_reentrant_rounds),
      sweeper_(options_.sweep_grace_passes) {
  common::SetLogLevel(options_.log_level);
  trace_manager_.SetEnabled(options_.enable_trace);

  atoms_.SetTracker(&tracker_);
  atoms_.SetChangeListener(
      [this](AtomHandle atom, const std::vector<CallId>& subscribers) {
        OnAtomChanged(atom, subscribers);
      });
  atoms_.SetStaleWriteListener([this](AtomHandle atom) { OnStaleWrite(atom); });

  // kRootComponent gets its render callback from RunPass.
  units_.push_back(std::make_unique<Unit>(Unit{.name = "root"}));
}

// ============================================================================
// Phases
// ============================================================================

void Engine::RunPass(RenderFn root_render) {
  RunPhase([&] {
    Unit& root = *units_[kRootComponent];
    root.render = std::move(root_render);
    root.live = true;
    scheduler_.Enqueue(kRootComponent);
  });
}

void Engine::Dispatch(const std::function<void()>& handler) {
  RunPhase([&] {
    if (handler) {
      handler();
    }
  });
}

void Engine::RunPhase(const std::function<void()>& body) {
  if (in_phase_) {
    throw EngineError(
        ErrorKind::kNestedPhase,
        std::format("phase {} is still running", pass_count_));
  }
  in_phase_ = true;
  ++pass_count_;
  trace_manager_.EmitPassBegin(pass_count_);
  common::Logger().debug("phase {} begin", pass_count_);

  try {
    body();
    FlushPending();
  } catch (...) {
    AbortPhase();
    throw;
  }

  in_phase_ = false;
}

void Engine::AbortPhase() {
  common::Logger().debug("phase {} aborted", pass_count_);
  tracker_.Abort();
  scheduler_.Clear();
  sweeper_.AbortRenders();
  allocator_.Reset();
  effects_.clear();
  reaction_stack_.clear();
  for (auto& unit : units_) {
    unit->rendering = false;
    // A unit that asked to unmount during the failed render stops receiving
    // work; its state is dropped with the next Unmount call.
    if (unit->unmount_requested) {
      unit->live = false;
      unit->unmount_requested = false;
    }
  }
  in_phase_ = false;
}

void Engine::FlushPending() {
  scheduler_.Flush(
      [this](ComponentId component) {
        RenderUnit(component, scheduler_.RoundsInLastFlush());
      },
      [this](ComponentId component) { return IsUnitLive(component); },
      [this](ComponentId component) { return UnitName(component); });
}

// ============================================================================
// Units
// ============================================================================

auto Engine::Mount(std::string name, RenderFn render) -> ComponentId {
  ComponentId id =
      AddUnit(std::move(name), UnitKind::kComponent, std::move(render));
  WithinPhase([&] { scheduler_.Enqueue(id); });
  return id;
}

void Engine::Unmount(ComponentId component) {
  Unit& unit = RequireUnit(component);
  if (unit.rendering) {
    unit.unmount_requested = true;
    return;
  }
  // Units that lost liveness in an aborted phase still hold state.
  if (!unit.live && sweeper_.LiveCount(component) == 0 &&
      !unit.output.IsValid()) {
    return;
  }
  WithinPhase([&] { DropUnit(component); });
}

auto Engine::IsMounted(ComponentId component) const -> bool {
  return IsUnitLive(component);
}

void Engine::RequestRender(ComponentId component) {
  Unit& unit = RequireUnit(component);
  if (!unit.live) {
    common::Logger().debug(
        "render request for unmounted unit '{}' ignored", unit.name);
    return;
  }
  if (unit.kind == UnitKind::kReaction) {
    WithinPhase([&] { RecomputeReaction(component); });
    return;
  }
  WithinPhase([&] { scheduler_.Enqueue(component); });
}

auto Engine::UnitName(ComponentId component) const -> std::string {
  if (component >= units_.size()) {
    return std::format("#{}", component);
  }
  return units_[component]->name;
}

auto Engine::AddUnit(std::string name, UnitKind kind, RenderFn render)
    -> ComponentId {
  auto id = static_cast<ComponentId>(units_.size());
  units_.push_back(
      std::make_unique<Unit>(
          Unit{
              .name = std::move(name),
              .kind = kind,
              .render = std::move(render),
              .live = true,
          }));
  return id;
}

auto Engine::RequireUnit(ComponentId component) -> Unit& {
  if (component >= units_.size()) {
    throw EngineError(
        ErrorKind::kUnknownComponent,
        std::format(
            "unit {} was never mounted (have {} units)", component,
            units_.size()));
  }
  return *units_[component];
}

auto Engine::IsUnitLive(ComponentId component) const -> bool {
  return component < units_.size() && units_[component]->live;
}

void Engine::RenderUnit(ComponentId component, uint32_t round) {
  Unit& unit = *units_[component];
  CallId root = CallId::ForRoot(component);
  common::Logger().debug(
      "render '{}' (unit {}, round {})", unit.name, component, round);
  trace_manager_.EmitComponentRender(component, round);

  sweeper_.BeginRender(component);
  unit.rendering = true;
  tracker_.Begin(root);
  {
    // A throwing render keeps its committed edges and the identities it
    // reached; the error may be caught by an enclosing render.
    absl::Cleanup abandon = [&] {
      tracker_.Discard(root);
      sweeper_.AbandonRender(component);
      unit.rendering = false;
    };
    {
      auto guard = allocator_.EnterRoot(component);
      unit.render(*this);
    }
    tracker_.End(root);
    std::move(abandon).Cancel();
  }
  unit.rendering = false;

  SweepResult sweep = sweeper_.EndRender(component);
  if (!sweep.evicted.empty()) {
    if (sweep.visited != sweep.previously_visited) {
      diagnostics_.Report(
          Diagnostic::IdentityDrift(
              std::format(
                  "unit '{}' reached {} identities (previously {}); "
                  "evicting {}",
                  unit.name, sweep.visited, sweep.previously_visited,
                  sweep.evicted.size())));
    }
    for (const auto& id : sweep.evicted) {
      EvictIdentity(id);
    }
  }

  RunQueuedEffects(component);

  if (unit.unmount_requested) {
    DropUnit(component);
  }
}

void Engine::DropUnit(ComponentId component) {
  Unit& unit = *units_[component];
  unit.live = false;
  unit.unmount_requested = false;
  common::Logger().debug("unmount '{}' (unit {})", unit.name, component);

  for (const auto& id : sweeper_.EvictAll(component)) {
    EvictIdentity(id);
  }
  CallId root = CallId::ForRoot(component);
  tracker_.Forget(root);
  atoms_.DisposeOwnedBy(root);
  effects_.erase(component);

  if (unit.kind == UnitKind::kReaction) {
    if (unit.output.IsValid()) {
      atoms_.Dispose(unit.output);
      unit.output = AtomHandle{};
    }
    reactions_by_name_.erase(unit.name);
  }
  unit.render = nullptr;
}

void Engine::EvictIdentity(const CallId& id) {
  if (auto cleanup = TakeCleanup(id)) {
    cleanup();
  }
  store_.Remove(id);
  tracker_.Forget(id);
  atoms_.DisposeOwnedBy(id);
  trace_manager_.EmitIdentityEvicted(id.ToString());
  common::Logger().debug("evicted {}", id.ToString());
}

// ============================================================================
// Identity
// ============================================================================

auto Engine::NextId() -> CallId {
  CallId id = allocator_.NextId();
  sweeper_.Visit(id);
  return id;
}

auto Engine::EnterScope() -> ScopeGuard {
  auto guard = allocator_.EnterScope();
  sweeper_.Visit(allocator_.CurrentScope());
  return guard;
}

auto Engine::CurrentScope() const -> const CallId& {
  return allocator_.CurrentScope();
}

// ============================================================================
// Atoms and effects
// ============================================================================

auto Engine::ResetAtom(AtomHandle atom) -> WriteOutcome {
  return WithinPhase(
      [&] { return TraceWrite(atom, atoms_.ResetToDefault(atom)); });
}

auto Engine::DisposeAtom(AtomHandle atom) -> bool {
  return atoms_.Dispose(atom);
}

auto Engine::TraceWrite(AtomHandle atom, WriteOutcome outcome)
    -> WriteOutcome {
  if (outcome == WriteOutcome::kChanged ||
      outcome == WriteOutcome::kUnchanged) {
    trace_manager_.EmitAtomWrite(atom.index, outcome == WriteOutcome::kChanged);
  }
  return outcome;
}

void Engine::OnStaleWrite(AtomHandle atom) {
  trace_manager_.EmitStaleWrite(atom.index);
  diagnostics_.Report(
      Diagnostic::StaleHandleWrite(
          std::format(
              "write to disposed atom #{}.{} dropped", atom.index,
              atom.generation)));
}

void Engine::RegisterEffect(const CallId& identity, CleanupFn cleanup) {
  if (!cleanup) {
    cleanups_.erase(identity);
    return;
  }
  cleanups_.insert_or_assign(identity, std::move(cleanup));
}

auto Engine::TakeCleanup(const CallId& identity) -> CleanupFn {
  auto it = cleanups_.find(identity);
  if (it == cleanups_.end()) {
    return nullptr;
  }
  CleanupFn cleanup = std::move(it->second);
  cleanups_.erase(it);
  return cleanup;
}

void Engine::QueueEffect(ComponentId unit, EffectFn effect) {
  effects_[unit].push_back(std::move(effect));
}

void Engine::RunQueuedEffects(ComponentId component) {
  auto it = effects_.find(component);
  if (it == effects_.end()) {
    return;
  }
  std::vector<EffectFn> effects = std::move(it->second);
  effects_.erase(it);
  for (auto& effect : effects) {
    effect();
  }
}

// ============================================================================
// History
// ============================================================================

auto Engine::Undo() -> bool {
  return WithinPhase([&] { return history_.Undo(); });
}

auto Engine::Redo() -> bool {
  return WithinPhase([&] { return history_.Redo(); });
}

void Engine::TravelTo(size_t cursor) {
  WithinPhase([&] { history_.TravelTo(cursor); });
}

}  // namespace tether::runtime
