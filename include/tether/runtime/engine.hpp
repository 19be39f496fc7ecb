#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "absl/cleanup/cleanup.h"
#include "absl/container/flat_hash_map.h"
#include "tether/common/diagnostic.hpp"
#include "tether/config/engine_config.hpp"
#include "tether/runtime/atom_registry.hpp"
#include "tether/runtime/call_id.hpp"
#include "tether/runtime/dependency_tracker.hpp"
#include "tether/runtime/engine_error.hpp"
#include "tether/runtime/engine_types.hpp"
#include "tether/runtime/history.hpp"
#include "tether/runtime/identity_allocator.hpp"
#include "tether/runtime/lifecycle_sweeper.hpp"
#include "tether/runtime/render_scheduler.hpp"
#include "tether/runtime/state_store.hpp"
#include "tether/trace/trace_manager.hpp"

namespace tether::runtime {

enum class UnitKind : uint8_t {
  kComponent,  // Rendered by the scheduler, batched per phase
  kReaction,   // Derived atom, recomputed as soon as a source changes
};

// Hook-state engine: one independent instance of the state store, atom
// registry and render loop.
//
// Work happens in phases. A phase is one external event: RunPass() renders
// the root component, Dispatch() runs a handler. Writes made during a phase
// only queue render tasks; the pending components are rendered once each
// when the phase's own work is done, in further rounds if renders or effects
// write again. Writes and unmounts issued outside any phase run as a phase of
// their own.
//
// Inside a render, hooks obtain positional identities from NextId() and keep
// their state in the store under that identity. At the end of each unit
// render the sweeper evicts identities the render no longer reached.
//
// A fatal error (EngineError or anything thrown by a render callback) aborts
// the phase: scopes unwind, recording frames are dropped, pending tasks are
// discarded and the error propagates to the caller.
class Engine {
 public:
  explicit Engine(config::EngineOptions options = {});
  ~Engine() = default;

  Engine(const Engine&) = delete;
  auto operator=(const Engine&) -> Engine& = delete;
  Engine(Engine&&) = delete;
  auto operator=(Engine&&) -> Engine& = delete;

  // Phases. Both throw EngineError(kNestedPhase) when called inside a phase.
  void RunPass(RenderFn root_render);
  void Dispatch(const std::function<void()>& handler);

  [[nodiscard]] auto InPhase() const -> bool {
    return in_phase_;
  }
  // Number of phases started so far, implicit ones included.
  [[nodiscard]] auto PassCount() const -> uint64_t {
    return pass_count_;
  }

  // Top-level components. A mounted component renders in the current phase,
  // or immediately when mounted outside one.
  auto Mount(std::string name, RenderFn render) -> ComponentId;
  // Evicts every identity of the unit. Deferred to the end of the render if
  // the unit is rendering. Throws EngineError(kUnknownComponent).
  void Unmount(ComponentId component);
  [[nodiscard]] auto IsMounted(ComponentId component) const -> bool;
  // Throws EngineError(kUnknownComponent). No-op for unmounted units.
  void RequestRender(ComponentId component);

  [[nodiscard]] auto UnitName(ComponentId component) const -> std::string;
  [[nodiscard]] auto UnitCount() const -> size_t {
    return units_.size();
  }

  // Identity. All throw EngineError(kNoActiveRender) outside a render.
  auto NextId() -> CallId;
  [[nodiscard]] auto EnterScope() -> ScopeGuard;
  [[nodiscard]] auto CurrentScope() const -> const CallId&;
  [[nodiscard]] auto IsRendering() const -> bool {
    return allocator_.IsActive();
  }

  // Runs `fn` in a fresh scope whose atom reads are tracked against the
  // scope identity, so the scope's subscriptions are evicted with it.
  // If `fn` throws, the scope's new reads are discarded and its previous
  // subscriptions stay in place.
  template <typename F>
  void Nested(F&& fn) {
    auto guard = EnterScope();
    CallId scope = allocator_.CurrentScope();
    tracker_.Begin(scope);
    absl::Cleanup discard = [this, &scope] { tracker_.Discard(scope); };
    std::forward<F>(fn)();
    std::move(discard).Cancel();
    tracker_.End(scope);
  }

  template <typename T, typename F>
  auto GetOrInit(const CallId& id, F&& default_fn) -> T& {
    return store_.GetOrInit<T>(id, std::forward<F>(default_fn));
  }

  // Atoms.
  template <typename T>
  auto CreateAtom(
      T initial, AtomScope scope = AtomScope::Global(), std::string name = {},
      std::function<T()> initializer = {}) -> AtomHandle {
    return atoms_.Create<T>(
        std::move(initial), std::move(scope), std::move(name),
        std::move(initializer));
  }

  template <typename T, typename F>
  auto DefineAtom(std::string_view name, F init) -> AtomHandle {
    return atoms_.Define<T>(name, std::move(init));
  }

  template <typename T>
  auto ReadAtom(AtomHandle atom) -> const T& {
    return atoms_.Read<T>(atom);
  }

  template <typename T>
  [[nodiscard]] auto PeekAtom(AtomHandle atom) -> const T& {
    return atoms_.Peek<T>(atom);
  }

  template <typename T>
  auto WriteAtom(AtomHandle atom, T value) -> WriteOutcome {
    return WithinPhase([&] {
      return TraceWrite(atom, atoms_.Write<T>(atom, std::move(value)));
    });
  }

  template <typename T>
  auto WriteAtomSilently(AtomHandle atom, T value) -> WriteOutcome {
    return atoms_.WriteSilently<T>(atom, std::move(value));
  }

  template <typename T, typename F>
  auto UpdateAtom(AtomHandle atom, F&& fn) -> WriteOutcome {
    return WithinPhase([&] {
      return TraceWrite(atom, atoms_.Update<T>(atom, std::forward<F>(fn)));
    });
  }

  auto ResetAtom(AtomHandle atom) -> WriteOutcome;
  auto DisposeAtom(AtomHandle atom) -> bool;

  // Derived atoms. DefineReaction registers the unit under `name` and
  // computes it once, or on first use when `start_suspended` is set; later
  // calls with the same name return the existing unit. `compute` must
  // publish its result with PublishReactionValue().
  auto DefineReaction(
      std::string_view name, RenderFn compute, bool start_suspended = false)
      -> ComponentId;
  // Atom holding the reaction's value. Computes a suspended reaction first.
  // Invalid once the reaction was removed.
  auto ReactionOutput(ComponentId reaction) -> AtomHandle;
  [[nodiscard]] auto IsSuspended(ComponentId reaction) const -> bool;
  void ForceRecompute(ComponentId reaction);

  // Stores the value computed by the reaction that is rendering.
  template <typename T>
  void PublishReactionValue(T value) {
    Unit& unit = RenderingReaction();
    if (!unit.output.IsValid() || !atoms_.IsLive(unit.output)) {
      unit.output = atoms_.Create<T>(
          std::move(value), AtomScope::Global(), unit.name);
      return;
    }
    TraceWrite(unit.output, atoms_.Write<T>(unit.output, std::move(value)));
  }

  // Effects. `cleanup` runs when `identity` is evicted, unless it was taken
  // back with TakeCleanup() first.
  void RegisterEffect(const CallId& identity, CleanupFn cleanup);
  auto TakeCleanup(const CallId& identity) -> CleanupFn;
  // Runs after the unit's current render and sweep, still inside the phase.
  void QueueEffect(ComponentId unit, EffectFn effect);

  // History replay. Each call is one phase.
  auto Undo() -> bool;
  auto Redo() -> bool;
  void TravelTo(size_t cursor);

  [[nodiscard]] auto GetStateStore() -> StateStore& {
    return store_;
  }
  [[nodiscard]] auto GetAtomRegistry() -> AtomRegistry& {
    return atoms_;
  }
  [[nodiscard]] auto GetDependencyTracker() -> DependencyTracker& {
    return tracker_;
  }
  [[nodiscard]] auto GetScheduler() -> RenderScheduler& {
    return scheduler_;
  }
  [[nodiscard]] auto GetSweeper() -> LifecycleSweeper& {
    return sweeper_;
  }
  [[nodiscard]] auto GetHistory() -> History& {
    return history_;
  }
  [[nodiscard]] auto GetTraceManager() -> trace::TraceManager& {
    return trace_manager_;
  }
  [[nodiscard]] auto GetDiagnostics() -> DiagnosticSink& {
    return diagnostics_;
  }
  [[nodiscard]] auto GetOptions() const -> const config::EngineOptions& {
    return options_;
  }

 private:
  struct Unit {
    std::string name;
    UnitKind kind = UnitKind::kComponent;
    RenderFn render;
    bool live = false;
    bool rendering = false;
    bool unmount_requested = false;
    AtomHandle output;  // Reactions only
  };

  // Runs `fn` directly inside a phase, or as its own phase outside one.
  template <typename F>
  auto WithinPhase(F&& fn) -> std::invoke_result_t<F&> {
    using R = std::invoke_result_t<F&>;
    if (in_phase_) {
      return fn();
    }
    if constexpr (std::is_void_v<R>) {
      RunPhase([&] { fn(); });
    } else {
      std::optional<R> result;
      RunPhase([&] { result.emplace(fn()); });
      return std::move(*result);
    }
  }

  void RunPhase(const std::function<void()>& body);
  void AbortPhase();
  void FlushPending();

  auto AddUnit(std::string name, UnitKind kind, RenderFn render)
      -> ComponentId;
  auto RequireUnit(ComponentId component) -> Unit&;
  [[nodiscard]] auto IsUnitLive(ComponentId component) const -> bool;
  void RenderUnit(ComponentId component, uint32_t round);
  void DropUnit(ComponentId component);
  void EvictIdentity(const CallId& id);
  void RunQueuedEffects(ComponentId component);

  void OnAtomChanged(AtomHandle atom, const std::vector<CallId>& subscribers);
  void OnStaleWrite(AtomHandle atom);
  auto TraceWrite(AtomHandle atom, WriteOutcome outcome) -> WriteOutcome;

  void RecomputeReaction(ComponentId reaction);
  // Throws EngineError(kUnknownComponent) unless `reaction` is a reaction.
  auto RequireReaction(ComponentId reaction) -> Unit&;
  auto RenderingReaction() -> Unit&;
  [[nodiscard]] auto ReactionChain(ComponentId last) const
      -> std::vector<std::string>;

  config::EngineOptions options_;

  IdentityAllocator allocator_;
  StateStore store_;
  AtomRegistry atoms_;
  DependencyTracker tracker_;
  RenderScheduler scheduler_;
  LifecycleSweeper sweeper_;
  History history_;
  trace::TraceManager trace_manager_;
  DiagnosticSink diagnostics_;

  // Indexed by ComponentId. Ids are never reused.
  std::vector<std::unique_ptr<Unit>> units_;
  absl::flat_hash_map<std::string, ComponentId> reactions_by_name_;

  absl::flat_hash_map<CallId, CleanupFn> cleanups_;
  absl::flat_hash_map<ComponentId, std::vector<EffectFn>> effects_;

  // Reactions being recomputed, outermost first.
  std::vector<ComponentId> reaction_stack_;

  bool in_phase_ = false;
  uint64_t pass_count_ = 0;
};

}  // namespace tether::runtime
