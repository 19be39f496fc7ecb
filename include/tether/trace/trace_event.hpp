#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace tether::trace {

// A phase (RunPass/Dispatch) started.
struct PassBegin {
  uint64_t pass;
};

// A unit render callback ran. `round` is the scheduler round within the
// flush (0 for derived atoms recomputed synchronously).
struct ComponentRender {
  uint32_t component;
  uint32_t round;
};

// A write reached a live atom. Unchanged writes are recorded too.
struct AtomWrite {
  uint32_t atom_index;
  bool changed;
};

// State and subscriptions of an identity were evicted.
struct IdentityEvicted {
  std::string identity;
};

// A write targeted a disposed atom and was dropped.
struct StaleWrite {
  uint32_t atom_index;
};

using TraceEvent = std::variant<
    PassBegin, ComponentRender, AtomWrite, IdentityEvicted, StaleWrite>;

}  // namespace tether::trace
