#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <utility>

namespace tether::runtime {

// Identifier of a top-level unit: a mounted component or a derived atom.
// It is also the first element of every CallId rendered by that unit.
using ComponentId = uint32_t;

// The component whose render callback is supplied by Engine::RunPass.
inline constexpr ComponentId kRootComponent = 0;

inline constexpr uint32_t kInvalidIndex = std::numeric_limits<uint32_t>::max();

// Handle to an atom cell. The generation is bumped when the cell is disposed,
// so handles that outlive their atom are detected instead of aliasing a
// newer atom stored in the same slot.
struct AtomHandle {
  uint32_t index = kInvalidIndex;
  uint32_t generation = 0;

  [[nodiscard]] auto IsValid() const -> bool {
    return index != kInvalidIndex;
  }

  auto operator==(const AtomHandle&) const -> bool = default;

  template <typename H>
  friend auto AbslHashValue(H h, const AtomHandle& handle) -> H {
    return H::combine(std::move(h), handle.index, handle.generation);
  }
};

class Engine;

// Render callback of a top-level unit.
using RenderFn = std::function<void(Engine& engine)>;

// Cleanup closure registered for an identity; runs when it is swept.
using CleanupFn = std::function<void()>;

// Post-render work queued by effect hooks.
using EffectFn = std::function<void()>;

}  // namespace tether::runtime
