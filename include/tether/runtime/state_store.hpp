#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "tether/common/type_tag.hpp"
#include "tether/runtime/call_id.hpp"
#include "tether/runtime/engine_error.hpp"
#include "tether/runtime/erased_value.hpp"

namespace tether::runtime {

// Type-erased state store: CallId -> owned state cell.
//
// Each cell is heap allocated, so references returned by GetOrInit/Get stay
// valid until the cell is removed, independent of map rehashing.
// Single-threaded; no internal locking.
class StateStore {
 public:
  StateStore() = default;

  StateStore(const StateStore&) = delete;
  auto operator=(const StateStore&) -> StateStore& = delete;
  StateStore(StateStore&&) = delete;
  auto operator=(StateStore&&) -> StateStore& = delete;

  // Returns the state for `id`, creating it with `default_fn()` on first use.
  // `default_fn` is called at most once per cell lifetime.
  // Throws TypeMismatchError if the cell holds another type.
  template <typename T, typename F>
  auto GetOrInit(const CallId& id, F&& default_fn) -> T& {
    auto it = cells_.find(id);
    if (it != cells_.end()) {
      return CheckedCast<T>(id, *it->second);
    }
    auto cell = MakeErased<T>(T(std::forward<F>(default_fn)()));
    T* value = cell->template As<T>();
    cells_.emplace(id, std::move(cell));
    return *value;
  }

  // Returns nullptr when `id` has no cell. Throws TypeMismatchError if the
  // cell holds another type.
  template <typename T>
  [[nodiscard]] auto Get(const CallId& id) -> T* {
    auto it = cells_.find(id);
    if (it == cells_.end()) {
      return nullptr;
    }
    return &CheckedCast<T>(id, *it->second);
  }

  // Overwrites the cell in place, or creates it. Throws TypeMismatchError if
  // the existing cell holds another type.
  template <typename T>
  void Set(const CallId& id, T value) {
    auto it = cells_.find(id);
    if (it == cells_.end()) {
      cells_.emplace(id, MakeErased<T>(std::move(value)));
      return;
    }
    CheckedCast<T>(id, *it->second) = std::move(value);
  }

  [[nodiscard]] auto Contains(const CallId& id) const -> bool {
    return cells_.contains(id);
  }

  // Evicts the cell. Returns false if there was none.
  auto Remove(const CallId& id) -> bool;

  [[nodiscard]] auto Size() const -> size_t {
    return cells_.size();
  }

  // Mangled type name of the stored value, or empty if absent.
  [[nodiscard]] auto TypeNameOf(const CallId& id) const -> std::string;

  void Clear() {
    cells_.clear();
  }

 private:
  template <typename T>
  static auto CheckedCast(const CallId& id, ErasedValue& cell) -> T& {
    T* value = cell.template As<T>();
    if (value == nullptr) {
      throw TypeMismatchError(
          "state " + id.ToString(), cell.Tag().Name(),
          common::TypeTag::Of<T>().Name());
    }
    return *value;
  }

  absl::flat_hash_map<CallId, std::unique_ptr<ErasedValue>> cells_;
};

}  // namespace tether::runtime
