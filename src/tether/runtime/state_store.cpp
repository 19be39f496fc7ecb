#include "tether/runtime/state_store.hpp"

#include <string>

#include "tether/runtime/call_id.hpp"

namespace tether::runtime {

auto StateStore::Remove(const CallId& id) -> bool {
  return cells_.erase(id) > 0;
}

auto StateStore::TypeNameOf(const CallId& id) const -> std::string {
  auto it = cells_.find(id);
  if (it == cells_.end()) {
    return {};
  }
  return std::string(it->second->Tag().Name());
}

}  // namespace tether::runtime
