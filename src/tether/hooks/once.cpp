#include <functional>

#include "tether/hooks/memo.hpp"
#include "tether/runtime/call_id.hpp"
#include "tether/runtime/engine.hpp"

namespace tether::hooks {

namespace {

struct OnceFlag {
  bool done = false;
};

}  // namespace

auto DoOnce(runtime::Engine& engine, const std::function<void()>& fn) -> bool {
  runtime::CallId id = engine.NextId();
  auto& flag = engine.GetOrInit<OnceFlag>(id, [] { return OnceFlag{}; });
  if (flag.done) {
    return false;
  }
  flag.done = true;
  fn();
  return true;
}

}  // namespace tether::hooks
