#include "tether/runtime/history.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace tether::runtime {

namespace {

// Sets a flag for the lifetime of the guard.
class ReplayGuard {
 public:
  explicit ReplayGuard(bool& flag) : flag_(flag) {
    flag_ = true;
  }
  ~ReplayGuard() {
    flag_ = false;
  }

  ReplayGuard(const ReplayGuard&) = delete;
  auto operator=(const ReplayGuard&) -> ReplayGuard& = delete;
  ReplayGuard(ReplayGuard&&) = delete;
  auto operator=(ReplayGuard&&) -> ReplayGuard& = delete;

 private:
  bool& flag_;
};

}  // namespace

auto History::Record(Command command) -> bool {
  if (replaying_) {
    return false;
  }
  commands_.resize(cursor_);
  commands_.push_back(std::move(command));
  cursor_ = commands_.size();
  return true;
}

auto History::Undo() -> bool {
  if (cursor_ == 0) {
    return false;
  }
  ReplayGuard guard(replaying_);
  --cursor_;
  commands_[cursor_].revert();
  return true;
}

auto History::Redo() -> bool {
  if (cursor_ >= commands_.size()) {
    return false;
  }
  ReplayGuard guard(replaying_);
  commands_[cursor_].apply();
  ++cursor_;
  return true;
}

void History::TravelTo(size_t cursor) {
  cursor = std::min(cursor, commands_.size());
  while (cursor_ > cursor) {
    Undo();
  }
  while (cursor_ < cursor) {
    Redo();
  }
}

void History::Clear() {
  commands_.clear();
  cursor_ = 0;
}

}  // namespace tether::runtime
