#pragma once

#include <cstddef>
#include <functional>
#include <vector>

namespace tether::runtime {

// Undo/redo log of reversible writes.
//
// Each command pairs the closure that applies a change with the one that
// reverts it. `cursor` is the number of applied commands; recording a new
// command drops everything after the cursor. Commands issued while undoing or
// redoing are not recorded.
class History {
 public:
  struct Command {
    std::function<void()> apply;
    std::function<void()> revert;
  };

  History() = default;

  History(const History&) = delete;
  auto operator=(const History&) -> History& = delete;
  History(History&&) = delete;
  auto operator=(History&&) -> History& = delete;

  // Returns false (and drops the command) while replaying.
  auto Record(Command command) -> bool;

  // Reverts the last applied command. Returns false if there is none.
  auto Undo() -> bool;

  // Re-applies the next command. Returns false if there is none.
  auto Redo() -> bool;

  // Undoes or redoes until `cursor` commands are applied. Cursors past the
  // end are clamped to Size().
  void TravelTo(size_t cursor);

  [[nodiscard]] auto Size() const -> size_t {
    return commands_.size();
  }
  [[nodiscard]] auto Cursor() const -> size_t {
    return cursor_;
  }
  [[nodiscard]] auto CanUndo() const -> bool {
    return cursor_ > 0;
  }
  [[nodiscard]] auto CanRedo() const -> bool {
    return cursor_ < commands_.size();
  }
  [[nodiscard]] auto IsReplaying() const -> bool {
    return replaying_;
  }

  void Clear();

 private:
  std::vector<Command> commands_;
  size_t cursor_ = 0;
  bool replaying_ = false;
};

}  // namespace tether::runtime
