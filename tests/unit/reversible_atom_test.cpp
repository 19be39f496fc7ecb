#include <gtest/gtest.h>

#include <optional>
#include <vector>

#include "tether/common/diagnostic.hpp"
#include "tether/hooks/hooks.hpp"
#include "tether/runtime/engine.hpp"
#include "tether/runtime/history.hpp"

namespace tether::hooks {
namespace {

using runtime::Engine;

class ReversibleAtomTest : public ::testing::Test {
 protected:
  Engine engine_;
};

TEST_F(ReversibleAtomTest, UndoRedoRestoreValues) {
  auto value = DefineReversibleAtom<int>(engine_, "value", [] { return 0; });
  value.Set(1);
  value.Set(2);
  auto& history = engine_.GetHistory();
  EXPECT_EQ(history.Size(), 2U);

  EXPECT_TRUE(engine_.Undo());
  EXPECT_EQ(value.Peek(), 1);
  EXPECT_TRUE(engine_.Undo());
  EXPECT_EQ(value.Peek(), 0);
  EXPECT_FALSE(engine_.Undo());

  EXPECT_TRUE(engine_.Redo());
  EXPECT_EQ(value.Peek(), 1);
  // Replayed writes are not recorded again.
  EXPECT_EQ(history.Size(), 2U);
  EXPECT_EQ(history.Cursor(), 1U);
}

TEST_F(ReversibleAtomTest, NewChangeTruncatesRedo) {
  auto value = DefineReversibleAtom<int>(engine_, "value", [] { return 0; });
  value.Set(1);
  value.Set(2);
  engine_.Undo();
  value.Set(5);
  EXPECT_EQ(engine_.GetHistory().Size(), 2U);
  EXPECT_FALSE(engine_.Redo());

  engine_.TravelTo(0);
  EXPECT_EQ(value.Peek(), 0);
  engine_.TravelTo(10);
  EXPECT_EQ(value.Peek(), 5);
}

TEST_F(ReversibleAtomTest, EqualSetRecordsNothing) {
  auto value = DefineReversibleAtom<int>(engine_, "value", [] { return 3; });
  EXPECT_EQ(value.Set(3), runtime::WriteOutcome::kUnchanged);
  EXPECT_EQ(engine_.GetHistory().Size(), 0U);
}

TEST_F(ReversibleAtomTest, UpdateIsRecorded) {
  auto items = DefineReversibleAtom<std::vector<int>>(
      engine_, "items", [] { return std::vector<int>{}; });
  items.Update([](std::vector<int>& v) { v.push_back(1); });
  items.Update([](std::vector<int>& v) { v.push_back(2); });
  engine_.Undo();
  EXPECT_EQ(items.Peek(), std::vector<int>{1});
}

TEST_F(ReversibleAtomTest, UndoRerendersReaders) {
  auto value = DefineReversibleAtom<int>(engine_, "value", [] { return 0; });
  int seen = -1;
  int renders = 0;
  engine_.RunPass([&](Engine&) {
    ++renders;
    seen = value.Get();
  });
  value.Set(1);
  EXPECT_EQ(seen, 1);
  engine_.Undo();
  EXPECT_EQ(seen, 0);
  EXPECT_EQ(renders, 3);
}

TEST_F(ReversibleAtomTest, InertSetIsRecordedWithoutRendering) {
  auto value = DefineReversibleAtom<int>(engine_, "value", [] { return 0; });
  int renders = 0;
  engine_.RunPass([&](Engine&) {
    ++renders;
    (void)value.Get();
  });

  EXPECT_EQ(value.InertSet(4), runtime::WriteOutcome::kSilent);
  EXPECT_EQ(value.Peek(), 4);
  EXPECT_EQ(engine_.GetHistory().Size(), 1U);
  engine_.Undo();
  EXPECT_EQ(value.Peek(), 0);
  EXPECT_EQ(renders, 1);
}

TEST_F(ReversibleAtomTest, ResetToDefaultIsRecorded) {
  auto value = DefineReversibleAtom<int>(engine_, "value", [] { return 0; });
  value.Set(5);
  EXPECT_EQ(value.ResetToDefault(), runtime::WriteOutcome::kChanged);
  EXPECT_EQ(value.Peek(), 0);
  EXPECT_EQ(engine_.GetHistory().Size(), 2U);

  engine_.Undo();
  EXPECT_EQ(value.Peek(), 5);
  engine_.Redo();
  EXPECT_EQ(value.Peek(), 0);
}

TEST_F(ReversibleAtomTest, RemoveReturnsLastValue) {
  auto value = DefineReversibleAtom<int>(engine_, "value", [] { return 0; });
  value.Set(3);
  EXPECT_EQ(value.Remove(), 3);
  EXPECT_FALSE(value.Exists());
  EXPECT_EQ(value.Remove(), std::nullopt);

  // Replaying a command for the removed atom is dropped and reported.
  EXPECT_TRUE(engine_.Undo());
  EXPECT_EQ(engine_.GetDiagnostics().Count(DiagKind::kStaleHandleWrite), 1U);
}

TEST_F(ReversibleAtomTest, UseReversibleAtomInRender) {
  std::optional<ReversibleAtom<int>> atom;
  engine_.RunPass([&atom](Engine& e) {
    auto local = UseReversibleAtom(e, 10);
    if (!atom) {
      atom.emplace(local);
    }
  });
  atom->Set(11);
  EXPECT_EQ(atom->Peek(), 11);
  engine_.Undo();
  EXPECT_EQ(atom->Peek(), 10);
  EXPECT_TRUE(atom->AsAtom().Exists());
}

}  // namespace
}  // namespace tether::hooks
