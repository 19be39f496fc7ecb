#include <gtest/gtest.h>

#include <vector>

#include "tether/runtime/history.hpp"

namespace tether::runtime {
namespace {

class HistoryTest : public ::testing::Test {
 protected:
  // Records a change of value_ to `next` and applies it.
  void Change(int next) {
    int before = value_;
    history_.Record(
        History::Command{
            .apply = [this, next] { value_ = next; },
            .revert = [this, before] { value_ = before; },
        });
    value_ = next;
  }

  History history_;
  int value_ = 0;
};

TEST_F(HistoryTest, UndoRedoWalkTheLog) {
  Change(1);
  Change(2);
  EXPECT_EQ(history_.Size(), 2);
  EXPECT_EQ(history_.Cursor(), 2);

  EXPECT_TRUE(history_.Undo());
  EXPECT_EQ(value_, 1);
  EXPECT_TRUE(history_.Undo());
  EXPECT_EQ(value_, 0);
  EXPECT_FALSE(history_.Undo());
  EXPECT_FALSE(history_.CanUndo());

  EXPECT_TRUE(history_.Redo());
  EXPECT_EQ(value_, 1);
  EXPECT_EQ(history_.Cursor(), 1);
  EXPECT_TRUE(history_.CanRedo());
}

TEST_F(HistoryTest, RecordingTruncatesRedoTail) {
  Change(1);
  Change(2);
  Change(3);
  history_.TravelTo(1);
  EXPECT_EQ(value_, 1);

  Change(7);
  EXPECT_EQ(history_.Size(), 2);
  EXPECT_EQ(history_.Cursor(), 2);
  EXPECT_FALSE(history_.Redo());
  EXPECT_TRUE(history_.Undo());
  EXPECT_EQ(value_, 1);
}

TEST_F(HistoryTest, TravelToClampsCursor) {
  Change(1);
  Change(2);
  history_.TravelTo(0);
  EXPECT_EQ(value_, 0);
  history_.TravelTo(50);
  EXPECT_EQ(value_, 2);
  EXPECT_EQ(history_.Cursor(), 2);
}

TEST_F(HistoryTest, CommandsIssuedDuringReplayAreNotRecorded) {
  std::vector<bool> recorded;
  history_.Record(
      History::Command{
          .apply = [] {},
          .revert =
              [&] {
                EXPECT_TRUE(history_.IsReplaying());
                recorded.push_back(history_.Record(
                    History::Command{.apply = [] {}, .revert = [] {}}));
              },
      });
  EXPECT_TRUE(history_.Undo());
  EXPECT_EQ(recorded, std::vector<bool>{false});
  EXPECT_FALSE(history_.IsReplaying());
  EXPECT_EQ(history_.Size(), 1);
}

TEST_F(HistoryTest, ClearForgetsEverything) {
  Change(1);
  history_.Clear();
  EXPECT_EQ(history_.Size(), 0);
  EXPECT_FALSE(history_.Undo());
  EXPECT_EQ(value_, 1);
}

}  // namespace
}  // namespace tether::runtime
