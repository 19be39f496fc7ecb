#include <gtest/gtest.h>

#include <vector>

#include "tether/common/internal_error.hpp"
#include "tether/runtime/atom_registry.hpp"
#include "tether/runtime/call_id.hpp"
#include "tether/runtime/dependency_tracker.hpp"
#include "tether/runtime/engine_types.hpp"

namespace tether::runtime {
namespace {

class DependencyTrackerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registry_.SetTracker(&tracker_);
    a_ = registry_.Create<int>(1);
    b_ = registry_.Create<int>(2);
  }

  AtomRegistry registry_;
  DependencyTracker tracker_{registry_};
  AtomHandle a_;
  AtomHandle b_;
  CallId id_ = CallId::ForRoot(1);
};

TEST_F(DependencyTrackerTest, ReadsOutsideFrameAreUntracked) {
  (void)registry_.Read<int>(a_);
  EXPECT_FALSE(tracker_.IsRecording());
  EXPECT_TRUE(registry_.SubscribersOf(a_).empty());
}

TEST_F(DependencyTrackerTest, EndSubscribesReadAtoms) {
  tracker_.Begin(id_);
  EXPECT_EQ(*tracker_.CurrentIdentity(), id_);
  (void)registry_.Read<int>(a_);
  (void)registry_.Read<int>(a_);
  // Subscription is committed at End, not while recording.
  EXPECT_TRUE(registry_.SubscribersOf(a_).empty());
  tracker_.End(id_);

  EXPECT_EQ(registry_.SubscribersOf(a_), std::vector<CallId>{id_});
  EXPECT_EQ(tracker_.DependenciesOf(id_), std::vector<AtomHandle>{a_});
  EXPECT_EQ(tracker_.CurrentIdentity(), nullptr);
}

TEST_F(DependencyTrackerTest, PeekIsNotRecorded) {
  tracker_.Begin(id_);
  (void)registry_.Peek<int>(a_);
  tracker_.End(id_);
  EXPECT_TRUE(registry_.SubscribersOf(a_).empty());
}

TEST_F(DependencyTrackerTest, EndReplacesPreviousSetWholesale) {
  tracker_.Begin(id_);
  (void)registry_.Read<int>(a_);
  (void)registry_.Read<int>(b_);
  tracker_.End(id_);

  tracker_.Begin(id_);
  (void)registry_.Read<int>(b_);
  tracker_.End(id_);

  EXPECT_TRUE(registry_.SubscribersOf(a_).empty());
  EXPECT_EQ(registry_.SubscribersOf(b_), std::vector<CallId>{id_});
  EXPECT_EQ(tracker_.DependenciesOf(id_), std::vector<AtomHandle>{b_});
}

TEST_F(DependencyTrackerTest, NestedFrameRecordsInnermostOnly) {
  CallId inner = id_.Child(0);
  tracker_.Begin(id_);
  (void)registry_.Read<int>(a_);
  tracker_.Begin(inner);
  (void)registry_.Read<int>(b_);
  tracker_.End(inner);
  tracker_.End(id_);

  EXPECT_EQ(registry_.SubscribersOf(a_), std::vector<CallId>{id_});
  EXPECT_EQ(registry_.SubscribersOf(b_), std::vector<CallId>{inner});
  EXPECT_EQ(tracker_.TrackedIdentityCount(), 2);
}

TEST_F(DependencyTrackerTest, MismatchedEndThrows) {
  EXPECT_THROW(tracker_.End(id_), common::InternalError);
  tracker_.Begin(id_);
  EXPECT_THROW(tracker_.End(id_.Child(0)), common::InternalError);
}

TEST_F(DependencyTrackerTest, ForgetDropsSubscriptions) {
  tracker_.Begin(id_);
  (void)registry_.Read<int>(a_);
  tracker_.End(id_);
  tracker_.Forget(id_);
  EXPECT_TRUE(registry_.SubscribersOf(a_).empty());
  EXPECT_TRUE(tracker_.DependenciesOf(id_).empty());
  EXPECT_EQ(tracker_.TrackedIdentityCount(), 0);
}

TEST_F(DependencyTrackerTest, AbortKeepsCommittedEdges) {
  tracker_.Begin(id_);
  (void)registry_.Read<int>(a_);
  tracker_.End(id_);

  tracker_.Begin(id_);
  (void)registry_.Read<int>(b_);
  tracker_.Abort();

  EXPECT_FALSE(tracker_.IsRecording());
  EXPECT_EQ(registry_.SubscribersOf(a_), std::vector<CallId>{id_});
  EXPECT_TRUE(registry_.SubscribersOf(b_).empty());
}

TEST_F(DependencyTrackerTest, DiscardPopsOnlyMatchingFrame) {
  CallId inner = id_.Child(0);
  tracker_.Begin(id_);
  tracker_.Begin(inner);
  (void)registry_.Read<int>(b_);

  // Not the innermost frame: ignored.
  tracker_.Discard(id_);
  EXPECT_EQ(*tracker_.CurrentIdentity(), inner);

  tracker_.Discard(inner);
  EXPECT_EQ(*tracker_.CurrentIdentity(), id_);
  (void)registry_.Read<int>(a_);
  tracker_.End(id_);

  EXPECT_TRUE(registry_.SubscribersOf(b_).empty());
  EXPECT_EQ(registry_.SubscribersOf(a_), std::vector<CallId>{id_});
}

TEST_F(DependencyTrackerTest, DisposedAtomIsSkippedOnCommit) {
  tracker_.Begin(id_);
  (void)registry_.Read<int>(a_);
  registry_.Dispose(a_);
  tracker_.End(id_);
  EXPECT_TRUE(registry_.SubscribersOf(a_).empty());
}

}  // namespace
}  // namespace tether::runtime
