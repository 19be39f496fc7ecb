#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "tether/common/internal_error.hpp"
#include "tether/runtime/call_id.hpp"
#include "tether/runtime/lifecycle_sweeper.hpp"

namespace tether::runtime {
namespace {

class LifecycleSweeperTest : public ::testing::Test {
 protected:
  // One render of unit 1 visiting `slots` under its root.
  auto Render(const std::vector<uint32_t>& slots) -> SweepResult {
    sweeper_.BeginRender(1);
    for (uint32_t slot : slots) {
      sweeper_.Visit(Id(slot));
    }
    return sweeper_.EndRender(1);
  }

  static auto Id(uint32_t slot) -> CallId {
    return CallId::ForRoot(1).Child(slot);
  }

  LifecycleSweeper sweeper_;
};

TEST_F(LifecycleSweeperTest, RevisitedIdentitiesSurvive) {
  Render({0, 1, 2});
  SweepResult result = Render({0, 1, 2});
  EXPECT_TRUE(result.evicted.empty());
  EXPECT_EQ(result.visited, 3);
  EXPECT_EQ(result.previously_visited, 3);
  EXPECT_EQ(sweeper_.LiveCount(1), 3);
}

TEST_F(LifecycleSweeperTest, UnvisitedIdentitiesEvictedSorted) {
  Render({0, 1, 2, 3});
  SweepResult result = Render({2});
  EXPECT_EQ(result.evicted, (std::vector<CallId>{Id(0), Id(1), Id(3)}));
  EXPECT_FALSE(sweeper_.IsLive(Id(0)));
  EXPECT_TRUE(sweeper_.IsLive(Id(2)));
}

TEST_F(LifecycleSweeperTest, GracePassesDelayEviction) {
  sweeper_.SetGracePasses(2);
  Render({0, 1});
  EXPECT_TRUE(Render({0}).evicted.empty());
  EXPECT_TRUE(Render({0}).evicted.empty());
  EXPECT_EQ(Render({0}).evicted, std::vector<CallId>{Id(1)});
}

TEST_F(LifecycleSweeperTest, VisitResetsMissCount) {
  sweeper_.SetGracePasses(1);
  Render({0, 1});
  Render({0});
  Render({0, 1});
  EXPECT_TRUE(Render({0}).evicted.empty());
  EXPECT_TRUE(sweeper_.IsLive(Id(1)));
}

TEST_F(LifecycleSweeperTest, UnitsAreTrackedSeparately) {
  Render({0});
  sweeper_.BeginRender(2);
  sweeper_.Visit(CallId::ForRoot(2).Child(0));
  EXPECT_TRUE(sweeper_.EndRender(2).evicted.empty());
  EXPECT_TRUE(sweeper_.IsLive(Id(0)));
  EXPECT_EQ(sweeper_.LiveCount(2), 1);
}

TEST_F(LifecycleSweeperTest, VisitOutsideRenderThrows) {
  EXPECT_THROW(sweeper_.Visit(Id(0)), common::InternalError);
  EXPECT_THROW(sweeper_.EndRender(1), common::InternalError);
}

TEST_F(LifecycleSweeperTest, NestedRenderOfSameUnitThrows) {
  sweeper_.BeginRender(1);
  EXPECT_TRUE(sweeper_.IsRendering(1));
  EXPECT_THROW(sweeper_.BeginRender(1), common::InternalError);
}

TEST_F(LifecycleSweeperTest, EvictAllForgetsUnit) {
  Render({2, 0});
  EXPECT_EQ(sweeper_.EvictAll(1), (std::vector<CallId>{Id(0), Id(2)}));
  EXPECT_EQ(sweeper_.LiveCount(1), 0);
  EXPECT_TRUE(sweeper_.EvictAll(1).empty());
}

TEST_F(LifecycleSweeperTest, AbortKeepsLiveSet) {
  Render({0});
  sweeper_.BeginRender(1);
  sweeper_.AbortRenders();
  EXPECT_FALSE(sweeper_.IsRendering(1));
  EXPECT_TRUE(sweeper_.IsLive(Id(0)));
}

TEST_F(LifecycleSweeperTest, AbandonedRenderKeepsItsVisits) {
  Render({0});
  sweeper_.BeginRender(1);
  sweeper_.Visit(Id(0));
  sweeper_.Visit(Id(1));
  sweeper_.Visit(Id(2));
  sweeper_.AbandonRender(1);
  EXPECT_FALSE(sweeper_.IsRendering(1));
  EXPECT_TRUE(sweeper_.IsLive(Id(2)));
  EXPECT_EQ(sweeper_.LiveCount(1), 3U);

  // The next successful render sweeps what it no longer visits.
  SweepResult result = Render({0});
  EXPECT_EQ(result.evicted, (std::vector<CallId>{Id(1), Id(2)}));
}

TEST_F(LifecycleSweeperTest, AbortKeepsVisitsOfRenderingUnits) {
  sweeper_.BeginRender(1);
  sweeper_.Visit(Id(4));
  sweeper_.AbortRenders();
  EXPECT_EQ(sweeper_.EvictAll(1), (std::vector<CallId>{Id(4)}));
}

}  // namespace
}  // namespace tether::runtime
