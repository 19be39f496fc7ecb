#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "tether/runtime/atom_registry.hpp"
#include "tether/runtime/call_id.hpp"
#include "tether/runtime/engine_error.hpp"
#include "tether/runtime/engine_types.hpp"

namespace tether::runtime {
namespace {

// No operator==: every write counts as a change.
struct Blob {
  int value;
};

class AtomRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registry_.SetChangeListener(
        [this](AtomHandle /*atom*/, const std::vector<CallId>& subscribers) {
          notifications_.push_back(subscribers);
        });
    registry_.SetStaleWriteListener(
        [this](AtomHandle /*atom*/) { ++stale_writes_; });
  }

  AtomRegistry registry_;
  std::vector<std::vector<CallId>> notifications_;
  int stale_writes_ = 0;
};

// =============================================================================
// Reads and Writes
// =============================================================================

TEST_F(AtomRegistryTest, CreateAndPeek) {
  auto atom = registry_.Create<int>(3);
  EXPECT_TRUE(atom.IsValid());
  EXPECT_TRUE(registry_.IsLive(atom));
  EXPECT_EQ(registry_.Peek<int>(atom), 3);
  EXPECT_EQ(registry_.LiveCount(), 1);
}

TEST_F(AtomRegistryTest, WriteThenReadReturnsNewValue) {
  auto atom = registry_.Create<std::string>("a");
  EXPECT_EQ(registry_.Write<std::string>(atom, "b"), WriteOutcome::kChanged);
  EXPECT_EQ(registry_.Read<std::string>(atom), "b");
}

TEST_F(AtomRegistryTest, EqualWriteNotifiesNobody) {
  auto atom = registry_.Create<int>(1);
  registry_.Subscribe(atom, CallId::ForRoot(1));
  EXPECT_EQ(registry_.Write<int>(atom, 1), WriteOutcome::kUnchanged);
  EXPECT_TRUE(notifications_.empty());
  EXPECT_EQ(registry_.Write<int>(atom, 2), WriteOutcome::kChanged);
  EXPECT_EQ(notifications_.size(), 1);
}

TEST_F(AtomRegistryTest, NonComparableWriteAlwaysChanges) {
  auto atom = registry_.Create<Blob>(Blob{.value = 1});
  registry_.Subscribe(atom, CallId::ForRoot(1));
  EXPECT_EQ(registry_.Write<Blob>(atom, Blob{.value = 1}), WriteOutcome::kChanged);
  EXPECT_EQ(notifications_.size(), 1);
}

TEST_F(AtomRegistryTest, SubscribersNotifiedInCallIdOrder) {
  auto atom = registry_.Create<int>(0);
  registry_.Subscribe(atom, CallId::ForRoot(2).Child(0));
  registry_.Subscribe(atom, CallId::ForRoot(1).Child(3));
  registry_.Subscribe(atom, CallId::ForRoot(1));
  registry_.Subscribe(atom, CallId::ForRoot(1));

  (void)registry_.Write<int>(atom, 1);
  ASSERT_EQ(notifications_.size(), 1);
  std::vector<CallId> expected = {
      CallId::ForRoot(1), CallId::ForRoot(1).Child(3),
      CallId::ForRoot(2).Child(0)};
  EXPECT_EQ(notifications_[0], expected);
}

TEST_F(AtomRegistryTest, UnsubscribedAtomNotifiesNobody) {
  auto atom = registry_.Create<int>(0);
  registry_.Subscribe(atom, CallId::ForRoot(1));
  registry_.Unsubscribe(atom, CallId::ForRoot(1));
  (void)registry_.Write<int>(atom, 1);
  EXPECT_TRUE(notifications_.empty());
}

TEST_F(AtomRegistryTest, SilentWriteDoesNotNotify) {
  auto atom = registry_.Create<int>(0);
  registry_.Subscribe(atom, CallId::ForRoot(1));
  EXPECT_EQ(registry_.WriteSilently<int>(atom, 5), WriteOutcome::kSilent);
  EXPECT_EQ(registry_.Peek<int>(atom), 5);
  EXPECT_TRUE(notifications_.empty());
}

TEST_F(AtomRegistryTest, UpdateAlwaysNotifies) {
  auto atom = registry_.Create<std::vector<int>>({});
  registry_.Subscribe(atom, CallId::ForRoot(1));
  auto outcome =
      registry_.Update<std::vector<int>>(atom, [](std::vector<int>& v) {
        v.push_back(4);
      });
  EXPECT_EQ(outcome, WriteOutcome::kChanged);
  EXPECT_EQ(registry_.Peek<std::vector<int>>(atom).size(), 1);
  EXPECT_EQ(notifications_.size(), 1);
}

TEST_F(AtomRegistryTest, ReadAsWrongTypeThrows) {
  auto atom = registry_.Create<int>(0, AtomScope::Global(), "count");
  try {
    (void)registry_.Peek<std::string>(atom);
    FAIL() << "expected TypeMismatchError";
  } catch (const TypeMismatchError& e) {
    EXPECT_EQ(e.Where(), "atom 'count'");
  }
}

// =============================================================================
// Disposal
// =============================================================================

TEST_F(AtomRegistryTest, WriteToDisposedAtomIsDropped) {
  auto atom = registry_.Create<int>(0);
  EXPECT_TRUE(registry_.Dispose(atom));
  EXPECT_EQ(registry_.Write<int>(atom, 1), WriteOutcome::kStale);
  EXPECT_EQ(registry_.Update<int>(atom, [](int& v) { ++v; }), WriteOutcome::kStale);
  EXPECT_EQ(stale_writes_, 2);
  EXPECT_FALSE(registry_.Dispose(atom));
}

TEST_F(AtomRegistryTest, ReadOfDisposedAtomThrows) {
  auto atom = registry_.Create<int>(0);
  registry_.Dispose(atom);
  EXPECT_EQ(registry_.TryPeek<int>(atom), nullptr);
  try {
    (void)registry_.Read<int>(atom);
    FAIL() << "expected EngineError";
  } catch (const EngineError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::kStaleHandleRead);
  }
}

TEST_F(AtomRegistryTest, ReusedSlotDoesNotAliasOldHandle) {
  auto first = registry_.Create<int>(1);
  registry_.Dispose(first);
  auto second = registry_.Create<int>(2);
  EXPECT_EQ(second.index, first.index);
  EXPECT_NE(second.generation, first.generation);
  EXPECT_FALSE(registry_.IsLive(first));
  EXPECT_EQ(registry_.Write<int>(first, 9), WriteOutcome::kStale);
  EXPECT_EQ(registry_.Peek<int>(second), 2);
}

TEST_F(AtomRegistryTest, DisposeOwnedByDropsOnlyOwnedAtoms) {
  CallId owner = CallId::ForRoot(1).Child(0);
  auto owned_a = registry_.Create<int>(0, AtomScope::OwnedBy(owner));
  auto owned_b = registry_.Create<int>(0, AtomScope::OwnedBy(owner));
  auto other = registry_.Create<int>(0, AtomScope::OwnedBy(owner.Child(0)));
  auto global = registry_.Create<int>(0);

  registry_.Dispose(owned_b);
  EXPECT_EQ(registry_.DisposeOwnedBy(owner), 1);
  EXPECT_FALSE(registry_.IsLive(owned_a));
  EXPECT_TRUE(registry_.IsLive(other));
  EXPECT_TRUE(registry_.IsLive(global));
  EXPECT_EQ(registry_.DisposeOwnedBy(owner), 0);
}

TEST_F(AtomRegistryTest, DisposeClearsSubscribers) {
  auto atom = registry_.Create<int>(0);
  registry_.Subscribe(atom, CallId::ForRoot(1));
  registry_.Dispose(atom);
  EXPECT_TRUE(registry_.SubscribersOf(atom).empty());
}

// =============================================================================
// Named Atoms and Defaults
// =============================================================================

TEST_F(AtomRegistryTest, DefineCreatesOnce) {
  int inits = 0;
  auto init = [&inits] {
    ++inits;
    return 10;
  };
  auto first = registry_.Define<int>("limit", init);
  auto second = registry_.Define<int>("limit", init);
  EXPECT_EQ(first, second);
  EXPECT_EQ(inits, 1);
  EXPECT_EQ(registry_.Find("limit"), first);
  EXPECT_EQ(registry_.NameOf(first), "limit");
  EXPECT_FALSE(registry_.Find("missing").has_value());
}

TEST_F(AtomRegistryTest, DefineStoresInitializerValue) {
  std::string prefix = "item";
  auto atom = registry_.Define<std::vector<std::string>>(
      "items", [prefix] {
        return std::vector<std::string>{prefix + "-0", prefix + "-1"};
      });
  EXPECT_EQ(
      registry_.Peek<std::vector<std::string>>(atom),
      (std::vector<std::string>{"item-0", "item-1"}));

  // The same initializer still backs ResetToDefault.
  (void)registry_.Write<std::vector<std::string>>(atom, {});
  EXPECT_EQ(registry_.ResetToDefault(atom), WriteOutcome::kChanged);
  EXPECT_EQ(registry_.Peek<std::vector<std::string>>(atom).size(), 2U);
}

TEST_F(AtomRegistryTest, DefineAfterDisposeCreatesFreshAtom) {
  auto first = registry_.Define<int>("limit", [] { return 10; });
  registry_.Dispose(first);
  EXPECT_FALSE(registry_.Find("limit").has_value());
  auto second = registry_.Define<int>("limit", [] { return 20; });
  EXPECT_TRUE(registry_.IsLive(second));
  EXPECT_EQ(registry_.Peek<int>(second), 20);
}

TEST_F(AtomRegistryTest, ResetToDefaultRerunsInitializer) {
  auto atom = registry_.Define<int>("limit", [] { return 10; });
  registry_.Subscribe(atom, CallId::ForRoot(1));
  (void)registry_.Write<int>(atom, 3);
  EXPECT_EQ(registry_.ResetToDefault(atom), WriteOutcome::kChanged);
  EXPECT_EQ(registry_.Peek<int>(atom), 10);
  EXPECT_EQ(notifications_.size(), 2);

  auto plain = registry_.Create<int>(1);
  EXPECT_EQ(registry_.ResetToDefault(plain), WriteOutcome::kUnchanged);
}

}  // namespace
}  // namespace tether::runtime
