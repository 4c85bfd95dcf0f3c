// PFD headers
#include "core/TriggerStateMachine.hpp"
#include "vision/Detection.hpp"

// GTest headers
#include <gtest/gtest.h>

namespace pfd::test {

  using pfd::core::TriggerState;
  using pfd::core::TriggerStateMachine;
  using pfd::vision::Observation;
  using namespace std::chrono_literals;

  class TriggerStateMachineTest : public ::testing::Test {
  protected:
    TriggerStateMachineTest() {
      overlap.overlapping = true;
      overlap.target = pfd::core::Point2D{ 0.5, 0.25 };
    }

    /// Step once and advance the fake clock by one tick.
    bool step(const Observation& obs, bool dnd = true) {
      const auto d = fsm.step(obs, dnd, now);
      now += 100ms;
      return d.shouldTrigger;
    }

    TriggerStateMachine fsm{ 3, 10s };
    TriggerStateMachine::Clock::time_point now{};
    Observation overlap;
    Observation clear;
  };

  TEST_F(TriggerStateMachineTest, StartsIdle) {
    EXPECT_EQ(fsm.state(), TriggerState::Idle);
    EXPECT_EQ(fsm.consecutive(), 0u);
  }

  TEST_F(TriggerStateMachineTest, BreakBeforeKResetsTheCount) {
    EXPECT_FALSE(step(overlap));
    EXPECT_FALSE(step(overlap));
    EXPECT_FALSE(step(clear));
    EXPECT_EQ(fsm.consecutive(), 0u);
    EXPECT_FALSE(step(overlap));
    EXPECT_FALSE(step(overlap));
    EXPECT_EQ(fsm.state(), TriggerState::Idle);
  }

  TEST_F(TriggerStateMachineTest, KthConsecutiveTickTriggersOnce) {
    EXPECT_FALSE(step(overlap));
    EXPECT_FALSE(step(overlap));

    const auto d = fsm.step(overlap, true, now);
    EXPECT_TRUE(d.shouldTrigger);
    ASSERT_TRUE(d.target);
    EXPECT_DOUBLE_EQ(d.target->u, 0.5);
    EXPECT_EQ(fsm.state(), TriggerState::Triggered);

    // no second decision while the spray is outstanding
    EXPECT_FALSE(step(overlap));
    EXPECT_FALSE(step(overlap));
  }

  TEST_F(TriggerStateMachineTest, DndOffNeverCounts) {
    for (int i = 0; i < 10; ++i)
      EXPECT_FALSE(step(overlap, /*dnd=*/false));
    EXPECT_EQ(fsm.consecutive(), 0u);
  }

  TEST_F(TriggerStateMachineTest, DndDroppingResetsTheCount) {
    EXPECT_FALSE(step(overlap));
    EXPECT_FALSE(step(overlap));
    EXPECT_FALSE(step(overlap, /*dnd=*/false));
    EXPECT_FALSE(step(overlap));
    EXPECT_EQ(fsm.consecutive(), 1u);
  }

  TEST_F(TriggerStateMachineTest, CooldownMutesEverything) {
    for (int i = 0; i < 3; ++i)
      step(overlap);
    ASSERT_EQ(fsm.state(), TriggerState::Triggered);
    fsm.markDispatched(now);
    EXPECT_EQ(fsm.state(), TriggerState::Cooldown);

    for (int i = 0; i < 50; ++i) // 5 s of continuous overlap
      EXPECT_FALSE(step(overlap));
    EXPECT_EQ(fsm.state(), TriggerState::Cooldown);
    EXPECT_GT(fsm.cooldownRemaining(now), TriggerStateMachine::Clock::duration::zero());
  }

  TEST_F(TriggerStateMachineTest, CooldownExpiryReturnsToIdle) {
    for (int i = 0; i < 3; ++i)
      step(overlap);
    fsm.markDispatched(now);

    now += 10s;
    EXPECT_FALSE(step(clear));
    EXPECT_EQ(fsm.state(), TriggerState::Idle);
    EXPECT_EQ(fsm.cooldownRemaining(now), TriggerStateMachine::Clock::duration::zero());

    EXPECT_FALSE(step(overlap));
    EXPECT_FALSE(step(overlap));
    EXPECT_TRUE(step(overlap));
  }

  TEST_F(TriggerStateMachineTest, OverlapHeldThroughCooldownFiresRightAfterIt) {
    for (int i = 0; i < 3; ++i)
      step(overlap);
    fsm.markDispatched(now);

    for (int i = 0; i < 5; ++i)
      EXPECT_FALSE(step(overlap));
    now += 10s;
    EXPECT_TRUE(step(overlap));
  }

  TEST_F(TriggerStateMachineTest, MarkDispatchedOutsideTriggeredIsIgnored) {
    fsm.markDispatched(now);
    EXPECT_EQ(fsm.state(), TriggerState::Idle);
  }

  TEST_F(TriggerStateMachineTest, KOfOneTriggersOnFirstOverlap) {
    TriggerStateMachine eager(1, 0s);
    EXPECT_TRUE(eager.step(overlap, true, now).shouldTrigger);
    eager.markDispatched(now);
    EXPECT_TRUE(eager.step(overlap, true, now).shouldTrigger); // zero cooldown
  }

  TEST(TriggerStateMachine, RejectsBadParameters) {
    using namespace std::chrono_literals;
    EXPECT_THROW(TriggerStateMachine(0, 1s), std::invalid_argument);
    EXPECT_THROW(TriggerStateMachine(3, -1s), std::invalid_argument);
  }

  TEST(TriggerStateMachine, StateNames) {
    EXPECT_STREQ(pfd::core::toString(TriggerState::Idle), "IDLE");
    EXPECT_STREQ(pfd::core::toString(TriggerState::Cooldown), "COOLDOWN");
  }

} // namespace pfd::test
