// STL headers
#include <chrono>
#include <memory>
#include <thread>

// PFD headers
#include "core/Logger.hpp"
#include "hardware/ActuationSequencer.hpp"

// PFD-Fake headers
#include "FakeActuator.hpp"
#include "MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace pfd::test {

  using pfd::core::ActuatorAngles;
  using pfd::core::Logger;
  using pfd::core::LogLevel;
  using pfd::hardware::ActuationError;
  using pfd::hardware::ActuationSequencer;
  using pfd::hardware::LinkStatus;
  using pfd::hardware::SequencerConfig;
  using pfd::hardware::SprayCommand;
  using ::testing::_;
  using ::testing::HasSubstr;
  using namespace std::chrono_literals;

  class ActuationSequencerTest : public ::testing::Test {
  protected:
    void SetUp() override {
      logger = std::make_shared<Logger>();
      logger->setConsoleLevel(LogLevel::Error);
      errorMonitor = std::make_shared<testing::NiceMock<MockErrorMonitor>>();

      config.rest = { 90.0, 90.0 };
      config.settleDelay = 1ms;
      config.stepTimeout = 50ms;
      config.movementDuration = 4ms;
      config.movementSteps = 4;
      sequencer = std::make_unique<ActuationSequencer>(
          actuator, config, logger, std::static_pointer_cast<pfd::core::ErrorMonitor>(errorMonitor));
    }

    FakeActuator actuator;
    SequencerConfig config;
    std::shared_ptr<Logger> logger;
    std::shared_ptr<testing::NiceMock<MockErrorMonitor>> errorMonitor;
    std::unique_ptr<ActuationSequencer> sequencer;

    const SprayCommand spray{ ActuatorAngles{ 100.0, 80.0 }, 2ms };
  };

  TEST_F(ActuationSequencerTest, FullSequenceEndsOffAndAtRest) {
    EXPECT_CALL(*errorMonitor, notifyFailure(_)).Times(0);

    EXPECT_FALSE(sequencer->execute(spray));

    // no known pose before the first move: straight to target
    const auto moves = actuator.angleCalls();
    ASSERT_EQ(moves.size(), 2u);
    EXPECT_EQ(moves.front(), spray.target);
    EXPECT_EQ(moves.back(), config.rest);
    EXPECT_EQ(actuator.dispenserCalls(), (std::vector<bool>{ true, false }));
    EXPECT_FALSE(actuator.dispenser);
    EXPECT_EQ(actuator.angles, config.rest);
  }

  TEST_F(ActuationSequencerTest, AimIsInterpolatedFromKnownPose) {
    ASSERT_TRUE(sequencer->parkAtRest());
    actuator.calls.clear();

    EXPECT_FALSE(sequencer->execute(spray));

    const auto moves = actuator.angleCalls();
    ASSERT_EQ(moves.size(), 5u); // 4 waypoints + direct return
    EXPECT_DOUBLE_EQ(moves[0].a1, 92.5);
    EXPECT_DOUBLE_EQ(moves[0].a2, 87.5);
    EXPECT_DOUBLE_EQ(moves[1].a1, 95.0);
    EXPECT_EQ(moves[3], spray.target);
    EXPECT_EQ(moves[4], config.rest);
  }

  TEST_F(ActuationSequencerTest, DispenseFailureStillReleases) {
    actuator.dispenserOnStatus = LinkStatus::Failed;
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("dispense-failed"))).Times(1);

    EXPECT_EQ(sequencer->execute(spray), ActuationError::DispenseFailed);
    EXPECT_EQ(actuator.dispenserCalls(), (std::vector<bool>{ true, false }));
    EXPECT_EQ(actuator.angleCalls().back(), config.rest);
  }

  TEST_F(ActuationSequencerTest, DispenseTimeoutIsReportedAsSuch) {
    actuator.dispenserOnStatus = LinkStatus::Timeout;
    EXPECT_EQ(sequencer->execute(spray), ActuationError::DispenseTimeout);
    EXPECT_FALSE(actuator.dispenser);
  }

  TEST_F(ActuationSequencerTest, AimTimeoutSkipsDispenseButReleases) {
    actuator.anglesStatus = LinkStatus::Timeout;

    EXPECT_EQ(sequencer->execute(spray), ActuationError::AimTimeout);

    const auto pumps = actuator.dispenserCalls();
    ASSERT_EQ(pumps.size(), 1u);
    EXPECT_FALSE(pumps.front()); // only the off step ran
    EXPECT_EQ(actuator.angleCalls().back(), config.rest); // return-to-rest was attempted
  }

  TEST_F(ActuationSequencerTest, ReleaseFailureIsReported) {
    actuator.dispenserOffStatus = LinkStatus::Failed;
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("dispenser-off"))).Times(1);
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("release-failed"))).Times(1);

    EXPECT_EQ(sequencer->execute(spray), ActuationError::ReleaseFailed);
    EXPECT_EQ(actuator.angleCalls().back(), config.rest);
  }

  TEST_F(ActuationSequencerTest, AbortBeforeStartOnlyReleases) {
    EXPECT_CALL(*errorMonitor, notifyFailure(_)).Times(0);
    sequencer->requestAbort();

    EXPECT_EQ(sequencer->execute(spray), ActuationError::Aborted);
    EXPECT_EQ(actuator.dispenserCalls(), (std::vector<bool>{ false }));
    EXPECT_EQ(actuator.angleCalls(), (std::vector<ActuatorAngles>{ config.rest }));

    sequencer->clearAbort();
    EXPECT_FALSE(sequencer->abortRequested());
  }

  TEST_F(ActuationSequencerTest, AbortCutsDispenseShort) {
    const SprayCommand longSpray{ ActuatorAngles{ 100.0, 80.0 }, 10s };

    std::thread stopper([this] {
      std::this_thread::sleep_for(50ms);
      sequencer->requestAbort();
    });
    const auto start = std::chrono::steady_clock::now();
    const auto err = sequencer->execute(longSpray);
    const auto took = std::chrono::steady_clock::now() - start;
    stopper.join();

    EXPECT_EQ(err, ActuationError::Aborted);
    EXPECT_LT(took, 5s);
    EXPECT_EQ(actuator.dispenserCalls(), (std::vector<bool>{ true, false }));
    EXPECT_EQ(actuator.angles, config.rest);
  }

  TEST(ActuationErrorNames, AreStable) {
    EXPECT_STREQ(pfd::hardware::toString(ActuationError::AimTimeout), "aim-timeout");
    EXPECT_STREQ(pfd::hardware::toString(ActuationError::ReleaseFailed), "release-failed");
  }

} // namespace pfd::test
