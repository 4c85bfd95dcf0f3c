#pragma once
/** @file  ActuationSequencer.hpp
 *  @brief aim → settle → dispense → release, with guaranteed release.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

// PFD headers
#include "core/Geometry.hpp"
#include "hardware/Actuator.hpp"

namespace pfd {
  namespace core {
    class ErrorMonitor;
    class Logger;
  } // namespace core

  namespace hardware {

    enum class ActuationError : std::uint8_t {
      AimFailed,
      AimTimeout,
      DispenseFailed,
      DispenseTimeout,
      Aborted,      ///< shutdown interrupted the sequence; release still ran
      ReleaseFailed ///< dispenser-off or return-to-rest was not acknowledged
    };

    const char* toString(ActuationError e);

    /// One spray: created per trigger, consumed synchronously.
    struct SprayCommand {
      core::ActuatorAngles target;
      std::chrono::milliseconds duration{ 0 };
    };

    struct SequencerConfig {
      core::ActuatorAngles rest{ 90.0, 90.0 };
      std::chrono::milliseconds settleDelay{ 300 };
      std::chrono::milliseconds stepTimeout{ 2000 }; ///< bound on every hardware call
      std::chrono::milliseconds movementDuration{ 500 };
      unsigned movementSteps{ 20 }; ///< 1 = jump straight to the target
    };

    /**
 * @class ActuationSequencer
 * @brief Runs one SprayCommand against the Actuator.
 *
 *  1. move to the target   2. settle   3. dispense for the duration
 *  4. dispenser off        5. back to rest
 *
 *  * Steps 4 and 5 always run, also after a failure, a timeout or an abort.
 *  * `requestAbort()` may be called from another thread; it cuts short the
 *    waits of steps 1-3 only.
 *  * Not re-entrant. The Orchestrator never overlaps calls.
 */
    class ActuationSequencer {
    public:
      ActuationSequencer(Actuator& actuator, SequencerConfig config,
                         std::shared_ptr<core::Logger> logger,
                         std::shared_ptr<core::ErrorMonitor> errorMonitor);

      /// std::nullopt on success, otherwise the first thing that went wrong.
      std::optional<ActuationError> execute(const SprayCommand& cmd);

      /// Dispenser off, then rest. Used at start-up and shutdown. True if both acked.
      bool parkAtRest();

      void requestAbort();
      void clearAbort();
      bool abortRequested() const { return abort_.load(); }

      const SequencerConfig& config() const { return config_; }

    private:
      /// Interpolated move; false with \p status set on the first bad step.
      bool moveTo(const core::ActuatorAngles& target, bool smooth, LinkStatus& status);

      /// Sleeps \p d unless an abort arrives first; returns false if aborted.
      bool waitFor(std::chrono::milliseconds d);

      bool release();

      Actuator& actuator_;
      SequencerConfig config_;
      std::shared_ptr<core::Logger> logger_;
      std::shared_ptr<core::ErrorMonitor> errorMonitor_;

      std::optional<core::ActuatorAngles> position_; ///< last acknowledged pose
      std::atomic<bool> abort_{ false };
      std::mutex waitMtx_;
      std::condition_variable waitCv_;
    };

  } // namespace hardware
} // namespace pfd
