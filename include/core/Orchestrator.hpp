#pragma once

/** @file  Orchestrator.hpp
 *  @brief Fixed-rate sense → decide → aim → spray loop.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "core/Settings.hpp"
#include "core/TriggerStateMachine.hpp"
#include "hardware/ActuationSequencer.hpp"
#include "hardware/CalibrationMap.hpp"
#include "hardware/KinematicsMapper.hpp"
#include "vision/FusionEngine.hpp"

namespace pfd {
  namespace vision {
    class Detector;
  } // namespace vision

  namespace core {

    class DndProvider;
    class ErrorMonitor;
    class Logger;

    /// What one tick did; returned by tick() for the caller (and tests).
    struct TickReport {
      bool dndActive{ false };
      vision::Observation observation;
      Decision decision;
      std::optional<hardware::MappingResult> mapping;     ///< set when a spray was dispatched
      std::optional<hardware::ActuationError> actuation; ///< error of that spray, if any
    };

    /**
 * @class Orchestrator
 * @brief Owns the per-tick pipeline and the thread that paces it.
 *
 *  * One tick: read DND → poll detector → fuse → step FSM → on trigger map the
 *    target and run the spray sequence synchronously.
 *  * A spray occupies as many tick periods as it takes; the loop resumes
 *    right after it without catch-up bursts.
 *  * `stop()` aborts an in-flight spray; its release steps still run before
 *    `stop()` returns.
 */
    class Orchestrator {
    public:
      using Clock = std::chrono::steady_clock;
      using ClockFn = std::function<Clock::time_point()>;

      Orchestrator(const Settings& settings, vision::Detector& detector, DndProvider& dnd,
                   hardware::ActuationSequencer& sequencer, std::shared_ptr<Logger> logger,
                   std::shared_ptr<ErrorMonitor> errorMonitor, ClockFn clock = Clock::now);
      ~Orchestrator();

      Orchestrator(const Orchestrator&) = delete;
      Orchestrator& operator=(const Orchestrator&) = delete;

      // ---- Public API ----------------------------------------------------------
      void start(); ///< launch the loop thread
      void stop();  ///< exit between ticks, abort + release any spray in flight
      bool running() const { return running_.load(); }

      /// Run exactly one tick on the caller's thread.
      TickReport tick();

      TriggerState triggerState() const { return trigger_.state(); }
      const std::optional<hardware::CalibrationMap>& calibration() const { return calibration_; }

    private:
      void loop();
      bool readDnd(Clock::time_point now);
      std::vector<vision::Detection> pollDetector();
      void logTransition(TriggerState before);

      vision::Detector& detector_;
      DndProvider& dnd_;
      hardware::ActuationSequencer& sequencer_;
      std::shared_ptr<Logger> logger_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      ClockFn clock_;

      vision::FusionEngine fusion_;
      TriggerStateMachine trigger_;
      hardware::KinematicsMapper mapper_;
      std::optional<hardware::CalibrationMap> calibration_;

      std::chrono::milliseconds tickInterval_;
      std::chrono::milliseconds dndStaleness_;
      std::chrono::milliseconds dispenseDuration_;

      // last good DND read, for the staleness bound
      bool lastDnd_{ false };
      std::optional<Clock::time_point> lastDndRead_;
      bool staleReported_{ false };

      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::mutex pacingMtx_;
      std::condition_variable pacingCv_;
    };

  } // namespace core
} // namespace pfd
