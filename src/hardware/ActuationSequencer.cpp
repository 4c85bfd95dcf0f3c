/* @file ActuationSequencer.cpp
 * @brief spray sequence with unconditional dispenser-off and return-to-rest
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cassert>
#include <sstream>
#include <string>
#include <utility>

// PFD headers
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "hardware/ActuationSequencer.hpp"

namespace pfd {
  namespace hardware {

    const char* toString(ActuationError e) {
      switch (e) {
      case ActuationError::AimFailed:
        return "aim-failed";
      case ActuationError::AimTimeout:
        return "aim-timeout";
      case ActuationError::DispenseFailed:
        return "dispense-failed";
      case ActuationError::DispenseTimeout:
        return "dispense-timeout";
      case ActuationError::Aborted:
        return "aborted";
      case ActuationError::ReleaseFailed:
        return "release-failed";
      default:
        return "unknown";
      }
    }

    namespace {
      constexpr const char* kTag = "ActuationSequencer";

      std::string describe(const core::ActuatorAngles& a) {
        std::ostringstream out;
        out << '(' << a.a1 << ", " << a.a2 << ')';
        return out.str();
      }
    } // namespace

    ActuationSequencer::ActuationSequencer(Actuator& actuator, SequencerConfig config,
                                           std::shared_ptr<core::Logger> logger,
                                           std::shared_ptr<core::ErrorMonitor> errorMonitor)
        : actuator_(actuator), config_(config), logger_(std::move(logger)),
          errorMonitor_(std::move(errorMonitor)) {
      assert(logger_ && "[ActuationSequencer] logger is nullptr");
      assert(errorMonitor_ && "[ActuationSequencer] error monitor is nullptr");
      config_.movementSteps = std::max(1u, config_.movementSteps);
    }

    void ActuationSequencer::requestAbort() {
      {
        std::lock_guard<std::mutex> lock(waitMtx_);
        abort_.store(true);
      }
      waitCv_.notify_all();
    }

    void ActuationSequencer::clearAbort() { abort_.store(false); }

    bool ActuationSequencer::waitFor(std::chrono::milliseconds d) {
      std::unique_lock<std::mutex> lock(waitMtx_);
      return !waitCv_.wait_for(lock, d, [this] { return abort_.load(); });
    }

    bool ActuationSequencer::moveTo(const core::ActuatorAngles& target, bool smooth,
                                    LinkStatus& status) {
      const unsigned steps = (smooth && position_) ? config_.movementSteps : 1u;
      const core::ActuatorAngles from = position_.value_or(target);
      const auto pause = config_.movementDuration / steps;

      for (unsigned i = 1; i <= steps; ++i) {
        const double f = static_cast<double>(i) / static_cast<double>(steps);
        const core::ActuatorAngles waypoint = (i == steps)
                                                  ? target
                                                  : core::ActuatorAngles{
                                                        from.a1 + (target.a1 - from.a1) * f,
                                                        from.a2 + (target.a2 - from.a2) * f };

        status = actuator_.setAngles(waypoint, config_.stepTimeout);
        if (status != LinkStatus::Ok) {
          position_.reset();
          return false;
        }
        position_ = waypoint;

        if (i < steps && smooth && !waitFor(pause))
          return false; // aborted mid-move, status stays Ok
      }
      return true;
    }

    bool ActuationSequencer::release() {
      bool ok = true;

      const auto off = actuator_.setDispenser(false, config_.stepTimeout);
      if (off != LinkStatus::Ok) {
        ok = false;
        logger_->error(kTag, std::string("dispenser-off not acknowledged: ") + toString(off));
        errorMonitor_->notifyFailure("[ActuationSequencer] dispenser-off " +
                                     std::string(toString(off)));
      }

      // never smooth here: the way back must not depend on the abort flag
      LinkStatus st = LinkStatus::Ok;
      if (!moveTo(config_.rest, /*smooth=*/false, st)) {
        ok = false;
        logger_->error(kTag, std::string("return-to-rest not acknowledged: ") + toString(st));
        errorMonitor_->notifyFailure("[ActuationSequencer] return-to-rest " +
                                     std::string(toString(st)));
      }
      return ok;
    }

    bool ActuationSequencer::parkAtRest() { return release(); }

    std::optional<ActuationError> ActuationSequencer::execute(const SprayCommand& cmd) {
      logger_->info(kTag, "spray at " + describe(cmd.target) + " for " +
                              std::to_string(cmd.duration.count()) + " ms");

      std::optional<ActuationError> err;

      // 1. aim
      if (abort_.load()) {
        err = ActuationError::Aborted;
      } else {
        LinkStatus st = LinkStatus::Ok;
        if (!moveTo(cmd.target, /*smooth=*/true, st)) {
          if (st == LinkStatus::Ok)
            err = ActuationError::Aborted;
          else
            err = (st == LinkStatus::Timeout) ? ActuationError::AimTimeout
                                              : ActuationError::AimFailed;
        }
      }

      // 2. settle
      if (!err && !waitFor(config_.settleDelay))
        err = ActuationError::Aborted;

      // 3. dispense
      if (!err) {
        const auto on = actuator_.setDispenser(true, config_.stepTimeout);
        if (on != LinkStatus::Ok)
          err = (on == LinkStatus::Timeout) ? ActuationError::DispenseTimeout
                                            : ActuationError::DispenseFailed;
        else if (!waitFor(cmd.duration))
          err = ActuationError::Aborted;
      }

      // 4. + 5. unconditional
      if (!release() && !err)
        err = ActuationError::ReleaseFailed;

      if (err) {
        logger_->warn(kTag, std::string("sequence ended early: ") + toString(*err));
        if (*err != ActuationError::Aborted)
          errorMonitor_->notifyFailure(std::string("[ActuationSequencer] ") + toString(*err));
      } else {
        logger_->info(kTag, "spray sequence completed");
      }
      return err;
    }

  } // namespace hardware
} // namespace pfd
