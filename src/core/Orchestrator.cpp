/* @file Orchestrator.cpp
 * @brief the control loop: one direction per tick, spray runs inline
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <exception>
#include <sstream>
#include <string>
#include <utility>

// PFD headers
#include "core/DndState.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/Orchestrator.hpp"
#include "vision/Detector.hpp"

using namespace pfd::core;

namespace {
  constexpr const char* kTag = "Orchestrator";

  std::string describe(const pfd::core::Point2D& p) {
    std::ostringstream out;
    out << '(' << p.u << ", " << p.v << ')';
    return out.str();
  }

  std::string describe(const pfd::core::ActuatorAngles& a) {
    std::ostringstream out;
    out << '(' << a.a1 << ", " << a.a2 << ')';
    return out.str();
  }
} // namespace

Orchestrator::Orchestrator(const Settings& settings, vision::Detector& detector, DndProvider& dnd,
                           hardware::ActuationSequencer& sequencer, std::shared_ptr<Logger> logger,
                           std::shared_ptr<ErrorMonitor> errorMonitor, ClockFn clock)
    : detector_(detector), dnd_(dnd), sequencer_(sequencer), logger_(std::move(logger)),
      errorMonitor_(std::move(errorMonitor)), clock_(std::move(clock)),
      fusion_(settings.thresholds, settings.objectZone),
      trigger_(settings.minConsecutive, settings.cooldown),
      mapper_(settings.panRange, settings.tiltRange, settings.sequencer.rest),
      calibration_(settings.calibration), tickInterval_(settings.tickInterval),
      dndStaleness_(settings.dndStaleness), dispenseDuration_(settings.dispenseDuration) {
  assert(logger_ && "[Orchestrator] logger is nullptr");
  assert(errorMonitor_ && "[Orchestrator] error monitor is nullptr");
  assert(clock_ && "[Orchestrator] clock is empty");

  if (!calibration_)
    logger_->warn(kTag, "no calibration: every spray will aim at the rest position");
  else if (!calibration_->valid())
    logger_->warn(kTag, "calibration corners are degenerate: every spray will aim at rest");
}

Orchestrator::~Orchestrator() { stop(); }

void Orchestrator::start() {
  if (running_.exchange(true))
    return;
  sequencer_.clearAbort();
  worker_ = std::thread([this] { loop(); });
  logger_->info(kTag, "control loop started");
}

void Orchestrator::stop() {
  if (!running_.exchange(false))
    return;

  sequencer_.requestAbort();
  { std::lock_guard<std::mutex> lock(pacingMtx_); }
  pacingCv_.notify_all();
  if (worker_.joinable())
    worker_.join();
  logger_->info(kTag, "control loop stopped");
}

bool Orchestrator::readDnd(Clock::time_point now) {
  if (auto st = dnd_.read()) {
    lastDnd_ = st->active;
    lastDndRead_ = now;
    staleReported_ = false;
    return lastDnd_;
  }

  // unreachable: last value while fresh, then fail safe
  if (lastDndRead_ && now - *lastDndRead_ <= dndStaleness_)
    return lastDnd_;

  if (!staleReported_) {
    logger_->warn(kTag, "DND state unknown or stale; treating it as off");
    staleReported_ = true;
  }
  return false;
}

std::vector<pfd::vision::Detection> Orchestrator::pollDetector() {
  try {
    return detector_.poll();
  } catch (const std::exception& e) {
    // DetectorError or anything else the device layer throws: same empty frame
    logger_->warn(kTag, std::string("detector failure, empty frame: ") + e.what());
    errorMonitor_->notifyFailure(e.what());
    return {};
  }
}

void Orchestrator::logTransition(TriggerState before) {
  const auto after = trigger_.state();
  if (after != before)
    logger_->debug(kTag, std::string(toString(before)) + " -> " + toString(after));
}

TickReport Orchestrator::tick() {
  TickReport report;
  const auto now = clock_();

  report.dndActive = readDnd(now);
  report.observation = fusion_.fuse(pollDetector());

  const auto before = trigger_.state();
  report.decision = trigger_.step(report.observation, report.dndActive, now);
  logTransition(before);

  if (!report.decision.shouldTrigger)
    return report;

  hardware::MappingResult mapping{ mapper_.rest(), true };
  if (report.decision.target) {
    mapping = mapper_.map(*report.decision.target, calibration_);
    logger_->info(kTag, "trigger: target " + describe(*report.decision.target) + " -> angles " +
                            describe(mapping.angles) + (mapping.wasClamped ? " (clamped)" : ""));
  } else {
    logger_->warn(kTag, "trigger without a target point; aiming at rest");
  }
  report.mapping = mapping;

  // a failed spray still costs a full cooldown, even one that threw
  const auto enterCooldown = [this] {
    const auto dispatched = trigger_.state();
    trigger_.markDispatched(clock_());
    logTransition(dispatched);
  };

  try {
    report.actuation =
        sequencer_.execute(hardware::SprayCommand{ mapping.angles, dispenseDuration_ });
  } catch (const std::exception&) {
    enterCooldown();
    throw;
  }
  if (report.actuation)
    logger_->warn(kTag, std::string("spray failed: ") + hardware::toString(*report.actuation));

  enterCooldown();
  return report;
}

void Orchestrator::loop() {
  auto next = Clock::now();

  while (running_.load()) {
    try {
      tick();
    } catch (const std::exception& e) {
      logger_->error(kTag, std::string("tick failed: ") + e.what());
      errorMonitor_->notifyFailure(std::string("[Orchestrator] ") + e.what());
    }

    next += tickInterval_;
    const auto now = Clock::now();
    if (next < now)
      next = now; // spray overran the period: carry on, no burst of make-up ticks

    std::unique_lock<std::mutex> lock(pacingMtx_);
    pacingCv_.wait_until(lock, next, [this] { return !running_.load(); });
  }
}
