#pragma once
/** @file  FusionEngine.hpp
 *  @brief Reduces one frame's detections to a single Observation.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <vector>

#include "vision/Detection.hpp"

namespace pfd::vision {

  /**
 * @class FusionEngine
 * @brief Pure per-frame fusion: best detection per class, hand/object overlap,
 *        aim point.
 *
 *  * No state, no I/O. Same input list, same Observation.
 *  * An optional static object zone stands in for the phone when the detector
 *    reports none (fixed phone-dock setups).
 */
  class FusionEngine {
  public:
    /// Aim point height inside the object box when no face is visible.
    static constexpr double kHeadRegionFraction = 0.2;

    explicit FusionEngine(ClassThresholds thresholds,
                          std::optional<core::BoundingBox> objectZone = std::nullopt);

    Observation fuse(const std::vector<Detection>& detections) const;

    const ClassThresholds& thresholds() const { return thresholds_; }

  private:
    std::optional<Detection> best(const std::vector<Detection>& detections,
                                  DetectionClass cls) const;

    ClassThresholds thresholds_;
    std::optional<core::BoundingBox> objectZone_;
  };

} // namespace pfd::vision
