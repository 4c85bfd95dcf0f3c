/* @file FusionEngine.cpp
 * @brief object/hand/face fusion into one Observation per tick
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>

#include "vision/FusionEngine.hpp"

using namespace pfd::vision;

FusionEngine::FusionEngine(ClassThresholds thresholds, std::optional<core::BoundingBox> objectZone)
    : thresholds_(thresholds), objectZone_(objectZone) {
  if (objectZone_ && !objectZone_->valid())
    throw std::invalid_argument("[FusionEngine] object zone must have xMin < xMax and yMin < yMax");
}

std::optional<Detection> FusionEngine::best(const std::vector<Detection>& detections,
                                            DetectionClass cls) const {
  const float threshold = thresholds_[static_cast<std::size_t>(cls)];

  std::optional<Detection> winner;
  for (const auto& det : detections) {
    if (det.cls != cls || !det.box.valid() || det.confidence <= threshold)
      continue;
    // strict '>' keeps the first of equal-confidence hits: order-stable
    if (!winner || det.confidence > winner->confidence)
      winner = det;
  }
  return winner;
}

Observation FusionEngine::fuse(const std::vector<Detection>& detections) const {
  Observation obs;
  obs.object = best(detections, DetectionClass::Object);
  obs.hand = best(detections, DetectionClass::Hand);
  obs.face = best(detections, DetectionClass::Face);

  if (!obs.object && objectZone_)
    obs.object = Detection{ *objectZone_, 1.0f, DetectionClass::Object };

  obs.overlapping = obs.hand && obs.object && obs.hand->box.intersectionArea(obs.object->box) > 0.0;

  if (obs.face) {
    obs.target = obs.face->box.center();
  } else if (obs.object) {
    const auto& box = obs.object->box;
    obs.target = core::Point2D{ box.center().u, box.yMin + kHeadRegionFraction * box.height() };
  }
  return obs;
}
