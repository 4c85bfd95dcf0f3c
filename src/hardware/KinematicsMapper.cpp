/* @file KinematicsMapper.cpp
 * @brief clamped bilinear targeting with fail-closed rest fallback
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>
#include <stdexcept>

#include "hardware/KinematicsMapper.hpp"

using namespace pfd::hardware;
using pfd::core::ActuatorAngles;

KinematicsMapper::KinematicsMapper(core::AngleRange pan, core::AngleRange tilt, ActuatorAngles rest)
    : pan_(pan), tilt_(tilt), rest_(rest) {
  if (!(pan_.min < pan_.max) || !(tilt_.min < tilt_.max))
    throw std::invalid_argument("[KinematicsMapper] safe range min must be below max");
  if (!pan_.contains(rest_.a1) || !tilt_.contains(rest_.a2))
    throw std::invalid_argument("[KinematicsMapper] rest angles outside the safe range");
}

ActuatorAngles KinematicsMapper::clampToSafe(const ActuatorAngles& raw, bool& clamped) const {
  const ActuatorAngles out{ pan_.clamp(raw.a1), tilt_.clamp(raw.a2) };
  if (out != raw)
    clamped = true;
  return out;
}

MappingResult KinematicsMapper::map(const core::Point2D& target,
                                    const std::optional<CalibrationMap>& calib) const {
  if (!calib || !calib->valid())
    return { rest_, true };

  const auto frac = calib->fractional(target);
  if (!frac)
    return { rest_, true };

  bool clamped = false;
  auto clampFraction = [&clamped](double x) {
    if (x < -kFractionTolerance || x > 1.0 + kFractionTolerance)
      clamped = true;
    return std::clamp(x, 0.0, 1.0);
  };
  const double s = clampFraction(frac->u);
  const double t = clampFraction(frac->v);

  const ActuatorAngles angles = clampToSafe(calib->blend(s, t), clamped);
  return { angles, clamped };
}
