#pragma once
/** @file  KinematicsMapper.hpp
 *  @brief Camera point → servo angles through the calibration patch.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>

#include "core/Geometry.hpp"
#include "hardware/CalibrationMap.hpp"

namespace pfd::hardware {

  struct MappingResult {
    core::ActuatorAngles angles;
    bool wasClamped{ false }; ///< input left the patch, angles hit the safe range, or rest fallback
  };

  /**
 * @class KinematicsMapper
 * @brief Interpolates inside the calibrated patch only; never extrapolates.
 *
 *  * Fractional patch coordinates are clamped to [0,1] before blending.
 *  * Results are clamped per axis to the mechanism's safe range.
 *  * Absent or degenerate calibration yields the rest angles.
 */
  class KinematicsMapper {
  public:
    /// Slack before a fractional coordinate counts as outside the patch.
    static constexpr double kFractionTolerance = 1e-9;

    KinematicsMapper(core::AngleRange pan, core::AngleRange tilt, core::ActuatorAngles rest);

    MappingResult map(const core::Point2D& target,
                      const std::optional<CalibrationMap>& calib) const;

    /// Clamp to the safe range; sets \p clamped when anything moved.
    core::ActuatorAngles clampToSafe(const core::ActuatorAngles& raw, bool& clamped) const;

    const core::ActuatorAngles& rest() const { return rest_; }

  private:
    core::AngleRange pan_;
    core::AngleRange tilt_;
    core::ActuatorAngles rest_;
  };

} // namespace pfd::hardware
