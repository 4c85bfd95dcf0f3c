#pragma once
/** @file  Geometry.hpp
 *  @brief Normalized camera-space and actuator-space value types.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>

namespace pfd {
  namespace core {

    /// Normalized camera coordinate, (0,0) = top-left, (1,1) = bottom-right.
    struct Point2D {
      double u{ 0.0 };
      double v{ 0.0 };

      bool operator==(const Point2D&) const = default;
    };

    /**
 * @struct BoundingBox
 * @brief Axis-aligned box in normalized frame coordinates.
 *
 *  * Valid iff `xMin < xMax && yMin < yMax`.
 */
    struct BoundingBox {
      double xMin{ 0.0 };
      double yMin{ 0.0 };
      double xMax{ 0.0 };
      double yMax{ 0.0 };

      bool valid() const { return xMin < xMax && yMin < yMax; }
      double width() const { return xMax - xMin; }
      double height() const { return yMax - yMin; }
      Point2D center() const { return { (xMin + xMax) * 0.5, (yMin + yMax) * 0.5 }; }

      /// Area shared with \p other; 0 when disjoint or only touching.
      double intersectionArea(const BoundingBox& other) const {
        const double w = std::min(xMax, other.xMax) - std::max(xMin, other.xMin);
        const double h = std::min(yMax, other.yMax) - std::max(yMin, other.yMin);
        return (w > 0.0 && h > 0.0) ? w * h : 0.0;
      }

      bool operator==(const BoundingBox&) const = default;
    };

    /// Servo angles in degrees: a1 = pan (azimuth), a2 = tilt (elevation).
    struct ActuatorAngles {
      double a1{ 0.0 };
      double a2{ 0.0 };

      bool operator==(const ActuatorAngles&) const = default;
    };

    /// Inclusive per-axis limits of the mechanism.
    struct AngleRange {
      double min{ 0.0 };
      double max{ 180.0 };

      bool contains(double a) const { return a >= min && a <= max; }
      double clamp(double a) const { return std::clamp(a, min, max); }
    };

  } // namespace core
} // namespace pfd
