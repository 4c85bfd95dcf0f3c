#pragma once
/** @file  CalibrationMap.hpp
 *  @brief Four camera→servo correspondences spanning a bilinear patch.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "core/Geometry.hpp"

namespace pfd::hardware {

  enum class Corner : std::uint8_t { TopLeft, TopRight, BottomLeft, BottomRight, Count };
  static_assert(static_cast<std::uint8_t>(Corner::Count) == 4,
                "a bilinear patch has exactly four corners");

  const char* toString(Corner c);
  std::optional<Corner> cornerFromString(std::string_view name); ///< "top_left", ...

  /// Where the arm pointed (angles) when the marker sat at `camera`.
  struct CalibrationCorner {
    core::Point2D camera;
    core::ActuatorAngles angles;
  };

  /**
 * @class CalibrationMap
 * @brief Holds the corners keyed by position and knows whether they form a
 *        usable patch.
 *
 *  * Positions are assigned from the camera points themselves (two smallest v
 *    are the top edge, smaller u is left), never from the order given.
 *  * `valid()` requires a convex quadrilateral TL→TR→BR→BL with no three
 *    corners collinear. Callers must not interpolate an invalid map.
 */
  class CalibrationMap {
  public:
    using Corners = std::array<CalibrationCorner, 4>;

    /// Minimum |cross product| of consecutive edges; smaller counts as collinear.
    static constexpr double kDegenerateEpsilon = 1e-9;

    explicit CalibrationMap(const Corners& anyOrder);

    bool valid() const { return valid_; }
    const CalibrationCorner& corner(Corner c) const {
      return corners_[static_cast<std::size_t>(c)];
    }

    /// Replace one corner, then re-identify positions and re-validate.
    void setCorner(Corner c, const CalibrationCorner& value);

    /**
   * @brief Fractional patch coordinates (s along top edge, t down the side) of
   *        \p target, NOT clamped. std::nullopt if the map is invalid or the
   *        inverse has no usable solution.
   */
    std::optional<core::Point2D> fractional(const core::Point2D& target) const;

    /// Bilinear blend of the four corner angle pairs at (s, t).
    core::ActuatorAngles blend(double s, double t) const;

    /// Vertex average of the camera points; maps to (0.5, 0.5).
    core::Point2D centroid() const;

    //---JSON (settings.json corner dictionary)---------------------------
    /// `{"top_left":{"cam_x":..,"cam_y":..,"servo1":..,"servo2":..}, ...}`
    nlohmann::json toJson() const;

    /// Throws std::runtime_error on missing corners or non-numeric fields.
    static CalibrationMap fromJson(const nlohmann::json& corners);

  private:
    void identify(Corners anyOrder);

    Corners corners_{};
    bool valid_{ false };
  };

} // namespace pfd::hardware
