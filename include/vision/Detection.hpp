#pragma once
/** @file  Detection.hpp
 *  @brief Per-frame detector output and the fused per-tick Observation.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "core/Geometry.hpp"

namespace pfd {
  namespace vision {

    enum class DetectionClass : std::uint8_t { Object, Hand, Face, Count };
    static_assert(static_cast<std::uint8_t>(DetectionClass::Count) == 3,
                  "DetectionClass count changed please update FusionEngine thresholds");

    inline const char* toString(DetectionClass c) {
      switch (c) {
      case DetectionClass::Object:
        return "object";
      case DetectionClass::Hand:
        return "hand";
      case DetectionClass::Face:
        return "face";
      default:
        return "unknown";
      }
    }

    /// Accepts the wire names used by the detector ("phone" is an alias for object).
    inline std::optional<DetectionClass> detectionClassFromString(std::string_view name) {
      if (name == "object" || name == "phone")
        return DetectionClass::Object;
      if (name == "hand")
        return DetectionClass::Hand;
      if (name == "face")
        return DetectionClass::Face;
      return std::nullopt;
    }

    /// One detector hit; lives for a single frame.
    struct Detection {
      core::BoundingBox box;
      float confidence{ 0.0f };
      DetectionClass cls{ DetectionClass::Object };
    };

    /**
 * @struct Observation
 * @brief What FusionEngine made of one frame.
 *
 *  * `overlapping` implies both `hand` and `object` are present.
 *  * `target` is absent only when `object` is absent and no face was seen.
 */
    struct Observation {
      std::optional<Detection> object;
      std::optional<Detection> hand;
      std::optional<Detection> face;
      bool overlapping{ false };
      std::optional<core::Point2D> target;
    };

    /// Minimum confidence per class, indexed by DetectionClass.
    using ClassThresholds = std::array<float, static_cast<std::size_t>(DetectionClass::Count)>;

  } // namespace vision
} // namespace pfd
