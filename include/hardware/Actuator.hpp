#pragma once
/** @file  Actuator.hpp
 *  @brief Hardware collaborator: pan/tilt servos plus the dispenser pump.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>

#include "core/Geometry.hpp"

namespace pfd::hardware {

  enum class LinkStatus : std::uint8_t { Ok, Failed, Timeout };

  inline const char* toString(LinkStatus s) {
    switch (s) {
    case LinkStatus::Ok:
      return "ok";
    case LinkStatus::Failed:
      return "failed";
    case LinkStatus::Timeout:
      return "timeout";
    default:
      return "unknown";
    }
  }

  /**
 * @class Actuator
 * @brief Every call blocks for at most \p timeout and reports how it went.
 *
 *  * Repeating the current state is a no-op that reports Ok.
 *  * Implementations must stay callable after a failure: the sequencer
 *    always follows up with dispenser-off and return-to-rest.
 */
  class Actuator {
  public:
    virtual ~Actuator() = default;

    virtual LinkStatus setAngles(const core::ActuatorAngles& angles,
                                 std::chrono::milliseconds timeout) = 0;
    virtual LinkStatus setDispenser(bool on, std::chrono::milliseconds timeout) = 0;
  };

} // namespace pfd::hardware
