#pragma once
/** @file  Detector.hpp
 *  @brief Abstract source of per-frame detections.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>
#include <vector>

#include "vision/Detection.hpp"

namespace pfd::vision {

  /// Hard detector failure (device lost). "Nothing seen" is an empty list instead.
  class DetectorError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /**
 * @class Detector
 * @brief Whatever model pipeline produces boxes: the Orchestrator only polls.
 *
 *  * `poll()` is bounded-blocking and returns the latest frame's detections.
 *  * Throws DetectorError only for hard failures.
 */
  class Detector {
  public:
    virtual ~Detector() = default;

    virtual std::vector<Detection> poll() = 0;
  };

} // namespace pfd::vision
