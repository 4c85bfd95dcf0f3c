#pragma once
/** @file  SerialDetector.hpp
 *  @brief Detector fed by a vision co-processor emitting JSON-lines frames.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "vision/Detector.hpp"

namespace pfd {
  namespace core {
    class Logger;
  } // namespace core
  namespace io {
    class SerialChannel;
  } // namespace io

  namespace vision {

    /**
 * @class SerialDetector
 * @brief Reads `{"detections":[{"class":..,"confidence":..,"box":[x0,y0,x1,y1]}]}`
 *        lines and hands back the newest complete frame.
 *
 *  * Waits at most `pollTimeout` for the first line, then drains whatever is
 *    already queued so a slow loop never works on stale frames.
 *  * Malformed frames are logged and treated as empty.
 *  * A closed link raises DetectorError.
 */
    class SerialDetector : public Detector {
    public:
      SerialDetector(std::unique_ptr<io::SerialChannel> channel, std::chrono::milliseconds pollTimeout,
                     std::shared_ptr<core::Logger> logger);
      ~SerialDetector() override;

      std::vector<Detection> poll() override;

      /// Parse one frame line; std::nullopt if it is not a detection frame.
      static std::optional<std::vector<Detection>> parseFrame(const std::string& line);

    private:
      std::unique_ptr<io::SerialChannel> channel_;
      std::chrono::milliseconds pollTimeout_;
      std::shared_ptr<core::Logger> logger_;
    };

  } // namespace vision
} // namespace pfd
