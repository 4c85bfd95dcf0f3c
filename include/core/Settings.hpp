#pragma once
/** @file  Settings.hpp
 *  @brief Typed, validated view of settings.json.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>
#include <termios.h> // speed_t

#include "core/Geometry.hpp"
#include "core/Logger.hpp"
#include "hardware/ActuationSequencer.hpp"
#include "hardware/CalibrationMap.hpp"
#include "vision/Detection.hpp"

namespace pfd::core {

  /**
 * @struct Settings
 * @brief Everything the core consumes, resolved and range-checked.
 *
 * Durations are written in seconds in the file (as floats) and held as
 * milliseconds here. Every key is optional; defaults match the stock desk.
 */
  struct Settings {
    //---vision-----------------------------------------------------------
    vision::ClassThresholds thresholds{ 0.7f, 0.7f, 0.7f };
    std::optional<BoundingBox> objectZone;          ///< static phone zone
    std::chrono::milliseconds detectorPollTimeout{ 50 };

    //---trigger----------------------------------------------------------
    unsigned minConsecutive{ 3 };
    std::chrono::milliseconds cooldown{ 10000 };

    //---actuation--------------------------------------------------------
    std::chrono::milliseconds dispenseDuration{ 500 };
    hardware::SequencerConfig sequencer{};
    AngleRange panRange{ 0.0, 180.0 };
    AngleRange tiltRange{ 0.0, 180.0 };

    //---loop / control plane---------------------------------------------
    std::chrono::milliseconds tickInterval{ 100 };
    std::chrono::milliseconds dndStaleness{ 30000 };

    //---calibration------------------------------------------------------
    std::optional<hardware::CalibrationMap> calibration;

    //---devices----------------------------------------------------------
    std::string actuatorDevice{ "/dev/ttyACM0" };
    std::string detectorDevice{ "/dev/ttyUSB0" };
    std::string controlDevice{ "/dev/rfcomm0" };
    speed_t baud{ B115200 };

    //---logging----------------------------------------------------------
    std::string logFile{ "phone-free-desk.csv" };
    LogLevel consoleLevel{ LogLevel::Info };

    /// Throws std::runtime_error naming the offending key.
    static Settings fromJson(const nlohmann::json& doc);
  };

  /// 9600 ... 230400 → termios constant; throws std::runtime_error otherwise.
  speed_t baudFromInt(long baud);

} // namespace pfd::core
