/* @file Settings.cpp
 * @brief settings.json → Settings, with range checks
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

// PFD headers
#include "core/Settings.hpp"

using nlohmann::json;

namespace pfd::core {

  namespace {

    [[noreturn]] void fail(const std::string& key, const std::string& why) {
      throw std::runtime_error("[Settings] " + key + ": " + why);
    }

    /// Sub-object \p name of \p doc, or an empty object if absent.
    const json& section(const json& doc, const char* name) {
      static const json empty = json::object();
      auto it = doc.find(name);
      if (it == doc.end())
        return empty;
      if (!it->is_object())
        fail(name, "must be an object");
      return *it;
    }

    double number(const json& sec, const std::string& path, const char* key, double def) {
      auto it = sec.find(key);
      if (it == sec.end())
        return def;
      if (!it->is_number())
        fail(path + '.' + key, "must be a number");
      const double v = it->get<double>();
      if (!std::isfinite(v))
        fail(path + '.' + key, "must be finite");
      return v;
    }

    std::string text(const json& sec, const std::string& path, const char* key,
                     const std::string& def) {
      auto it = sec.find(key);
      if (it == sec.end())
        return def;
      if (!it->is_string())
        fail(path + '.' + key, "must be a string");
      return it->get<std::string>();
    }

    constexpr double kMaxSeconds = 24.0 * 3600.0;

    /// Seconds in the file, milliseconds in memory.
    std::chrono::milliseconds seconds(const json& sec, const std::string& path, const char* key,
                                      std::chrono::milliseconds def) {
      const double s = number(sec, path, key, static_cast<double>(def.count()) / 1000.0);
      if (s < 0.0)
        fail(path + '.' + key, "must not be negative");
      if (s > kMaxSeconds)
        fail(path + '.' + key, "must not exceed one day");
      return std::chrono::milliseconds{ std::llround(s * 1000.0) };
    }

    unsigned wholeNumber(const json& sec, const std::string& path, const char* key,
                         unsigned def) {
      const double v = number(sec, path, key, def);
      if (v < 1.0 || v != std::floor(v) ||
          v > static_cast<double>(std::numeric_limits<unsigned>::max()))
        fail(path + '.' + key, "must be a whole number >= 1");
      return static_cast<unsigned>(v);
    }

    float threshold(const json& sec, const std::string& path, const char* key, float def) {
      const double t = number(sec, path, key, def);
      if (t < 0.0 || t > 1.0)
        fail(path + '.' + key, "must be within [0, 1]");
      return static_cast<float>(t);
    }

    AngleRange range(const json& sec, const std::string& path, const char* key, AngleRange def) {
      auto it = sec.find(key);
      if (it == sec.end())
        return def;
      if (!it->is_array() || it->size() != 2 || !(*it)[0].is_number() || !(*it)[1].is_number())
        fail(path + '.' + key, "must be [min, max]");
      AngleRange r{ (*it)[0].get<double>(), (*it)[1].get<double>() };
      if (!(r.min < r.max))
        fail(path + '.' + key, "min must be below max");
      return r;
    }

    LogLevel level(const std::string& name) {
      if (name == "debug")
        return LogLevel::Debug;
      if (name == "info")
        return LogLevel::Info;
      if (name == "warn")
        return LogLevel::Warn;
      if (name == "error")
        return LogLevel::Error;
      fail("logging.console_level", "expected debug|info|warn|error, got '" + name + "'");
    }

  } // namespace

  speed_t baudFromInt(long baud) {
    switch (baud) {
    case 9600:
      return B9600;
    case 19200:
      return B19200;
    case 38400:
      return B38400;
    case 57600:
      return B57600;
    case 115200:
      return B115200;
    case 230400:
      return B230400;
    default:
      fail("devices.baud", "unsupported rate " + std::to_string(baud));
    }
  }

  Settings Settings::fromJson(const json& doc) {
    if (!doc.is_object())
      fail("<root>", "settings must be a JSON object");

    Settings s;

    //---vision-----------------------------------------------------------
    const json& vis = section(doc, "vision");
    const float common = threshold(vis, "vision", "confidence_threshold", 0.7f);
    const json& th = section(vis, "thresholds");
    using vision::DetectionClass;
    s.thresholds[static_cast<std::size_t>(DetectionClass::Object)] =
        threshold(th, "vision.thresholds", "object", common);
    s.thresholds[static_cast<std::size_t>(DetectionClass::Hand)] =
        threshold(th, "vision.thresholds", "hand", common);
    s.thresholds[static_cast<std::size_t>(DetectionClass::Face)] =
        threshold(th, "vision.thresholds", "face", common);
    s.detectorPollTimeout = seconds(vis, "vision", "poll_timeout", s.detectorPollTimeout);

    if (vis.contains("object_zone")) {
      const json& zone = section(vis, "object_zone");
      const double x = number(zone, "vision.object_zone", "x", 0.0);
      const double y = number(zone, "vision.object_zone", "y", 0.0);
      const double w = number(zone, "vision.object_zone", "width", 0.0);
      const double h = number(zone, "vision.object_zone", "height", 0.0);
      BoundingBox box{ x, y, x + w, y + h };
      if (!box.valid())
        fail("vision.object_zone", "width and height must be positive");
      s.objectZone = box;
    }

    //---trigger----------------------------------------------------------
    const json& trig = section(doc, "trigger");
    s.minConsecutive = wholeNumber(trig, "trigger", "min_detection_frames", s.minConsecutive);
    s.cooldown = seconds(trig, "trigger", "cooldown_period", s.cooldown);

    //---actuation--------------------------------------------------------
    const json& pump = section(doc, "pump");
    s.dispenseDuration = seconds(pump, "pump", "spray_duration", s.dispenseDuration);

    const json& servo = section(doc, "servo");
    s.panRange = range(servo, "servo", "servo_1_range", s.panRange);
    s.tiltRange = range(servo, "servo", "servo_2_range", s.tiltRange);
    s.sequencer.rest.a1 = number(servo, "servo", "servo_1_rest", s.sequencer.rest.a1);
    s.sequencer.rest.a2 = number(servo, "servo", "servo_2_rest", s.sequencer.rest.a2);
    if (!s.panRange.contains(s.sequencer.rest.a1))
      fail("servo.servo_1_rest", "outside servo_1_range");
    if (!s.tiltRange.contains(s.sequencer.rest.a2))
      fail("servo.servo_2_rest", "outside servo_2_range");
    s.sequencer.settleDelay = seconds(servo, "servo", "settle_delay", s.sequencer.settleDelay);
    s.sequencer.stepTimeout = seconds(servo, "servo", "step_timeout", s.sequencer.stepTimeout);
    if (s.sequencer.stepTimeout.count() == 0)
      fail("servo.step_timeout", "must be positive");
    s.sequencer.movementDuration =
        seconds(servo, "servo", "movement_duration", s.sequencer.movementDuration);
    s.sequencer.movementSteps =
        wholeNumber(servo, "servo", "movement_steps", s.sequencer.movementSteps);

    //---loop-------------------------------------------------------------
    const json& loop = section(doc, "loop");
    s.tickInterval = seconds(loop, "loop", "tick_interval", s.tickInterval);
    if (s.tickInterval.count() == 0)
      fail("loop.tick_interval", "must be positive");
    s.dndStaleness = seconds(loop, "loop", "dnd_staleness", s.dndStaleness);

    //---calibration------------------------------------------------------
    const json& kin = section(doc, "kinematics");
    if (kin.contains("corners"))
      s.calibration = hardware::CalibrationMap::fromJson(kin["corners"]);

    //---devices----------------------------------------------------------
    const json& dev = section(doc, "devices");
    s.actuatorDevice = text(dev, "devices", "actuator", s.actuatorDevice);
    s.detectorDevice = text(dev, "devices", "detector", s.detectorDevice);
    s.controlDevice = text(dev, "devices", "control", s.controlDevice);
    s.baud = baudFromInt(std::lround(number(dev, "devices", "baud", 115200)));

    //---logging----------------------------------------------------------
    const json& log = section(doc, "logging");
    s.logFile = text(log, "logging", "file", s.logFile);
    s.consoleLevel = level(text(log, "logging", "console_level", "info"));

    return s;
  }

} // namespace pfd::core
