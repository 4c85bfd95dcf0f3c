/* @file main.cpp
 * @brief phone_free_desk entry point: wiring, start-up, signal-driven shutdown
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

// 3rd-party headers
#include <nlohmann/json.hpp>

// PFD headers
#include "core/ConfigLoader.hpp"
#include "core/ControlPlane.hpp"
#include "core/DndState.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/Orchestrator.hpp"
#include "core/Settings.hpp"
#include "hardware/ActuationSequencer.hpp"
#include "hardware/CalibrationMap.hpp"
#include "hardware/SerialActuator.hpp"
#include "io/SerialChannel.hpp"
#include "vision/SerialDetector.hpp"

using namespace pfd;

namespace {

  std::atomic<bool> g_shutdown{ false };

  void onSignal(int) { g_shutdown.store(true); }

  constexpr int kExitOk = 0;
  constexpr int kExitConfig = 1;
  constexpr int kExitDevice = 2;

  void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [config.json]\n"
              << "       " << argv0
              << " [config.json] --set-corner <top_left|top_right|bottom_left|bottom_right>"
                 " <cam_x> <cam_y> <servo1> <servo2>\n";
  }

  /// Stock corner table of the desk mount; the starting point for --set-corner.
  hardware::CalibrationMap stockCalibration() {
    return hardware::CalibrationMap({ hardware::CalibrationCorner{ { 0.0, 0.0 }, { 60.0, 120.0 } },
                                      hardware::CalibrationCorner{ { 1.0, 0.0 }, { 120.0, 120.0 } },
                                      hardware::CalibrationCorner{ { 0.0, 1.0 }, { 60.0, 80.0 } },
                                      hardware::CalibrationCorner{ { 1.0, 1.0 }, { 120.0, 80.0 } } });
  }

  int setCorner(const core::ConfigLoader& loader, nlohmann::json doc,
                const core::Settings& settings, char** args) {
    const auto corner = hardware::cornerFromString(args[0]);
    if (!corner) {
      std::cerr << "unknown corner '" << args[0] << "'\n";
      return kExitConfig;
    }

    hardware::CalibrationCorner value;
    try {
      value.camera = { std::stod(args[1]), std::stod(args[2]) };
      value.angles = { std::stod(args[3]), std::stod(args[4]) };
    } catch (const std::exception&) {
      std::cerr << "corner values must be numbers\n";
      return kExitConfig;
    }
    if (!settings.panRange.contains(value.angles.a1) || !settings.tiltRange.contains(value.angles.a2)) {
      std::cerr << "servo angles outside the configured safe range\n";
      return kExitConfig;
    }

    auto map = settings.calibration.value_or(stockCalibration());
    map.setCorner(*corner, value);
    if (!map.valid()) {
      std::cerr << "resulting corners do not form a convex quadrilateral; not saved\n";
      return kExitConfig;
    }

    doc["kinematics"]["corners"] = map.toJson();
    try {
      loader.save(doc);
    } catch (const std::runtime_error& e) {
      std::cerr << e.what() << "\n";
      return kExitConfig;
    }
    std::cout << "saved " << hardware::toString(*corner) << " to " << loader.path() << "\n";
    return kExitOk;
  }

} // namespace

int main(int argc, char** argv) {
  std::string configPath = "config/settings.json";
  int argi = 1;
  if (argi < argc && std::string(argv[argi]).rfind("--", 0) != 0)
    configPath = argv[argi++];

  core::ConfigLoader loader(configPath);
  nlohmann::json doc;
  core::Settings settings;
  try {
    doc = loader.load();
    settings = core::Settings::fromJson(doc);
  } catch (const std::runtime_error& e) {
    std::cerr << e.what() << "\n";
    return kExitConfig;
  }

  if (argi < argc) {
    if (std::string(argv[argi]) == "--set-corner" && argc - argi == 6)
      return setCorner(loader, doc, settings, argv + argi + 1);
    usage(argv[0]);
    return kExitConfig;
  }

  // ---- ambient services ----------------------------------------------------
  auto logger = std::make_shared<core::Logger>();
  logger->setConsoleLevel(settings.consoleLevel);
  if (!logger->startNewRun(settings.logFile))
    logger->warn("main", "run log unavailable, console only: " + settings.logFile);

  auto errorMonitor = std::make_shared<core::ErrorMonitor>();
  errorMonitor->registerEscalation(
      [logger](const std::string& msg) { logger->error("ErrorMonitor", msg); });

  // ---- devices -------------------------------------------------------------
  hardware::SerialActuator actuator(std::make_unique<io::SerialChannel>());
  if (!actuator.connect(settings.actuatorDevice, settings.baud)) {
    logger->error("main", "actuator link unavailable: " + settings.actuatorDevice);
    logger->finishRun();
    return kExitDevice;
  }

  auto detectorLink = std::make_unique<io::SerialChannel>();
  if (!detectorLink->open(settings.detectorDevice, settings.baud)) {
    logger->error("main", "detector link unavailable: " + settings.detectorDevice);
    logger->finishRun();
    return kExitDevice;
  }
  vision::SerialDetector detector(std::move(detectorLink), settings.detectorPollTimeout, logger);

  hardware::ActuationSequencer sequencer(actuator, settings.sequencer, logger, errorMonitor);
  if (!sequencer.parkAtRest())
    logger->warn("main", "actuator did not confirm rest position at start-up");

  core::DndState dnd;
  core::ControlPlane control(std::make_unique<io::SerialChannel>(), dnd, logger);
  if (!control.start(settings.controlDevice, settings.baud)) {
    logger->finishRun();
    return kExitDevice;
  }

  core::Orchestrator orchestrator(settings, detector, dnd, sequencer, logger, errorMonitor);

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  orchestrator.start();
  logger->info("main", "phone free desk running (config " + configPath + ")");

  while (!g_shutdown.load())
    std::this_thread::sleep_for(std::chrono::milliseconds{ 100 });

  logger->info("main", "shutdown requested");
  orchestrator.stop(); // aborts a spray in flight; its release steps have run when this returns
  control.stop();

  // leave the arm parked and the dispenser off on the way out
  sequencer.clearAbort();
  if (!sequencer.parkAtRest())
    logger->error("main", "final park not confirmed: check dispenser and arm");

  logger->info("main", "shutdown complete");
  logger->finishRun();
  return kExitOk;
}
