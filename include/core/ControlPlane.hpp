#pragma once
/** @file  ControlPlane.hpp
 *  @brief Line-protocol server that lets the phone set/query DND.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <termios.h> // speed_t

#include "protocols/Response.hpp"

namespace pfd {
  namespace io {
    class SerialChannel;
  } // namespace io

  namespace core {

    class DndState;
    class Logger;

    /**
 * @class ControlPlane
 * @brief Serves `DND <0|1>`, `DND?` and `HEALTH` on its own thread.
 *
 *  * The only writer of DndState.
 *  * A dropped link is logged and reopened every `kReconnectDelay`; the flag
 *    keeps its last value meanwhile.
 */
    class ControlPlane {
    public:
      static constexpr std::chrono::milliseconds kPollInterval{ 100 };
      static constexpr std::chrono::milliseconds kReconnectDelay{ 1000 };
      static constexpr std::chrono::milliseconds kReplyTimeout{ 500 };

      ControlPlane(std::unique_ptr<io::SerialChannel> channel, DndState& dnd,
                   std::shared_ptr<Logger> logger);
      ~ControlPlane();

      ControlPlane(const ControlPlane&) = delete;
      ControlPlane& operator=(const ControlPlane&) = delete;

      /// Open \p device and launch the worker. False if the first open fails.
      bool start(const std::string& device, speed_t baud);
      void stop();

      /// Handle one request line (exposed so tests can drive it directly).
      protocols::Response handle(const std::string& line);

    private:
      void serve();

      std::unique_ptr<io::SerialChannel> channel_;
      DndState& dnd_;
      std::shared_ptr<Logger> logger_;

      std::string device_;
      speed_t baud_{ 0 };
      std::thread worker_;
      std::atomic<bool> running_{ false };
    };

  } // namespace core
} // namespace pfd
