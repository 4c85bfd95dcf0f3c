#pragma once
/** @file  SerialActuator.hpp
 *  @brief Actuator backed by the servo/pump MCU on a serial link.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <memory>
#include <optional>
#include <string>

// PFD headers
#include "hardware/Actuator.hpp"
#include "io/SerialChannel.hpp" // owns the channel, needs the full type
#include "protocols/Command.hpp"

namespace pfd {
  namespace hardware {

    /**
 * @class SerialActuator
 * @brief Sends `ANGLES a1 a2` / `PUMP 0|1` and waits for `OK` or `ERR`.
 *
 *  * The last acknowledged state is cached; asking for it again sends nothing.
 *  * Any failure forgets the cache so the next (release) request is re-sent.
 *  * Not thread-safe: only the orchestrator thread (or main, once it has
 *    stopped) talks to the MCU.
 */
    class SerialActuator : public Actuator {
    public:
      static constexpr speed_t kDefaultBaud = B115200;

      explicit SerialActuator(std::unique_ptr<io::SerialChannel> channel);
      ~SerialActuator() override = default;

      //---public APIs------------------------------------------------------
      bool connect(const std::string& device, speed_t baud = kDefaultBaud);

      LinkStatus setAngles(const core::ActuatorAngles& angles,
                           std::chrono::milliseconds timeout) override;
      LinkStatus setDispenser(bool on, std::chrono::milliseconds timeout) override;

      std::optional<core::ActuatorAngles> lastAngles() const { return angles_; }
      std::optional<bool> lastDispenser() const { return dispenser_; }

    private:
      LinkStatus transact(const protocols::Command& cmd, std::chrono::milliseconds timeout);

      std::unique_ptr<io::SerialChannel> channel_;
      std::optional<core::ActuatorAngles> angles_;
      std::optional<bool> dispenser_;
    };

  } // namespace hardware
} // namespace pfd
