#pragma once
/** @file  Command.hpp
 *  @brief One request line to the actuator MCU or from a control-plane peer.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <vector>

namespace pfd {
  namespace protocols {

    /// `VERB arg arg ...`: space separated ASCII, framed by SerialChannel.
    struct Command {
      std::string verb;
      std::vector<std::string> args;

      std::string toWire() const;

      /// Split a received line; std::nullopt for an empty/blank line.
      static std::optional<Command> fromWire(const std::string& line);

      //---actuator MCU vocabulary----------------------------------------
      static Command angles(double a1, double a2); ///< `ANGLES 90.00 120.00`
      static Command pump(bool on);                ///< `PUMP 1` / `PUMP 0`
    };

  } // namespace protocols
} // namespace pfd
