#pragma once
/** @file  Response.hpp
 *  @brief Reply line: `OK [payload]` or `ERR <reason>`.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <utility>

namespace pfd {
  namespace protocols {
    struct Response {
      bool ok{ false };
      std::string payload; ///< text after OK, or the ERR reason

      std::string toWire() const {
        std::string tag = ok ? "OK" : "ERR";
        return payload.empty() ? tag : tag + ' ' + payload;
      }

      static Response success(std::string text = {}) { return { true, std::move(text) }; }
      static Response failure(std::string reason) { return { false, std::move(reason) }; }

      /// std::nullopt if the line is neither an OK nor an ERR reply.
      static std::optional<Response> fromWire(const std::string& line);
    };
  } // namespace protocols
} // namespace pfd
