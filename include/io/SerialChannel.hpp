#pragma once
/** @file  SerialChannel.hpp
 *  @brief Non-blocking UART line I/O wrapper (poll/termios under the hood).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

// Linux header
#include <termios.h> // for speed_t types e.g., B115200

namespace pfd {
  namespace io {

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a single /dev/tty* file descriptor.
 *
 *  * Frames I/O as ASCII lines (`\r\n`). A bare `\n` also terminates a line
 *    so the detector co-processor can speak plain JSON-lines.
 *  * Shared by the actuator MCU link, the detector link and the control plane.
 *  * An unterminated line longer than `kMaxLineBytes` is dropped up to the
 *    next terminator.
 *  * *Non-copyable*, but move-constructible.
 */
    class SerialChannel {

    public:
      static constexpr std::size_t kMaxLineBytes = 16 * 1024;

      //---ctr / dtr--------------------------------------------
      SerialChannel() = default;
      virtual ~SerialChannel(); // close the /dev/tty fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& dev, speed_t baud);
      /// Returns false on EIO, or when the tx queue stays full past `timeout`.
      virtual bool writeLine(const std::string& line, std::chrono::milliseconds timeout);

      /// Returns std::nullopt on timeout, disconnect or error (see isOpen()).
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);

      /// False once the peer hung up or after close().
      virtual bool isOpen() const { return fd_ >= 0; }
      void close();

      //---non-copyable-----------------------------------------
      SerialChannel(const SerialChannel&) = delete;
      SerialChannel& operator=(const SerialChannel&) = delete;

      //---mv and mv assign-------------------------------------
      SerialChannel(SerialChannel&& other) noexcept;
      SerialChannel& operator=(SerialChannel&& other) noexcept;

    private:
      std::optional<std::string> takeBufferedLine();
      void appendReceived(const char* data, std::size_t n);

      int fd_{ -1 };            ///< POSIX fd (-1==closed)
      std::string rx_buffer_{}; ///< bytes received but not yet returned as a line
      bool discarding_{ false }; ///< skipping an overlong line until its '\n'
    };
  } // namespace io
} // namespace pfd
