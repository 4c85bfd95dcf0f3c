/* @file SerialChannel.cpp
 * @brief IO abstraction layer that wraps a tty - handles file descriptor, framing, line io and RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <string_view>
#include <utility>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDWR
#include <poll.h>
#include <unistd.h> // write(), read(), close()

// PFD headers
#include "io/SerialChannel.hpp"

using namespace pfd::io;

SerialChannel::~SerialChannel() { close(); }

SerialChannel::SerialChannel(SerialChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), rx_buffer_(std::move(other.rx_buffer_)),
      discarding_(std::exchange(other.discarding_, false)) {}

SerialChannel& SerialChannel::operator=(SerialChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    rx_buffer_ = std::move(other.rx_buffer_);
    discarding_ = std::exchange(other.discarding_, false);
  }
  return *this;
}

bool SerialChannel::open(const std::string& dev, speed_t baud) {
  close();

  // open non-blocking, dont become ctrl-TTY
  fd_ = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    std::cerr << "[SerialChannel] open " << dev << ": " << strerror(errno) << "\n";
    return false;
  }

  struct termios tty;
  if (tcgetattr(fd_, &tty) != 0) {
    std::cerr << "[SerialChannel] tcgetattr " << dev << ": " << strerror(errno) << "\n";
    close();
    return false;
  }

  cfmakeraw(&tty);
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8 | CLOCAL | CREAD;
  tty.c_cflag &= ~CRTSCTS;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  cfsetispeed(&tty, baud);
  cfsetospeed(&tty, baud);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    std::cerr << "[SerialChannel] tcsetattr " << dev << ": " << strerror(errno) << "\n";
    close();
    return false;
  }
  rx_buffer_.clear();
  discarding_ = false;
  return true;
}

bool SerialChannel::writeLine(const std::string& line, std::chrono::milliseconds timeout) {

  if (fd_ < 0) {
    return false;
  }

  std::string out = line;
  if (!out.ends_with("\r\n")) {
    out += "\r\n";
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::write(fd_, out.data() + total, out.size() - total);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue;
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      // tx queue full: wait for room, but never past the caller's deadline
      const auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (ms_left.count() <= 0) {
        std::cerr << "[SerialChannel] write: tx queue full for " << timeout.count()
                  << " ms, " << total << "/" << out.size() << " bytes sent\n";
        return false;
      }
      pollfd pfd{ fd_, POLLOUT, 0 };
      if (::poll(&pfd, 1, static_cast<int>(ms_left.count())) < 0 && errno != EINTR) {
        std::cerr << "[SerialChannel] poll(POLLOUT): " << strerror(errno) << "\n";
        return false;
      }
    } else {
      std::cerr << "[SerialChannel] write: " << strerror(errno) << "\n";
      return false;
    }
  }

  return true;
}

std::optional<std::string> SerialChannel::takeBufferedLine() {
  auto pos = rx_buffer_.find('\n');
  if (pos == std::string::npos)
    return std::nullopt;

  std::string line = rx_buffer_.substr(0, pos);
  rx_buffer_.erase(0, pos + 1);
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  return line;
}

void SerialChannel::appendReceived(const char* data, std::size_t n) {
  std::string_view chunk(data, n);
  if (discarding_) {
    const auto nl = chunk.find('\n');
    if (nl == std::string_view::npos)
      return;
    chunk.remove_prefix(nl + 1);
    discarding_ = false;
  }

  rx_buffer_.append(chunk);
  if (rx_buffer_.size() > kMaxLineBytes && rx_buffer_.find('\n') == std::string::npos) {
    std::cerr << "[SerialChannel] line longer than " << kMaxLineBytes << " bytes dropped\n";
    rx_buffer_.clear();
    discarding_ = true;
  }
}

// -------------------------------------------------------------------
// SerialChannel::readLine
// Non-blocking line reader with timeout and internal buffer.
// A zero timeout only returns what is already buffered or readable.
// -------------------------------------------------------------------
std::optional<std::string> SerialChannel::readLine(std::chrono::milliseconds timeout) {
  if (auto buffered = takeBufferedLine())
    return buffered;

  if (fd_ < 0)
    return std::nullopt;

  char temp[256];
  pollfd pfd{ fd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  do {
    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ms = ms_left.count() > 0 ? static_cast<int>(ms_left.count()) : 0;

    int rc = ::poll(&pfd, 1, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue;
      std::cerr << "[SerialChannel] poll: " << strerror(errno) << '\n';
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & (POLLHUP | POLLERR)) {
      close();
      return std::nullopt;
    }

    if (pfd.revents & POLLIN) {
      ssize_t n = ::read(fd_, temp, sizeof(temp));
      if (n > 0) {
        appendReceived(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // EOF / disconnect
        close();
        return std::nullopt;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue;
      } else {
        std::cerr << "[SerialChannel] read: " << strerror(errno) << '\n';
        return std::nullopt;
      }

      if (auto line = takeBufferedLine())
        return line;
    }
  } while (std::chrono::steady_clock::now() < deadline);

  return std::nullopt; // timeout/partial
}

void SerialChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}
