/* @file FileLogger.cpp
 * @brief chunked append-only writer behind the CSV run log
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "io/FileLogger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <iostream>
#include <utility>

using namespace pfd::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "a");
  if (fp_ == nullptr) {
    std::cerr << "[FileLogger] cannot open " << path << ": " << std::strerror(errno) << "\n";
    return false;
  }
  buffer_.reserve(kChunk * 2);
  return true;
}

void FileLogger::write(const std::string& csv) {
  if (fp_ == nullptr)
    return;

  buffer_.insert(buffer_.end(), csv.begin(), csv.end());
  if (buffer_.size() >= kChunk && !flush())
    buffer_.clear(); // failing disk: backlog is dropped, not grown
}

bool FileLogger::flush() {
  if (fp_ == nullptr)
    return false;

  std::size_t offset = 0;
  while (offset < buffer_.size()) {
    const std::size_t len = std::min(kChunk, buffer_.size() - offset);
    const std::size_t n = std::fwrite(buffer_.data() + offset, 1, len, fp_);
    if (n != len) {
      std::cerr << "[FileLogger] short write: " << std::strerror(errno) << "\n";
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset + n));
      return false;
    }
    offset += n;
  }
  buffer_.clear();
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (fp_ == nullptr)
    return;
  const bool flushed = flush();
  if (std::fclose(fp_) != 0 || !flushed)
    std::cerr << "[FileLogger] log tail may be incomplete\n";
  fp_ = nullptr;
  buffer_.clear();
}
