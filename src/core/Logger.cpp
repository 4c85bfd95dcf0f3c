/* @file Logger.cpp
 * @brief async CSV run log: producers enqueue, one worker writes
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

// PFD headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"
#include "io/FileLogger.hpp"

namespace pfd {
  namespace core {

    const char* toString(LogLevel level) {
      switch (level) {
      case LogLevel::Debug:
        return "DEBUG";
      case LogLevel::Info:
        return "INFO";
      case LogLevel::Warn:
        return "WARN";
      case LogLevel::Error:
        return "ERROR";
      default:
        return "UNKNOWN";
      }
    }

    std::string formatTimestamp(std::chrono::system_clock::time_point when) {
      const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(when);
      const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(when - secs).count();
      const std::time_t tt = std::chrono::system_clock::to_time_t(secs);

      std::tm utc{};
      gmtime_r(&tt, &utc);

      std::ostringstream out;
      out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
          << ms << 'Z';
      return out.str();
    }

    namespace {
      std::string csvField(const std::string& raw) {
        if (raw.find_first_of(",\"\n\r") == std::string::npos)
          return raw;
        std::string quoted = "\"";
        for (char c : raw) {
          if (c == '"')
            quoted += '"';
          quoted += (c == '\n' || c == '\r') ? ' ' : c;
        }
        quoted += '"';
        return quoted;
      }
    } // namespace

    Logger::Logger(std::size_t queueCapacity)
        : csvFile_(std::make_unique<io::FileLogger>()),
          buffer_(std::make_unique<RingBuffer<LogEvent>>(queueCapacity)) {}

    Logger::~Logger() { finishRun(); }

    std::string Logger::formatCsv(const LogEvent& event) {
      return formatTimestamp(event.when) + ',' + toString(event.level) + ',' +
             csvField(event.component) + ',' + csvField(event.message);
    }

    bool Logger::startNewRun(const std::string& csvPath) {
      if (running_.load())
        finishRun();

      if (!csvFile_->open(csvPath))
        return false;

      csvFile_->write("timestamp,level,component,message\n");
      dropped_.store(0);
      flushFailed_.store(false);
      running_.store(true);
      worker_ = std::thread([this] { workerLoop(); });
      return true;
    }

    void Logger::log(LogEvent event) {
      if (event.level >= consoleLevel_.load()) {
        std::cerr << formatTimestamp(event.when) << " [" << toString(event.level) << "] ["
                  << event.component << "] " << event.message << '\n';
      }

      if (!running_.load())
        return;

      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!buffer_->push(std::move(event)))
          dropped_.fetch_add(1);
      }
      cv_.notify_one();
    }

    void Logger::debug(std::string_view component, std::string_view message) {
      log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Debug, std::string(component),
                    std::string(message) });
    }

    void Logger::info(std::string_view component, std::string_view message) {
      log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Info, std::string(component),
                    std::string(message) });
    }

    void Logger::warn(std::string_view component, std::string_view message) {
      log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Warn, std::string(component),
                    std::string(message) });
    }

    void Logger::error(std::string_view component, std::string_view message) {
      log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Error, std::string(component),
                    std::string(message) });
    }

    void Logger::drainLocked(std::unique_lock<std::mutex>& lock) {
      std::vector<LogEvent> batch;
      while (auto ev = buffer_->pop())
        batch.push_back(std::move(*ev));

      lock.unlock();
      for (const auto& ev : batch)
        csvFile_->write(formatCsv(ev) + '\n');
      if (!csvFile_->flush() && !flushFailed_.exchange(true))
        std::cerr << "[Logger] run log write failed, events may be lost\n";
      lock.lock();
    }

    void Logger::workerLoop() {
      std::unique_lock<std::mutex> lock(mtx_);
      while (running_.load()) {
        cv_.wait(lock, [this] { return !running_.load() || !buffer_->empty(); });
        drainLocked(lock);
      }
      drainLocked(lock);
    }

    void Logger::finishRun() {
      if (!running_.exchange(false))
        return;

      { std::lock_guard<std::mutex> lock(mtx_); } // worker is either waiting or sees the flag
      cv_.notify_all();
      if (worker_.joinable())
        worker_.join();

      if (const auto lost = dropped_.load(); lost > 0) {
        csvFile_->write(formatCsv(LogEvent{ std::chrono::system_clock::now(), LogLevel::Warn,
                                            "Logger",
                                            std::to_string(lost) + " events dropped (queue full)" }) +
                        '\n');
      }
      csvFile_->close();
    }

  } // namespace core
} // namespace pfd
