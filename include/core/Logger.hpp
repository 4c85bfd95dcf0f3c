#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV event logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace pfd {
  namespace io {
    class FileLogger;
  } // namespace io

  namespace core {

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    enum class LogLevel { Debug, Info, Warn, Error };

    const char* toString(LogLevel level);

    /// UTC ISO-8601 with milliseconds, e.g. `2025-03-01T12:00:00.250Z`.
    std::string formatTimestamp(std::chrono::system_clock::time_point when);

    /// One row of the run log.
    struct LogEvent {
      std::chrono::system_clock::time_point when{ std::chrono::system_clock::now() };
      LogLevel level{ LogLevel::Info };
      std::string component;
      std::string message;
    };

    /**
 * @class Logger
 * @brief Producers call `log()` from any thread; a worker drains the queue
 *        into a CSV file through io::FileLogger.
 *
 *  * `log()` never blocks on disk I/O. When the queue is full the oldest event
 *    is dropped and counted.
 *  * Events at or above the console level are echoed to std::cerr straight
 *    away, also when no run is active.
 */
    class Logger {

    public:
      explicit Logger(std::size_t queueCapacity = 1024);
      ~Logger();

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

      // --- public API ---
      bool startNewRun(const std::string& csvPath); ///< open file + launch worker thread
      void log(LogEvent event);                     ///< enqueue event (non-blocking)
      void finishRun();                             ///< flush + join worker thread

      void debug(std::string_view component, std::string_view message);
      void info(std::string_view component, std::string_view message);
      void warn(std::string_view component, std::string_view message);
      void error(std::string_view component, std::string_view message);

      void setConsoleLevel(LogLevel level) { consoleLevel_.store(level); }
      bool running() const { return running_.load(); }
      std::size_t droppedEvents() const { return dropped_.load(); }

      /// CSV row without trailing newline: `timestamp,level,component,message`.
      static std::string formatCsv(const LogEvent& event);

    private:
      void workerLoop();
      void drainLocked(std::unique_lock<std::mutex>& lock);

      std::unique_ptr<io::FileLogger> csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::mutex mtx_;
      std::condition_variable cv_;
      std::atomic<bool> running_{ false };
      std::atomic<LogLevel> consoleLevel_{ LogLevel::Warn };
      std::atomic<std::size_t> dropped_{ 0 };
      std::atomic<bool> flushFailed_{ false }; ///< reported once per run
    };

  } // namespace core
} // namespace pfd
