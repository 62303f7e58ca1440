// ============================================================================
// taskloop/core/log.hpp - Leveled Logging with a Replaceable Sink
// ============================================================================
//
// Every failure the scheduler swallows (a task returning an error, a job
// invocation failing) ends up here as a LogRecord. The record carries the
// level, a wall-clock timestamp and the formatted message; where it goes is
// up to the sink, so a host can route scheduler records into its own
// logging.
//
// The default sink writes one line per record to stderr:
//
//   [2026-10-18 14:03:07.412] [ERROR] taskloop: task 'task-7' failed: ...
//
// DefaultLogger() is the process logger. Its level comes from the
// TASKLOOP_LOG_LEVEL environment variable (error, warn, info, debug,
// trace; default info).
//
// USAGE:
// ------
//   Logger logger(LogLevel::kDebug);
//   logger.SetSink([](const LogRecord& r) { MyHostLog(r.message); });
//   TaskLoop loop(executor, {.logger = &logger});
//
// ============================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace taskloop {

enum class LogLevel : std::uint8_t {
    kError = 0,
    kWarn = 1,
    kInfo = 2,
    kDebug = 3,
    kTrace = 4,
};

struct LogRecord {
    LogLevel level;
    std::chrono::system_clock::time_point time;
    std::string message;
};

using LogSink = std::function<void(const LogRecord&)>;

[[nodiscard]] const char* LogLevelName(LogLevel level) noexcept;

// Case-insensitive; accepts "warning" for kWarn.
[[nodiscard]] std::optional<LogLevel> ParseLogLevel(std::string_view text);

// "[YYYY-mm-dd HH:MM:SS.mmm] [LEVEL] message"
[[nodiscard]] std::string FormatLogRecord(const LogRecord& record);

class Logger {
   public:
    explicit Logger(LogLevel level = LogLevel::kInfo);
    Logger(LogLevel level, LogSink sink);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void SetLevel(LogLevel level) noexcept;
    [[nodiscard]] LogLevel Level() const noexcept;
    [[nodiscard]] bool Enabled(LogLevel level) const noexcept;

    // Replace the sink; an empty sink restores the stderr sink.
    void SetSink(LogSink sink);

    void Log(LogLevel level, std::string message);

    void Error(std::string message) { Log(LogLevel::kError, std::move(message)); }
    void Warn(std::string message) { Log(LogLevel::kWarn, std::move(message)); }
    void Info(std::string message) { Log(LogLevel::kInfo, std::move(message)); }
    void Debug(std::string message) { Log(LogLevel::kDebug, std::move(message)); }
    void Trace(std::string message) { Log(LogLevel::kTrace, std::move(message)); }

    [[nodiscard]] static LogSink StderrSink();

   private:
    mutable std::mutex mutex_;
    LogLevel level_;
    LogSink sink_;
};

// Process-wide logger, level taken from TASKLOOP_LOG_LEVEL on first use.
Logger& DefaultLogger();

}  // namespace taskloop
