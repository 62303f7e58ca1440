// ============================================================================
// taskloop/core/log.cpp - Logger Implementation
// ============================================================================

#include "taskloop/core/log.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace taskloop {

const char* LogLevelName(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kError:
            return "ERROR";
        case LogLevel::kWarn:
            return "WARN";
        case LogLevel::kInfo:
            return "INFO";
        case LogLevel::kDebug:
            return "DEBUG";
        case LogLevel::kTrace:
            return "TRACE";
        default:
            return "UNKNOWN";
    }
}

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "error") return LogLevel::kError;
    if (lower == "warn" || lower == "warning") return LogLevel::kWarn;
    if (lower == "info") return LogLevel::kInfo;
    if (lower == "debug") return LogLevel::kDebug;
    if (lower == "trace") return LogLevel::kTrace;
    return std::nullopt;
}

std::string FormatLogRecord(const LogRecord& record) {
    auto time = std::chrono::system_clock::to_time_t(record.time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(record.time.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream out;
    out << '[' << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << ms.count() << "] [" << LogLevelName(record.level) << "] " << record.message;
    return out.str();
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(LogLevel level) : level_(level), sink_(StderrSink()) {}

Logger::Logger(LogLevel level, LogSink sink) : level_(level), sink_(sink ? std::move(sink) : StderrSink()) {}

void Logger::SetLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::Level() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::Enabled(LogLevel level) const noexcept {
    return static_cast<std::uint8_t>(level) <= static_cast<std::uint8_t>(Level());
}

void Logger::SetSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink ? std::move(sink) : StderrSink();
}

void Logger::Log(LogLevel level, std::string message) {
    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (static_cast<std::uint8_t>(level) > static_cast<std::uint8_t>(level_)) {
            return;
        }
        sink = sink_;
    }
    // Outside the lock: a sink may log again, or change the level.
    sink(LogRecord{level, std::chrono::system_clock::now(), std::move(message)});
}

LogSink Logger::StderrSink() {
    return [](const LogRecord& record) {
        static std::mutex stderr_mutex;
        std::string line = FormatLogRecord(record);
        line.push_back('\n');

        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::fputs(line.c_str(), stderr);
    };
}

// ============================================================================
// DefaultLogger
// ============================================================================

namespace {

LogLevel LevelFromEnvironment() {
    const char* value = std::getenv("TASKLOOP_LOG_LEVEL");
    if (!value) return LogLevel::kInfo;
    return ParseLogLevel(value).value_or(LogLevel::kInfo);
}

}  // namespace

Logger& DefaultLogger() {
    static Logger logger(LevelFromEnvironment());
    return logger;
}

}  // namespace taskloop
