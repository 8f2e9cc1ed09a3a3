#pragma once

#include <cstddef>
#include <cstdint>

#include "common/macros.h"

namespace Common {

enum class LogLevel : uint16_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

struct LoggerStats {
    uint64_t messages_written = 0;
    uint64_t messages_dropped = 0;
    uint64_t bytes_written = 0;
};

/// Start the asynchronous file logger. Replaces any running instance.
/// An empty or null path leaves logging disabled.
void initLogging(const char* log_file, LogLevel min_level = LogLevel::INFO);

/// Drain pending records, stop the writer thread and close the file.
void shutdownLogging();

/// True when a logger is running and `level` passes its threshold
[[nodiscard]] bool isLoggingEnabled(LogLevel level) noexcept;

/// Format and enqueue one record; never blocks on file I/O
void logMessage(LogLevel level, const char* format, ...) noexcept PRINTF_FORMAT(2, 3);

[[nodiscard]] LoggerStats getLoggerStats() noexcept;

[[nodiscard]] const char* levelToString(LogLevel level) noexcept;

/// Parse "debug", "info", "warn" or "error" (case-insensitive)
[[nodiscard]] bool parseLogLevel(const char* text, LogLevel* out) noexcept;

} // namespace Common

#define LOG_DEBUG(...) do { if (Common::isLoggingEnabled(Common::LogLevel::DEBUG)) Common::logMessage(Common::LogLevel::DEBUG, __VA_ARGS__); } while (0)
#define LOG_INFO(...)  do { if (Common::isLoggingEnabled(Common::LogLevel::INFO))  Common::logMessage(Common::LogLevel::INFO,  __VA_ARGS__); } while (0)
#define LOG_WARN(...)  do { if (Common::isLoggingEnabled(Common::LogLevel::WARN))  Common::logMessage(Common::LogLevel::WARN,  __VA_ARGS__); } while (0)
#define LOG_ERROR(...) do { if (Common::isLoggingEnabled(Common::LogLevel::ERROR)) Common::logMessage(Common::LogLevel::ERROR, __VA_ARGS__); } while (0)
