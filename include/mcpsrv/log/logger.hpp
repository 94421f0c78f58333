#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace mcpsrv {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Wire-level detail (raw envelopes)
    Debug = 1,  // Session lifecycle, routing decisions
    Info  = 2,  // Server start/stop, connections
    Warn  = 3,  // Recoverable protocol or transport problems
    Error = 4,  // Operation failed
    Fatal = 5,  // Server cannot continue
    Off   = 6   // Disable all logging
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name ("trace", "INFO", "warning", ...). Case-insensitive.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record - Immutable snapshot of a log event
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface - Swappable logging backend
// ─────────────────────────────────────────────────────────────────────────────
// Implementations must never write to stdout: in stdio mode stdout carries
// the JSON-RPC stream.

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Debug)) {
            log(LogRecord(LogLevel::Debug, std::string(msg), loc));
        }
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Info)) {
            log(LogRecord(LogLevel::Info, std::string(msg), loc));
        }
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Warn)) {
            log(LogRecord(LogLevel::Warn, std::string(msg), loc));
        }
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Error)) {
            log(LogRecord(LogLevel::Error, std::string(msg), loc));
        }
    }

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Trace)) {
            log(LogRecord(LogLevel::Trace, std::string(msg), loc));
        }
    }

    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Fatal)) {
            log(LogRecord(LogLevel::Fatal, std::string(msg), loc));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - Discards all logs
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

// Get the process logger (defaults to NullLogger)
[[nodiscard]] ILogger& get_logger() noexcept;

// Replace the process logger; nullptr restores the NullLogger
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// Arguments are only evaluated when the level is enabled.

#define MCPSRV_LOG_TRACE(...) \
    do { if (::mcpsrv::get_logger().should_log(::mcpsrv::LogLevel::Trace)) \
         ::mcpsrv::get_logger().trace(std::format(__VA_ARGS__)); } while(false)

#define MCPSRV_LOG_DEBUG(...) \
    do { if (::mcpsrv::get_logger().should_log(::mcpsrv::LogLevel::Debug)) \
         ::mcpsrv::get_logger().debug(std::format(__VA_ARGS__)); } while(false)

#define MCPSRV_LOG_INFO(...) \
    do { if (::mcpsrv::get_logger().should_log(::mcpsrv::LogLevel::Info)) \
         ::mcpsrv::get_logger().info(std::format(__VA_ARGS__)); } while(false)

#define MCPSRV_LOG_WARN(...) \
    do { if (::mcpsrv::get_logger().should_log(::mcpsrv::LogLevel::Warn)) \
         ::mcpsrv::get_logger().warn(std::format(__VA_ARGS__)); } while(false)

#define MCPSRV_LOG_ERROR(...) \
    do { if (::mcpsrv::get_logger().should_log(::mcpsrv::LogLevel::Error)) \
         ::mcpsrv::get_logger().error(std::format(__VA_ARGS__)); } while(false)

#define MCPSRV_LOG_FATAL(...) \
    do { if (::mcpsrv::get_logger().should_log(::mcpsrv::LogLevel::Fatal)) \
         ::mcpsrv::get_logger().fatal(std::format(__VA_ARGS__)); } while(false)

}  // namespace mcpsrv
