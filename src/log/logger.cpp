#include "mcpsrv/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace mcpsrv {

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    std::string lowered(name.size(), '\0');
    std::transform(name.begin(), name.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if ((lowered == "warn") || (lowered == "warning")) return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if ((lowered == "fatal") || (lowered == "critical")) return LogLevel::Fatal;
    if (lowered == "off") return LogLevel::Off;
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Singleton
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::unique_ptr<ILogger>& logger_instance() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return *logger_instance();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (logger != nullptr) {
        logger_instance() = std::move(logger);
    } else {
        logger_instance() = std::make_unique<NullLogger>();
    }
}

}  // namespace mcpsrv
