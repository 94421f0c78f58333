#include "mcpsrv/server_config.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>

namespace mcpsrv {

// ─────────────────────────────────────────────────────────────────────────────
// Builder Helpers
// ─────────────────────────────────────────────────────────────────────────────

HttpServerConfig& HttpServerConfig::with_host(std::string value) {
    host = std::move(value);
    return *this;
}

HttpServerConfig& HttpServerConfig::with_port(std::uint16_t value) {
    port = value;
    return *this;
}

HttpServerConfig& HttpServerConfig::with_keepalive_interval(std::chrono::milliseconds interval) {
    keepalive_interval = interval;
    return *this;
}

HttpServerConfig& HttpServerConfig::with_tool_threads(std::size_t count) {
    tool_threads = count;
    return *this;
}

HttpServerConfig& HttpServerConfig::with_idle_timeout(std::chrono::milliseconds timeout) {
    idle_timeout = timeout;
    return *this;
}

ConfigResult<void> HttpServerConfig::validate() const {
    if (host.empty()) {
        return tl::unexpected(ConfigError::invalid_setting("host", "must not be empty"));
    }
    if (keepalive_interval.count() <= 0) {
        return tl::unexpected(ConfigError::invalid_setting("keepalive_interval", "must be positive"));
    }
    if (session_queue_capacity == 0) {
        return tl::unexpected(ConfigError::invalid_setting("session_queue_capacity", "must be positive"));
    }
    if (max_header_size == 0) {
        return tl::unexpected(ConfigError::invalid_setting("max_header_size", "must be positive"));
    }
    if (idle_timeout.count() <= 0) {
        return tl::unexpected(ConfigError::invalid_setting("idle_timeout", "must be positive"));
    }
    if (io_threads == 0) {
        return tl::unexpected(ConfigError::invalid_setting("io_threads", "must be positive"));
    }
    if (tool_threads == 0) {
        return tl::unexpected(ConfigError::invalid_setting("tool_threads", "must be positive"));
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Environment Loading
// ─────────────────────────────────────────────────────────────────────────────

ConfigResult<std::uint16_t> parse_port(std::string_view text) {
    if (text.empty()) {
        return tl::unexpected(ConfigError::invalid_value(kPortEnv, text, "empty port"));
    }

    unsigned long value = 0;
    const auto* const first = text.data();
    const auto* const last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);

    if ((ec == std::errc::result_out_of_range) ||
        ((ec == std::errc{}) && (value > std::numeric_limits<std::uint16_t>::max()))) {
        return tl::unexpected(ConfigError::invalid_value(kPortEnv, text, "port out of range (0-65535)"));
    }
    if ((ec != std::errc{}) || (ptr != last)) {
        return tl::unexpected(ConfigError::invalid_value(kPortEnv, text, "port must be a decimal number"));
    }
    return static_cast<std::uint16_t>(value);
}

namespace {

std::string_view trim(std::string_view text) {
    constexpr std::string_view kWhitespace = " \t\r\n";
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

}  // namespace

ServiceMap parse_service_map(std::string_view text) {
    ServiceMap services;
    while (text.empty() == false) {
        const auto comma = text.find(',');
        const std::string_view entry = text.substr(0, comma);
        text = (comma == std::string_view::npos) ? std::string_view{} : text.substr(comma + 1);

        const auto equals = entry.find('=');
        if (equals == std::string_view::npos) {
            continue;
        }
        const std::string_view name = trim(entry.substr(0, equals));
        const std::string_view url = trim(entry.substr(equals + 1));
        if (name.empty() || url.empty()) {
            continue;
        }
        services.insert_or_assign(std::string(name), std::string(url));
    }
    return services;
}

ConfigResult<ServerConfig> load_config_from_env(const EnvLookup& lookup) {
    ServerConfig config;

    const auto port_value = lookup(kPortEnv);
    if (port_value.has_value() && (port_value->empty() == false)) {
        auto port = parse_port(*port_value);
        if (!port) {
            return tl::unexpected(port.error());
        }
        config.http_port = *port;
        config.http.port = *port;
    }

    const auto level_value = lookup(kLogLevelEnv);
    if (level_value.has_value() && (level_value->empty() == false)) {
        const auto level = parse_log_level(*level_value);
        if (level.has_value() == false) {
            return tl::unexpected(ConfigError::invalid_value(kLogLevelEnv, *level_value, "unknown log level"));
        }
        config.log_level = *level;
    }

    const auto services_value = lookup(kServicesEnv);
    if (services_value.has_value()) {
        config.remote_services = parse_service_map(*services_value);
    }

    return config;
}

ConfigResult<ServerConfig> load_config_from_env() {
    return load_config_from_env([](const char* name) -> std::optional<std::string> {
        const char* value = std::getenv(name);
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

}  // namespace mcpsrv
