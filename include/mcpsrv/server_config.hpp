#ifndef MCPSRV_SERVER_CONFIG_HPP
#define MCPSRV_SERVER_CONFIG_HPP

#include "mcpsrv/log/logger.hpp"
#include "mcpsrv/protocol/mcp_types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace mcpsrv {

// ─────────────────────────────────────────────────────────────────────────────
// Configuration Errors
// ─────────────────────────────────────────────────────────────────────────────

struct ConfigError {
    std::string message;

    static ConfigError invalid_value(std::string_view key, std::string_view value, std::string_view reason) {
        return {std::string(key) + "='" + std::string(value) + "': " + std::string(reason)};
    }

    static ConfigError invalid_setting(std::string_view key, std::string_view reason) {
        return {std::string(key) + ": " + std::string(reason)};
    }
};

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Server Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct HttpServerConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Listener
    // ─────────────────────────────────────────────────────────────────────────

    std::string host{"0.0.0.0"};

    // 0 binds an ephemeral port; HttpSseTransport::port() reports the result.
    std::uint16_t port{8000};

    // ─────────────────────────────────────────────────────────────────────────
    // SSE
    // ─────────────────────────────────────────────────────────────────────────

    // Idle time after which a ": keepalive" comment is written to the stream.
    std::chrono::milliseconds keepalive_interval{30'000};

    // Undelivered envelopes a session may hold before enqueue fails.
    std::size_t session_queue_capacity{1024};

    // ─────────────────────────────────────────────────────────────────────────
    // Request Limits
    // ─────────────────────────────────────────────────────────────────────────

    std::size_t max_header_size{16 * 1024};     // 16 KiB
    std::size_t max_body_size{1024 * 1024};     // 1 MiB

    // A connection that has not delivered a complete request in this time is
    // closed. Does not apply to open SSE streams.
    std::chrono::milliseconds idle_timeout{60'000};

    // ─────────────────────────────────────────────────────────────────────────
    // Threads
    // ─────────────────────────────────────────────────────────────────────────

    // Threads running the io_context (accept, parse, SSE writes).
    std::size_t io_threads{1};

    // Worker pool for tool invocation and JSON-RPC dispatch.
    std::size_t tool_threads{4};

    HttpServerConfig& with_host(std::string value);
    HttpServerConfig& with_port(std::uint16_t value);
    HttpServerConfig& with_keepalive_interval(std::chrono::milliseconds interval);
    HttpServerConfig& with_tool_threads(std::size_t count);
    HttpServerConfig& with_idle_timeout(std::chrono::milliseconds timeout);

    /// Reject values the transport cannot run with (zero sizes or intervals).
    [[nodiscard]] ConfigResult<void> validate() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Remote Services
// ─────────────────────────────────────────────────────────────────────────────

/// Service name -> base URL of a peer server exposing POST /tools/{name}.
using ServiceMap = std::map<std::string, std::string, std::less<>>;

/// Parse "name=url,name2=url2". Names and URLs are trimmed; entries missing
/// either are skipped. A later duplicate name replaces an earlier one.
[[nodiscard]] ServiceMap parse_service_map(std::string_view text);

// ─────────────────────────────────────────────────────────────────────────────
// Process Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct ServerConfig {
    ServerInfo server_info;

    // Set: serve HTTP+SSE on this port. Unset: serve stdio.
    std::optional<std::uint16_t> http_port;

    LogLevel log_level{LogLevel::Info};

    // Unset: log to stderr only.
    std::optional<std::string> log_file;

    HttpServerConfig http;

    ServiceMap remote_services;

    [[nodiscard]] bool use_http() const noexcept { return http_port.has_value(); }
};

/// Environment variable names read by load_config_from_env().
inline constexpr const char* kPortEnv = "PORT";
inline constexpr const char* kLogLevelEnv = "MCPSRV_LOG_LEVEL";
inline constexpr const char* kServicesEnv = "ACCESS_MCP_SERVICES";

/// Decimal port in [0, 65535]; surrounding whitespace is not accepted.
[[nodiscard]] ConfigResult<std::uint16_t> parse_port(std::string_view text);

/// Returns the value of an environment variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

/// Build a ServerConfig from the process environment.
///
///   PORT              numeric -> HTTP mode on that port; unset/empty -> stdio
///   MCPSRV_LOG_LEVEL  trace|debug|info|warn|error|fatal|off
///   ACCESS_MCP_SERVICES  name=url,... peers reachable through RemoteToolClient
[[nodiscard]] ConfigResult<ServerConfig> load_config_from_env(const EnvLookup& lookup);
[[nodiscard]] ConfigResult<ServerConfig> load_config_from_env();

}  // namespace mcpsrv

#endif  // MCPSRV_SERVER_CONFIG_HPP
