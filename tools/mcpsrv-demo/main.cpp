// ─────────────────────────────────────────────────────────────────────────────
// mcpsrv-demo - MCP server with a handful of demo tools
// ─────────────────────────────────────────────────────────────────────────────
// Serves the demo registry over stdio (default) or HTTP+SSE.
//
// Usage:
//   # stdio, e.g. launched by an MCP client
//   mcpsrv-demo
//
//   # HTTP+SSE on port 8080
//   mcpsrv-demo --port 8080
//   PORT=8080 mcpsrv-demo
//
//   # Forward remote_call to peer servers
//   ACCESS_MCP_SERVICES="xdmod=http://localhost:3001" mcpsrv-demo --port 8080
//
// Exit codes: 0 clean shutdown, 1 transport failure, 2 configuration error.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include "mcpsrv/log/logger.hpp"
#include "mcpsrv/log/spdlog_logger.hpp"
#include "mcpsrv/server/tool_registry.hpp"
#include "mcpsrv/server_config.hpp"
#include "mcpsrv/transport/http_sse_transport.hpp"
#include "mcpsrv/transport/remote_tool_client.hpp"
#include "mcpsrv/transport/stdio_transport.hpp"

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <chrono>
#include <csignal>
#include <format>
#include <iostream>
#include <memory>
#include <string>

using namespace mcpsrv;
using Json = nlohmann::json;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitConfig = 2;

// ═══════════════════════════════════════════════════════════════════════════
// Demo Tools
// ═══════════════════════════════════════════════════════════════════════════

Json object_schema(Json properties, Json required = Json::array()) {
    return Json{
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", std::move(required)}
    };
}

void register_demo_tools(StaticToolRegistry& registry) {
    registry.add(
        Tool{"echo", "Return the given text unchanged",
             object_schema({{"text", {{"type", "string"}, {"description", "Text to echo"}}}}, Json::array({"text"}))},
        [](const Json& args) -> ToolResult {
            const auto it = args.find("text");
            if ((it == args.end()) || (it->is_string() == false)) {
                return tl::unexpected(ToolError{"'text' must be a string"});
            }
            return *it;
        });

    registry.add(
        Tool{"add", "Add two numbers",
             object_schema({{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}}, Json::array({"a", "b"}))},
        [](const Json& args) -> ToolResult {
            if ((args.contains("a") == false) || (args.contains("b") == false) ||
                (args["a"].is_number() == false) || (args["b"].is_number() == false)) {
                return tl::unexpected(ToolError{"'a' and 'b' must be numbers"});
            }
            return Json{{"sum", args["a"].get<double>() + args["b"].get<double>()}};
        });

    registry.add(
        Tool{"server_time", "Current server time (UTC)", object_schema(Json::object())},
        [](const Json&) -> ToolResult {
            const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
            return Json{
                {"utc", std::format("{:%FT%T}Z", now)},
                {"epoch_seconds", now.time_since_epoch().count()}
            };
        });
}

void register_remote_tool(StaticToolRegistry& registry, std::shared_ptr<const RemoteToolClient> client) {
    registry.add(
        Tool{"remote_call", "Call a tool on a peer server listed in ACCESS_MCP_SERVICES",
             object_schema({{"service", {{"type", "string"}}},
                            {"tool", {{"type", "string"}}},
                            {"arguments", {{"type", "object"}}}},
                           Json::array({"service", "tool"}))},
        [client = std::move(client)](const Json& args) -> ToolResult {
            const auto service = args.find("service");
            const auto tool = args.find("tool");
            if ((service == args.end()) || (service->is_string() == false) ||
                (tool == args.end()) || (tool->is_string() == false)) {
                return make_error_content("'service' and 'tool' must be strings");
            }

            const Json arguments = args.contains("arguments") ? args["arguments"] : Json::object();
            auto result = client->call(service->get<std::string>(), tool->get<std::string>(), arguments);
            if (!result) {
                std::string known;
                for (const auto& [name, url] : client->services()) {
                    known += known.empty() ? name : ", " + name;
                }
                return make_error_content(result.error().message, "Known services: " + known);
            }
            return std::move(*result);
        });
}

// ═══════════════════════════════════════════════════════════════════════════
// Modes
// ═══════════════════════════════════════════════════════════════════════════

int run_stdio(const ServerConfig& config, const IToolRegistry& registry) {
    JsonRpcDispatcher dispatcher(registry, config.server_info);
    StdioTransport transport(StdioTransportConfig{&std::cin, &std::cout, true}, dispatcher);

    auto result = transport.run();
    if (!result) {
        MCPSRV_LOG_ERROR("stdio transport failed: {}", result.error().message);
        return kExitFailure;
    }
    return kExitOk;
}

int run_http(const ServerConfig& config, const IToolRegistry& registry) {
    HttpSseTransport transport(config.http, registry, config.server_info);

    auto started = transport.start();
    if (!started) {
        MCPSRV_LOG_FATAL("Cannot start HTTP transport: {}", started.error().message);
        return kExitFailure;
    }

    asio::io_context signals_io;
    asio::signal_set signals(signals_io, SIGINT, SIGTERM);
    signals.async_wait([&transport](const asio::error_code& ec, int signal_number) {
        if (!ec) {
            MCPSRV_LOG_INFO("Received signal {}, shutting down", signal_number);
        }
        transport.stop();
    });
    signals_io.run();
    return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcpsrv-demo", "MCP server exposing demo tools over stdio or HTTP+SSE");

    options.add_options()
        ("p,port", "Serve HTTP+SSE on this port (overrides PORT)", cxxopts::value<std::string>())
        ("host", "Address to bind in HTTP mode", cxxopts::value<std::string>()->default_value("0.0.0.0"))
        ("l,log-level", "trace|debug|info|warn|error|fatal|off (overrides MCPSRV_LOG_LEVEL)", cxxopts::value<std::string>())
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("keepalive-ms", "SSE keepalive interval in milliseconds", cxxopts::value<long>()->default_value("30000"))
        ("version", "Print version")
        ("h,help", "Print usage");

    ServerConfig config;
    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return kExitOk;
        }
        if (result.count("version")) {
            std::cout << config.server_info.name << " " << config.server_info.version << "\n";
            return kExitOk;
        }

        auto env_config = load_config_from_env();
        if (!env_config) {
            std::cerr << "configuration error: " << env_config.error().message << "\n";
            return kExitConfig;
        }
        config = std::move(*env_config);

        if (result.count("port")) {
            auto port = parse_port(result["port"].as<std::string>());
            if (!port) {
                std::cerr << "configuration error: " << port.error().message << "\n";
                return kExitConfig;
            }
            config.http_port = *port;
            config.http.port = *port;
        }
        if (result.count("log-level")) {
            const auto level = parse_log_level(result["log-level"].as<std::string>());
            if (level.has_value() == false) {
                std::cerr << "configuration error: unknown log level '"
                          << result["log-level"].as<std::string>() << "'\n";
                return kExitConfig;
            }
            config.log_level = *level;
        }
        if (result.count("log-file")) {
            config.log_file = result["log-file"].as<std::string>();
        }
        config.http.host = result["host"].as<std::string>();
        config.http.keepalive_interval = std::chrono::milliseconds(result["keepalive-ms"].as<long>());

    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "error: " << e.what() << "\n\n" << options.help() << "\n";
        return kExitConfig;
    }

    auto valid = config.http.validate();
    if (!valid) {
        std::cerr << "configuration error: " << valid.error().message << "\n";
        return kExitConfig;
    }

    // stdout carries the stdio protocol, so logs go to stderr (and a file)
    try {
        if (config.log_file.has_value()) {
            set_logger(make_spdlog_stderr_file_logger(*config.log_file, config.log_level));
        } else {
            set_logger(make_spdlog_stderr_logger(config.log_level));
        }
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "configuration error: cannot open log file: " << e.what() << "\n";
        return kExitConfig;
    }

    StaticToolRegistry registry;
    register_demo_tools(registry);
    if (config.remote_services.empty() == false) {
        register_remote_tool(registry, std::make_shared<const RemoteToolClient>(config.remote_services));
    }
    MCPSRV_LOG_INFO("{} {} with {} tools", config.server_info.name, config.server_info.version, registry.size());

    if (config.use_http()) {
        return run_http(config, registry);
    }
    return run_stdio(config, registry);
}
