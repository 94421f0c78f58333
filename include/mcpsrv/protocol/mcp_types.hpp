#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpsrv {

using Json = nlohmann::json;

/// Serialize for the wire. Invalid UTF-8 in strings is replaced with U+FFFD
/// instead of throwing.
[[nodiscard]] inline std::string dump_json(const Json& value, int indent = -1) {
    return value.dump(indent, ' ', false, Json::error_handler_t::replace);
}

/// MCP protocol revision advertised by `initialize`.
inline constexpr std::string_view kProtocolVersion{"2024-11-05"};

// ─────────────────────────────────────────────────────────────────────────────
// Server Identity
// ─────────────────────────────────────────────────────────────────────────────

struct ServerInfo {
    std::string name{"mcpsrv"};
    std::string version{"0.1.0"};

    [[nodiscard]] Json to_json() const {
        return Json{{"name", name}, {"version", version}};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Tool Descriptor
// ─────────────────────────────────────────────────────────────────────────────

struct Tool {
    std::string name;
    std::string description;
    Json input_schema = Json{{"type", "object"}, {"properties", Json::object()}};

    static Tool from_json(const Json& j) {
        Tool tool;
        tool.name = j.value("name", "");
        tool.description = j.value("description", "");
        if (j.contains("inputSchema")) {
            tool.input_schema = j["inputSchema"];
        }
        return tool;
    }

    [[nodiscard]] Json to_json() const {
        return Json{
            {"name", name},
            {"description", description},
            {"inputSchema", input_schema}
        };
    }
};

/// `{ "tools": [...] }` in the given order.
[[nodiscard]] inline Json tools_to_json(const std::vector<Tool>& tools) {
    Json list = Json::array();
    for (const auto& tool : tools) {
        list.push_back(tool.to_json());
    }
    return Json{{"tools", std::move(list)}};
}

// ─────────────────────────────────────────────────────────────────────────────
// Initialize Result
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] inline Json make_initialize_result(const ServerInfo& info) {
    return Json{
        {"protocolVersion", std::string(kProtocolVersion)},
        {"capabilities", {
            {"tools", Json::object()},
            {"resources", Json::object()}
        }},
        {"serverInfo", info.to_json()}
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// Tool Output -> Content Blocks
// ─────────────────────────────────────────────────────────────────────────────

/// Text for a tool output: strings verbatim, anything else pretty-printed
/// with two-space indentation.
[[nodiscard]] inline std::string tool_output_text(const Json& output) {
    if (output.is_string()) {
        return output.get<std::string>();
    }
    return dump_json(output, 2);
}

/// `{ "content": [ { "type": "text", "text": ... } ] }`
[[nodiscard]] inline Json make_text_content(const Json& output) {
    return Json{
        {"content", Json::array({
            Json{{"type", "text"}, {"text", tool_output_text(output)}}
        })}
    };
}

/// Tool-level failure the client model can read:
/// `{ "content": [ { "type": "text", "text": "{\"error\":...,\"hint\":...}" } ], "isError": true }`
[[nodiscard]] inline Json make_error_content(std::string_view message,
                                             std::optional<std::string_view> hint = std::nullopt) {
    Json payload{{"error", std::string(message)}};
    if (hint.has_value()) {
        payload["hint"] = std::string(*hint);
    }
    return Json{
        {"content", Json::array({
            Json{{"type", "text"}, {"text", dump_json(payload)}}
        })},
        {"isError", true}
    };
}

/// True for output that is already a CallToolResult (has a "content" array).
[[nodiscard]] inline bool is_call_tool_result(const Json& output) {
    if (output.is_object() == false) {
        return false;
    }
    const auto it = output.find("content");
    return (it != output.end()) && it->is_array();
}

/// Result of tools/call for a tool output: CallToolResults (including
/// isError ones) pass through, anything else becomes text content.
[[nodiscard]] inline Json to_call_tool_result(const Json& output) {
    if (is_call_tool_result(output)) {
        return output;
    }
    return make_text_content(output);
}

}  // namespace mcpsrv
