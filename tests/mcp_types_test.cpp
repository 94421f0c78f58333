// ─────────────────────────────────────────────────────────────────────────────
// MCP Types Tests
// ─────────────────────────────────────────────────────────────────────────────
// Serialization of the server-side MCP payloads

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "mcpsrv/protocol/mcp_types.hpp"

using namespace mcpsrv;
using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Tool Descriptor
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Tool serializes with camelCase inputSchema", "[mcp][types]") {
    Tool tool;
    tool.name = "get_usage";
    tool.description = "Usage statistics";
    tool.input_schema = Json{
        {"type", "object"},
        {"properties", {{"realm", {{"type", "string"}}}}},
        {"required", {"realm"}}
    };

    auto json = tool.to_json();

    REQUIRE(json["name"] == "get_usage");
    REQUIRE(json["description"] == "Usage statistics");
    REQUIRE(json["inputSchema"]["properties"]["realm"]["type"] == "string");
    REQUIRE_FALSE(json.contains("input_schema"));
}

TEST_CASE("Tool defaults to an empty object schema", "[mcp][types]") {
    Tool tool;
    tool.name = "noop";

    auto json = tool.to_json();
    REQUIRE(json["inputSchema"]["type"] == "object");
    REQUIRE(json["inputSchema"]["properties"].empty());
}

TEST_CASE("Tool deserialization tolerates missing fields", "[mcp][types]") {
    auto tool = Tool::from_json(Json{{"name", "bare"}});
    REQUIRE(tool.name == "bare");
    REQUIRE(tool.description.empty());
    REQUIRE(tool.input_schema["type"] == "object");
}

TEST_CASE("tools_to_json preserves order", "[mcp][types]") {
    std::vector<Tool> tools(3);
    tools[0].name = "zeta";
    tools[1].name = "alpha";
    tools[2].name = "mid";

    auto json = tools_to_json(tools);
    REQUIRE(json["tools"].size() == 3);
    REQUIRE(json["tools"][0]["name"] == "zeta");
    REQUIRE(json["tools"][1]["name"] == "alpha");
    REQUIRE(json["tools"][2]["name"] == "mid");

    REQUIRE(tools_to_json({})["tools"].is_array());
}

// ═══════════════════════════════════════════════════════════════════════════
// Initialize Result
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Initialize result advertises protocol, capabilities and identity", "[mcp][types]") {
    ServerInfo info{"xdmod-data", "1.2.3"};

    auto json = make_initialize_result(info);

    REQUIRE(json["protocolVersion"] == "2024-11-05");
    REQUIRE(json["capabilities"]["tools"].is_object());
    REQUIRE(json["capabilities"]["resources"].is_object());
    REQUIRE(json["serverInfo"]["name"] == "xdmod-data");
    REQUIRE(json["serverInfo"]["version"] == "1.2.3");
}

// ═══════════════════════════════════════════════════════════════════════════
// Tool Output -> Content
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("String output is embedded unmodified", "[mcp][types][content]") {
    auto content = make_text_content(Json("line one\nline \"two\""));

    REQUIRE(content["content"].size() == 1);
    REQUIRE(content["content"][0]["type"] == "text");
    REQUIRE(content["content"][0]["text"] == "line one\nline \"two\"");
}

TEST_CASE("Structured output is pretty-printed with two-space indentation", "[mcp][types][content]") {
    Json output = {{"jobs", 12}};

    REQUIRE(tool_output_text(output) == "{\n  \"jobs\": 12\n}");
    REQUIRE(make_text_content(output)["content"][0]["text"] == "{\n  \"jobs\": 12\n}");
    REQUIRE(tool_output_text(Json(42)) == "42");
}

TEST_CASE("Invalid UTF-8 in tool text is replaced, not thrown", "[mcp][types][content]") {
    const Json output = std::string("caf\xe9");

    REQUIRE_NOTHROW((void)dump_json(make_text_content(output)));

    auto text = Json::parse(dump_json(make_text_content(output)))["content"][0]["text"].get<std::string>();
    REQUIRE(text == "caf\xef\xbf\xbd");

    Json nested = {{"name", std::string("\xff\xfe")}};
    REQUIRE_NOTHROW((void)tool_output_text(nested));
    REQUIRE(Json::parse(tool_output_text(nested))["name"] == "\xef\xbf\xbd\xef\xbf\xbd");
}

TEST_CASE("Error content is a readable isError result", "[mcp][types][content]") {
    auto bare = make_error_content("Realm 'Jobz' not found");
    REQUIRE(bare["isError"] == true);
    REQUIRE(bare["content"][0]["type"] == "text");
    REQUIRE(Json::parse(bare["content"][0]["text"].get<std::string>()) ==
        Json{{"error", "Realm 'Jobz' not found"}});

    auto hinted = make_error_content("Realm 'Jobz' not found", "Use one of: Jobs, SUPREMM");
    REQUIRE(Json::parse(hinted["content"][0]["text"].get<std::string>()) ==
        Json{{"error", "Realm 'Jobz' not found"}, {"hint", "Use one of: Jobs, SUPREMM"}});
}

TEST_CASE("Finished CallToolResults pass through unchanged", "[mcp][types][content]") {
    const Json failure = make_error_content("backend down");
    REQUIRE(is_call_tool_result(failure));
    REQUIRE(to_call_tool_result(failure) == failure);

    REQUIRE_FALSE(is_call_tool_result(Json("text")));
    REQUIRE_FALSE(is_call_tool_result(Json{{"content", "not an array"}}));
    REQUIRE(to_call_tool_result(Json("text")) == make_text_content(Json("text")));
}
