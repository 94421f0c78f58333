#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace mcpsrv {

using Json = nlohmann::json;

inline constexpr std::string_view kJsonRpcVersion{"2.0"};

// ─────────────────────────────────────────────────────────────────────────────
// Error Codes (JSON-RPC 2.0 reserved range)
// ─────────────────────────────────────────────────────────────────────────────

enum class ErrorCode : std::int32_t {
    ParseError     = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams  = -32602,
    InternalError  = -32603
};

[[nodiscard]] constexpr std::int32_t to_int(ErrorCode code) noexcept {
    return static_cast<std::int32_t>(code);
}

struct JsonRpcError {
    std::int32_t code{to_int(ErrorCode::InternalError)};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;

    static JsonRpcError make(ErrorCode code, std::string message);
};

// ─────────────────────────────────────────────────────────────────────────────
// Raw JSON Parsing
// ─────────────────────────────────────────────────────────────────────────────

struct JsonParseError {
    std::string message;
    std::size_t position{0};  // Byte offset where parsing stopped
};

[[nodiscard]] tl::expected<Json, JsonParseError> parse_json(std::string_view text);

// ─────────────────────────────────────────────────────────────────────────────
// Request Envelope
// ─────────────────────────────────────────────────────────────────────────────

/// A request that could not be turned into a JsonRpcRequest.
/// `id` is set when the payload carried one, so the error can be correlated.
struct EnvelopeError {
    JsonRpcError error;
    std::optional<Json> id;
};

template <typename T>
using JsonRpcResult = tl::expected<T, EnvelopeError>;

/// Inbound call or notification. The id is an opaque correlation token:
/// whatever JSON value the client sent is echoed back untouched.
class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, std::optional<Json> id, Json params = Json::object());

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const std::optional<Json>& id() const noexcept;
    [[nodiscard]] const Json& params() const noexcept;
    [[nodiscard]] bool is_notification() const noexcept;

    static JsonRpcResult<JsonRpcRequest> from_json(const Json& payload);

private:
    std::string method_;
    std::optional<Json> id_;
    Json params_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Response Envelope Builders
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] Json make_result_response(const Json& id, Json result);
[[nodiscard]] Json make_error_response(const Json& id, const JsonRpcError& error);

}  // namespace mcpsrv
