#include "mcpsrv/protocol/json_rpc.hpp"

#include <utility>

namespace mcpsrv {
namespace {

bool is_valid_params_type(const Json& node) {
    const bool is_object = node.is_object();
    const bool is_array = node.is_array();
    return (is_object == true) || (is_array == true);
}

tl::unexpected<EnvelopeError> invalid_request(std::string detail, std::optional<Json> id) {
    return tl::unexpected(EnvelopeError{
        JsonRpcError::make(ErrorCode::InvalidRequest, "Invalid Request: " + detail),
        std::move(id)});
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcError
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcError JsonRpcError::make(ErrorCode code, std::string message) {
    return JsonRpcError{to_int(code), std::move(message), std::nullopt};
}

Json JsonRpcError::to_json() const {
    Json payload = Json::object();
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

// ─────────────────────────────────────────────────────────────────────────────
// Raw JSON Parsing
// ─────────────────────────────────────────────────────────────────────────────

tl::expected<Json, JsonParseError> parse_json(std::string_view text) {
    try {
        return Json::parse(text.begin(), text.end());
    } catch (const Json::parse_error& err) {
        return tl::unexpected(JsonParseError{err.what(), err.byte});
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest::JsonRpcRequest(std::string method,
                               std::optional<Json> id,
                               Json params)
    : method_(std::move(method)),
      id_(std::move(id)),
      params_(std::move(params)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const std::optional<Json>& JsonRpcRequest::id() const noexcept {
    return id_;
}

const Json& JsonRpcRequest::params() const noexcept {
    return params_;
}

bool JsonRpcRequest::is_notification() const noexcept {
    return id_.has_value() == false;
}

JsonRpcResult<JsonRpcRequest> JsonRpcRequest::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return invalid_request("payload must be a JSON object", std::nullopt);
    }

    std::optional<Json> id;
    const auto id_it = payload.find("id");
    if (id_it != payload.end()) {
        id = *id_it;
    }

    const auto version_it = payload.find("jsonrpc");
    if (version_it == payload.end()) {
        return invalid_request("missing jsonrpc version field", id);
    }
    if ((version_it->is_string() == false) || (version_it->get<std::string>() != kJsonRpcVersion)) {
        return invalid_request("jsonrpc must equal \"2.0\"", id);
    }

    const auto method_it = payload.find("method");
    if (method_it == payload.end()) {
        return invalid_request("missing method field", id);
    }
    if (method_it->is_string() == false) {
        return invalid_request("method must be a string", id);
    }

    Json params = Json::object();
    const auto params_it = payload.find("params");
    if ((params_it != payload.end()) && (params_it->is_null() == false)) {
        if (is_valid_params_type(*params_it) == false) {
            return invalid_request("params must be an object or array", id);
        }
        params = *params_it;
    }

    return JsonRpcRequest(method_it->get<std::string>(), std::move(id), std::move(params));
}

// ─────────────────────────────────────────────────────────────────────────────
// Response Envelope Builders
// ─────────────────────────────────────────────────────────────────────────────

Json make_result_response(const Json& id, Json result) {
    Json payload = Json::object();
    payload["jsonrpc"] = std::string(kJsonRpcVersion);
    payload["id"] = id;
    payload["result"] = std::move(result);
    return payload;
}

Json make_error_response(const Json& id, const JsonRpcError& error) {
    Json payload = Json::object();
    payload["jsonrpc"] = std::string(kJsonRpcVersion);
    payload["id"] = id;
    payload["error"] = error.to_json();
    return payload;
}

}  // namespace mcpsrv
