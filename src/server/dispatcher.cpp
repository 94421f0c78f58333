#include "mcpsrv/server/dispatcher.hpp"

#include "mcpsrv/log/logger.hpp"
#include "mcpsrv/server/session_manager.hpp"

#include <exception>
#include <string>

namespace mcpsrv {

namespace {

constexpr std::string_view kInitialize = "initialize";
constexpr std::string_view kInitializedNotification = "notifications/initialized";
constexpr std::string_view kToolsList = "tools/list";
constexpr std::string_view kToolsCall = "tools/call";
constexpr std::string_view kResourcesList = "resources/list";
constexpr std::string_view kPromptsList = "prompts/list";

tl::unexpected<JsonRpcError> rpc_error(ErrorCode code, std::string message) {
    return tl::unexpected(JsonRpcError::make(code, std::move(message)));
}

}  // namespace

JsonRpcDispatcher::JsonRpcDispatcher(const IToolRegistry& registry, ServerInfo info)
    : registry_(registry)
    , info_(std::move(info))
{}

std::optional<Json> JsonRpcDispatcher::dispatch(const Json& message, Session* session) const {
    auto request = JsonRpcRequest::from_json(message);
    if (!request) {
        const auto& failure = request.error();
        if (failure.id.has_value() == false) {
            // No id to answer to: treat as a malformed notification
            MCPSRV_LOG_DEBUG("Dropping malformed notification: {}", failure.error.message);
            return std::nullopt;
        }
        MCPSRV_LOG_WARN("Rejecting request: {}", failure.error.message);
        return make_error_response(*failure.id, failure.error);
    }
    return dispatch(*request, session);
}

std::optional<Json> JsonRpcDispatcher::dispatch(const JsonRpcRequest& request, Session* session) const {
    const std::string& method = request.method();

    if (method == kInitializedNotification) {
        MCPSRV_LOG_DEBUG("Client reported initialized{}",
                         session != nullptr ? " (session " + session->id() + ")" : std::string{});
        return std::nullopt;
    }

    MethodResult result = rpc_error(ErrorCode::InternalError, "Internal error");
    try {
        if (method == kInitialize) {
            result = handle_initialize(session);
        } else if (method == kToolsList) {
            result = handle_tools_list();
        } else if (method == kToolsCall) {
            result = handle_tools_call(request.params());
        } else if (method == kResourcesList) {
            result = Json{{"resources", Json::array()}};
        } else if (method == kPromptsList) {
            result = rpc_error(ErrorCode::MethodNotFound, "Method not found");
        } else {
            result = rpc_error(ErrorCode::MethodNotFound, "Method '" + method + "' not found");
        }
    } catch (const std::exception& e) {
        MCPSRV_LOG_ERROR("Unhandled failure in '{}': {}", method, e.what());
        result = rpc_error(ErrorCode::InternalError, e.what());
    } catch (...) {
        MCPSRV_LOG_ERROR("Unknown exception in '{}'", method);
        result = rpc_error(ErrorCode::InternalError, "Unknown error");
    }

    if (request.is_notification()) {
        return std::nullopt;
    }

    const Json& id = *request.id();
    if (!result) {
        return make_error_response(id, result.error());
    }
    return make_result_response(id, std::move(*result));
}

JsonRpcDispatcher::MethodResult JsonRpcDispatcher::handle_initialize(Session* session) const {
    if (session != nullptr) {
        session->mark_initialized();
        MCPSRV_LOG_INFO("Session {} initialized", session->id());
    }
    return make_initialize_result(info_);
}

JsonRpcDispatcher::MethodResult JsonRpcDispatcher::handle_tools_list() const {
    return tools_to_json(registry_.list_tools());
}

JsonRpcDispatcher::MethodResult JsonRpcDispatcher::handle_tools_call(const Json& params) const {
    if (params.is_object() == false) {
        return rpc_error(ErrorCode::InvalidParams, "Invalid params: params must be an object");
    }

    const auto name_it = params.find("name");
    if ((name_it == params.end()) || (name_it->is_string() == false)) {
        return rpc_error(ErrorCode::InvalidParams, "Invalid params: missing tool name");
    }
    const std::string name = name_it->get<std::string>();

    Json arguments = Json::object();
    const auto args_it = params.find("arguments");
    if ((args_it != params.end()) && (args_it->is_null() == false)) {
        if (args_it->is_object() == false) {
            return rpc_error(ErrorCode::InvalidParams, "Invalid params: arguments must be an object");
        }
        arguments = *args_it;
    }

    if (registry_.has_tool(name) == false) {
        return rpc_error(ErrorCode::MethodNotFound, "Tool '" + name + "' not found");
    }

    auto output = registry_.invoke(name, arguments);
    if (!output) {
        MCPSRV_LOG_WARN("Tool '{}' failed: {}", name, output.error().message);
        return rpc_error(ErrorCode::InternalError, output.error().message);
    }
    return to_call_tool_result(*output);
}

}  // namespace mcpsrv
