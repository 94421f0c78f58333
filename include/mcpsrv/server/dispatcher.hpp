#pragma once

#include "mcpsrv/protocol/json_rpc.hpp"
#include "mcpsrv/protocol/mcp_types.hpp"
#include "mcpsrv/server/tool_registry.hpp"

#include <optional>

namespace mcpsrv {

class Session;

/// Message-level MCP handler shared by every transport.
///
/// Takes one decoded JSON value and produces the response envelope, or
/// nothing when the message is a notification. Performs no I/O and never
/// throws: registry failures become -32603 envelopes. Safe to call
/// concurrently as long as the registry's invoke() is.
///
/// Method table:
///   initialize                 -> protocol version, capabilities, serverInfo
///   notifications/initialized  -> (no response)
///   tools/list                 -> { tools: [...] }
///   tools/call                 -> { content: [ { type: "text", text } ] }
///   resources/list             -> { resources: [] }
///   prompts/list               -> -32601 Method not found
///   anything else              -> -32601 Method '<m>' not found
class JsonRpcDispatcher {
public:
    explicit JsonRpcDispatcher(const IToolRegistry& registry, ServerInfo info = {});

    /// `session` is the originating SSE session, or nullptr for stdio.
    [[nodiscard]] std::optional<Json> dispatch(const Json& message, Session* session = nullptr) const;

    /// Dispatch an already validated request.
    [[nodiscard]] std::optional<Json> dispatch(const JsonRpcRequest& request, Session* session = nullptr) const;

    [[nodiscard]] const ServerInfo& server_info() const noexcept { return info_; }
    [[nodiscard]] const IToolRegistry& registry() const noexcept { return registry_; }

private:
    // Result payload on success, JSON-RPC error otherwise
    using MethodResult = tl::expected<Json, JsonRpcError>;

    MethodResult handle_initialize(Session* session) const;
    MethodResult handle_tools_list() const;
    MethodResult handle_tools_call(const Json& params) const;

    const IToolRegistry& registry_;
    ServerInfo info_;
};

}  // namespace mcpsrv
