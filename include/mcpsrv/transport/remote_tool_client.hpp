#pragma once

#include "mcpsrv/protocol/mcp_types.hpp"
#include "mcpsrv/server/tool_registry.hpp"
#include "mcpsrv/server_config.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpsrv {

// ─────────────────────────────────────────────────────────────────────────────
// RemoteToolClient - calls tools on peer servers over their REST surface
// ─────────────────────────────────────────────────────────────────────────────
// Peers are addressed by service name (see ACCESS_MCP_SERVICES). A call is
// POST {url}/tools/{tool} with body {"arguments": ...}; the peer's JSON body
// is returned on 200 and anything else becomes a ToolError.
//
// Usage:
//   RemoteToolClient client(config.remote_services);
//   auto result = client.call("xdmod-data", "get_usage", {{"realm", "Jobs"}});
//
// Calls block the calling thread; tool handlers already run on the worker pool.

class RemoteToolClient {
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{30'000};

    explicit RemoteToolClient(ServiceMap services, std::chrono::milliseconds timeout = kDefaultTimeout);

    /// Base URL registered for `service`, or nullopt.
    [[nodiscard]] std::optional<std::string> endpoint(std::string_view service) const;

    [[nodiscard]] const ServiceMap& services() const noexcept { return services_; }

    /// Invoke `tool` on `service` and return the peer's response body.
    [[nodiscard]] ToolResult call(std::string_view service,
                                  std::string_view tool,
                                  const Json& arguments = Json::object()) const;

    /// GET {url}/tools on `service`.
    [[nodiscard]] tl::expected<std::vector<Tool>, ToolError> list_tools(std::string_view service) const;

private:
    ServiceMap services_;
    std::chrono::milliseconds timeout_;
};

}  // namespace mcpsrv
