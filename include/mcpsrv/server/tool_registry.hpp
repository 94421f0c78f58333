#pragma once

#include "mcpsrv/protocol/mcp_types.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <tl/expected.hpp>

namespace mcpsrv {

// ─────────────────────────────────────────────────────────────────────────────
// Tool Invocation Result
// ─────────────────────────────────────────────────────────────────────────────

struct ToolError {
    std::string message;
};

/// Success carries the tool's raw output: a string (sent as-is), a finished
/// CallToolResult such as make_error_content() (passed through), or any other
/// JSON value (serialized by the protocol layer).
using ToolResult = tl::expected<Json, ToolError>;

// ─────────────────────────────────────────────────────────────────────────────
// IToolRegistry - the boundary the protocol layer is written against
// ─────────────────────────────────────────────────────────────────────────────
// Implementations validate arguments against their own schemas. invoke()
// must report failures through ToolError; it is called concurrently from the
// HTTP worker pool and must be reentrant.

class IToolRegistry {
public:
    virtual ~IToolRegistry() = default;

    /// Registered tools in registration order. The set never changes at runtime.
    [[nodiscard]] virtual std::vector<Tool> list_tools() const = 0;

    [[nodiscard]] virtual ToolResult invoke(const std::string& name, const Json& arguments) const = 0;

    [[nodiscard]] virtual bool has_tool(std::string_view name) const {
        for (const auto& tool : list_tools()) {
            if (tool.name == name) {
                return true;
            }
        }
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// StaticToolRegistry - tools backed by callbacks
// ─────────────────────────────────────────────────────────────────────────────
//
// Usage:
//   StaticToolRegistry registry;
//   registry.add(Tool{"echo", "Echo the input", schema},
//                [](const Json& args) -> ToolResult { return args.value("text", ""); });
//
// Register everything before handing the registry to a transport; add() is
// not synchronized with invoke().

class StaticToolRegistry final : public IToolRegistry {
public:
    using Handler = std::function<ToolResult(const Json& arguments)>;

    /// Returns false (and registers nothing) if the name is taken or empty.
    bool add(Tool tool, Handler handler);

    [[nodiscard]] std::vector<Tool> list_tools() const override;

    /// Exceptions thrown by a handler are converted to ToolError.
    [[nodiscard]] ToolResult invoke(const std::string& name, const Json& arguments) const override;

    [[nodiscard]] bool has_tool(std::string_view name) const override;

    [[nodiscard]] std::size_t size() const noexcept { return tools_.size(); }

private:
    std::vector<Tool> tools_;
    std::unordered_map<std::string, Handler> handlers_;
};

}  // namespace mcpsrv
