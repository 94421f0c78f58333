#include "mcpsrv/server/tool_registry.hpp"

#include "mcpsrv/log/logger.hpp"

#include <exception>

namespace mcpsrv {

bool StaticToolRegistry::add(Tool tool, Handler handler) {
    if (tool.name.empty() || !handler) {
        return false;
    }
    if (handlers_.contains(tool.name)) {
        MCPSRV_LOG_WARN("Tool '{}' is already registered", tool.name);
        return false;
    }

    handlers_.emplace(tool.name, std::move(handler));
    tools_.push_back(std::move(tool));
    return true;
}

std::vector<Tool> StaticToolRegistry::list_tools() const {
    return tools_;
}

bool StaticToolRegistry::has_tool(std::string_view name) const {
    return handlers_.contains(std::string(name));
}

ToolResult StaticToolRegistry::invoke(const std::string& name, const Json& arguments) const {
    const auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return tl::unexpected(ToolError{"Tool '" + name + "' not found"});
    }

    try {
        return it->second(arguments);
    } catch (const std::exception& e) {
        MCPSRV_LOG_WARN("Tool '{}' threw: {}", name, e.what());
        return tl::unexpected(ToolError{e.what()});
    } catch (...) {
        MCPSRV_LOG_WARN("Tool '{}' threw an unknown exception", name);
        return tl::unexpected(ToolError{"Unknown error"});
    }
}

}  // namespace mcpsrv
