#pragma once

#include "mcpsrv/server/tool_registry.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace mcpsrv::testing {

// ─────────────────────────────────────────────────────────────────────────────
// MockToolRegistry - scripted IToolRegistry that records every invocation
// ─────────────────────────────────────────────────────────────────────────────
// Usage:
//   MockToolRegistry registry;
//   registry.add_tool("echo", [](const Json& args) -> ToolResult { return args; });
//   ... exercise dispatcher / transport ...
//   REQUIRE(registry.invocation_count() == 1);
//   REQUIRE(registry.invocations()[0].name == "echo");

class MockToolRegistry final : public IToolRegistry {
public:
    using Handler = std::function<ToolResult(const Json&)>;

    struct Invocation {
        std::string name;
        Json arguments;
    };

    MockToolRegistry& add_tool(const std::string& name, Handler handler, const std::string& description = "") {
        Tool tool;
        tool.name = name;
        tool.description = description.empty() ? "Mock tool " + name : description;
        tools_.push_back(std::move(tool));
        handlers_[name] = std::move(handler);
        return *this;
    }

    /// Tool that returns its arguments unchanged.
    MockToolRegistry& add_echo_tool(const std::string& name = "echo") {
        return add_tool(name, [](const Json& args) -> ToolResult { return args; });
    }

    /// Tool that returns a fixed string.
    MockToolRegistry& add_text_tool(const std::string& name, const std::string& text) {
        return add_tool(name, [text](const Json&) -> ToolResult { return Json(text); });
    }

    /// Tool that always reports failure.
    MockToolRegistry& add_failing_tool(const std::string& name, const std::string& message) {
        return add_tool(name, [message](const Json&) -> ToolResult {
            return tl::unexpected(ToolError{message});
        });
    }

    /// Tool whose invoke() throws, as a misbehaving registry would.
    MockToolRegistry& add_throwing_tool(const std::string& name, const std::string& message) {
        return add_tool(name, [message](const Json&) -> ToolResult {
            throw std::runtime_error(message);
        });
    }

    /// Tool that throws something that is not a std::exception.
    MockToolRegistry& add_int_throwing_tool(const std::string& name, int value = 42) {
        return add_tool(name, [value](const Json&) -> ToolResult {
            throw value;
        });
    }

    /// Tool that sleeps before answering.
    MockToolRegistry& add_slow_tool(const std::string& name, std::chrono::milliseconds delay) {
        return add_tool(name, [delay](const Json&) -> ToolResult {
            std::this_thread::sleep_for(delay);
            return Json("done");
        });
    }

    [[nodiscard]] std::vector<Tool> list_tools() const override {
        return tools_;
    }

    // Unlike StaticToolRegistry this lets handler exceptions escape
    [[nodiscard]] ToolResult invoke(const std::string& name, const Json& arguments) const override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            invocations_.push_back(Invocation{name, arguments});
        }
        ++invocation_count_;

        const auto it = handlers_.find(name);
        if (it == handlers_.end()) {
            return tl::unexpected(ToolError{"Tool '" + name + "' not found"});
        }
        return it->second(arguments);
    }

    [[nodiscard]] std::size_t invocation_count() const noexcept {
        return invocation_count_.load();
    }

    [[nodiscard]] std::vector<Invocation> invocations() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return invocations_;
    }

private:
    std::vector<Tool> tools_;
    std::map<std::string, Handler> handlers_;

    mutable std::mutex mutex_;
    mutable std::vector<Invocation> invocations_;
    mutable std::atomic<std::size_t> invocation_count_{0};
};

}  // namespace mcpsrv::testing
