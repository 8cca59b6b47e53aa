#pragma once
#include "types.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mockmcp {

using ToolHandler = std::function<CallToolResult(const nlohmann::json& arguments)>;

/// Name-indexed tool catalog that preserves registration order for tools/list.
class ToolRegistry {
public:
    /// Register a tool. A tool with the same name is replaced in place.
    void add_tool(ToolDefinition def, ToolHandler handler);

    [[nodiscard]] const std::vector<ToolDefinition>& list() const { return tools_; }

    /// Handler for `name`, or nullptr if no such tool exists.
    [[nodiscard]] const ToolHandler* find(const std::string& name) const;

    [[nodiscard]] size_t size() const { return tools_.size(); }

private:
    std::vector<ToolDefinition> tools_;
    std::unordered_map<std::string, ToolHandler> handlers_;
};

// ---------- Built-in tools ----------

namespace tools {

constexpr const char* kFailureText = "Intentional failure for testing";

/// Text of `message`, or "" when absent or falsy.
CallToolResult echo(const nlohmann::json& arguments);

/// Sum of `a` and `b` (each 0 when absent or falsy), trailing zeros stripped.
/// Unconvertible operands yield "0"; never an error.
CallToolResult add(const nlohmann::json& arguments);

/// Always a tool-level failure.
CallToolResult fail(const nlohmann::json& arguments);

/// Blocks the calling thread for `delayMs` milliseconds, falling back to
/// `default_delay` when absent, falsy or not an integer. Throws
/// std::invalid_argument for a negative delay and std::overflow_error for one
/// too large to wait on.
CallToolResult slow(const nlohmann::json& arguments, std::chrono::milliseconds default_delay);

} // namespace tools

/// Register echo, add, fail and slow, in that order.
void register_builtin_tools(ToolRegistry& registry,
                            std::chrono::milliseconds slow_default_delay = std::chrono::milliseconds(1000));

} // namespace mockmcp
