#include "mockmcp/tool_registry.hpp"
#include "mockmcp/coerce.hpp"
#include <algorithm>
#include <limits>
#include <optional>
#include <stdexcept>
#include <thread>

namespace mockmcp {

void ToolRegistry::add_tool(ToolDefinition def, ToolHandler handler) {
    auto it = std::find_if(tools_.begin(), tools_.end(),
        [&def](const ToolDefinition& t) { return t.name == def.name; });
    handlers_[def.name] = std::move(handler);
    if (it != tools_.end()) {
        *it = std::move(def);
    } else {
        tools_.push_back(std::move(def));
    }
}

const ToolHandler* ToolRegistry::find(const std::string& name) const {
    auto it = handlers_.find(name);
    return it == handlers_.end() ? nullptr : &it->second;
}

namespace tools {

CallToolResult echo(const nlohmann::json& arguments) {
    nlohmann::json message = coerce::member(arguments, "message");
    if (!coerce::is_truthy(message)) return CallToolResult::text("");
    return CallToolResult::text(coerce::to_display_string(message));
}

CallToolResult add(const nlohmann::json& arguments) {
    auto a = coerce::to_number(coerce::or_default(coerce::member(arguments, "a"), 0));
    auto b = coerce::to_number(coerce::or_default(coerce::member(arguments, "b"), 0));
    if (!a || !b) return CallToolResult::text("0");
    return CallToolResult::text(coerce::strip_trailing_zeros(coerce::format_double(*a + *b)));
}

CallToolResult fail(const nlohmann::json& /*arguments*/) {
    return CallToolResult::text(kFailureText, true);
}

CallToolResult slow(const nlohmann::json& arguments, std::chrono::milliseconds default_delay) {
    // Longest wait whose nanosecond count still fits the clock's int64 rep.
    constexpr int64_t kMaxDelayMs = std::numeric_limits<int64_t>::max() / 1000000;

    int64_t delay_ms = default_delay.count();
    nlohmann::json requested = coerce::member(arguments, "delayMs");
    if (coerce::is_truthy(requested)) {
        std::optional<int64_t> parsed;
        try {
            parsed = coerce::to_integer(requested);
        } catch (const std::out_of_range&) {
            throw std::overflow_error("sleep length is too large");
        }
        delay_ms = parsed.value_or(default_delay.count());
    }
    if (delay_ms < 0) throw std::invalid_argument("sleep length must be non-negative");
    if (delay_ms > kMaxDelayMs) throw std::overflow_error("sleep length is too large");

    if (delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }
    return CallToolResult::text("Responded after " + std::to_string(delay_ms) + "ms");
}

} // namespace tools

void register_builtin_tools(ToolRegistry& registry, std::chrono::milliseconds slow_default_delay) {
    ToolDefinition echo_def;
    echo_def.name = "echo";
    echo_def.description = "Echoes the input message back";
    echo_def.input_schema = {
        {"type", "object"},
        {"properties", {
            {"message", {{"type", "string"}, {"description", "Message to echo"}}}
        }},
        {"required", {"message"}}
    };
    registry.add_tool(std::move(echo_def), tools::echo);

    ToolDefinition add_def;
    add_def.name = "add";
    add_def.description = "Adds two numbers together";
    add_def.input_schema = {
        {"type", "object"},
        {"properties", {
            {"a", {{"type", "number"}, {"description", "First number"}}},
            {"b", {{"type", "number"}, {"description", "Second number"}}}
        }},
        {"required", {"a", "b"}}
    };
    registry.add_tool(std::move(add_def), tools::add);

    ToolDefinition fail_def;
    fail_def.name = "fail";
    fail_def.description = "Always fails with an error";
    fail_def.input_schema = {
        {"type", "object"},
        {"properties", nlohmann::json::object()}
    };
    registry.add_tool(std::move(fail_def), tools::fail);

    ToolDefinition slow_def;
    slow_def.name = "slow";
    slow_def.description = "Responds after a delay";
    slow_def.input_schema = {
        {"type", "object"},
        {"properties", {
            {"delayMs", {{"type", "number"}, {"description", "Delay in milliseconds"}}}
        }}
    };
    registry.add_tool(std::move(slow_def), [slow_default_delay](const nlohmann::json& args) {
        return tools::slow(args, slow_default_delay);
    });
}

} // namespace mockmcp
