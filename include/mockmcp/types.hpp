#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace mockmcp {

// ---------- Content types ----------

struct TextContent {
    std::string text;
};

// ---------- Tool ----------

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

struct CallToolResult {
    std::vector<TextContent> content;
    bool is_error = false;

    /// Single text block result, the only shape the built-in tools produce.
    static CallToolResult text(std::string text, bool is_error = false);
};

// ---------- Capabilities ----------

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;
};

struct Implementation {
    std::string name;
    std::string version;
};

struct InitializeResult {
    // Echoed from the client when supplied, so not necessarily a string.
    nlohmann::json protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
};

// ---------- Logging ----------

enum class LogLevel {
    Debug, Info, Notice, Warning, Error, Critical, Alert, Emergency
};

std::string log_level_to_string(LogLevel level);

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const TextContent& t);
void to_json(nlohmann::json& j, const ToolDefinition& t);
void to_json(nlohmann::json& j, const CallToolResult& t);
void to_json(nlohmann::json& j, const ServerCapabilities& t);
void to_json(nlohmann::json& j, const Implementation& t);
void to_json(nlohmann::json& j, const InitializeResult& t);

} // namespace mockmcp
