#pragma once
#include <string>
#include <variant>
#include <optional>
#include <nlohmann/json.hpp>

namespace mockmcp {

/// Request ids are echoed back verbatim, so any JSON value (including null)
/// is accepted.
using RequestId = nlohmann::json;

struct JsonRpcError {
    int code;
    std::string message;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message;
    }
};

inline void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
}

/// Outcome of a request: either a result payload or an error, never both.
using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;

struct JsonRpcRequest {
    // Absent for notifications.
    std::optional<RequestId> id;
    // Kept as decoded; a missing or non-string method is null / non-string here.
    nlohmann::json method;
    std::optional<nlohmann::json> params;

    [[nodiscard]] bool has_id() const { return id.has_value(); }

    /// Method name when it is a string, empty otherwise.
    [[nodiscard]] std::string method_name() const;
};

struct JsonRpcResponse {
    RequestId id;
    HandlerResult outcome;

    [[nodiscard]] bool is_error() const {
        return std::holds_alternative<JsonRpcError>(outcome);
    }
    [[nodiscard]] const nlohmann::json& result() const {
        return std::get<nlohmann::json>(outcome);
    }
    [[nodiscard]] const JsonRpcError& error() const {
        return std::get<JsonRpcError>(outcome);
    }

    static JsonRpcResponse success(RequestId id, nlohmann::json result);
    static JsonRpcResponse failure(RequestId id, int code, std::string message);
};

void from_json(const nlohmann::json& j, JsonRpcRequest& r);

void to_json(nlohmann::json& j, const JsonRpcResponse& r);

} // namespace mockmcp
