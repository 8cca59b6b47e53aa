#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <optional>
#include <unordered_map>
#include <string>

namespace mockmcp {

using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a notification handler. Messages for this method never get a
    /// response, even when they carry an id.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Dispatch one request. Returns the response, or nullopt for notifications.
    /// Unknown methods are answered with MethodNotFound, id or not.
    /// McpProtocolError from a handler becomes an error response carrying its
    /// code; any other exception propagates to the caller.
    [[nodiscard]] std::optional<JsonRpcResponse> dispatch(const JsonRpcRequest& req) const;

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace mockmcp
