#include "mockmcp/router.hpp"
#include "mockmcp/coerce.hpp"
#include "mockmcp/error.hpp"

namespace mockmcp {

void Router::on_request(const std::string& method, RequestHandler handler) {
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    notification_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

std::optional<JsonRpcResponse> Router::dispatch(const JsonRpcRequest& req) const {
    RequestId req_id = req.id ? *req.id : RequestId(nullptr);
    // Absent or falsy params are handed to handlers as an empty object.
    nlohmann::json params = coerce::or_default(req.params ? *req.params : nlohmann::json(),
                                               nlohmann::json::object());

    if (req.method.is_string()) {
        const auto& method = req.method.get_ref<const std::string&>();

        auto nit = notification_handlers_.find(method);
        if (nit != notification_handlers_.end()) {
            nit->second(params);
            return std::nullopt;
        }

        auto it = request_handlers_.find(method);
        if (it != request_handlers_.end()) {
            try {
                return JsonRpcResponse{req_id, it->second(params)};
            } catch (const McpProtocolError& e) {
                return JsonRpcResponse::failure(req_id, e.code, e.what());
            }
        }
    }

    return JsonRpcResponse::failure(req_id, error::MethodNotFound,
                                    "Method not found: " + coerce::to_display_string(req.method));
}

} // namespace mockmcp
