#include "mockmcp/json_rpc.hpp"
#include "mockmcp/version.hpp"

namespace mockmcp {

std::string JsonRpcRequest::method_name() const {
    return method.is_string() ? method.get<std::string>() : std::string();
}

JsonRpcResponse JsonRpcResponse::success(RequestId id, nlohmann::json result) {
    return JsonRpcResponse{std::move(id), HandlerResult{std::move(result)}};
}

JsonRpcResponse JsonRpcResponse::failure(RequestId id, int code, std::string message) {
    return JsonRpcResponse{std::move(id), HandlerResult{JsonRpcError{code, std::move(message)}}};
}

void from_json(const nlohmann::json& j, JsonRpcRequest& r) {
    if (j.contains("id")) r.id = j.at("id");
    r.method = j.contains("method") ? j.at("method") : nlohmann::json();
    if (j.contains("params")) r.params = j.at("params");
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = r.id;
    if (const auto* ok = std::get_if<nlohmann::json>(&r.outcome)) {
        j["result"] = *ok;
    } else {
        j["error"] = std::get<JsonRpcError>(r.outcome);
    }
}

} // namespace mockmcp
