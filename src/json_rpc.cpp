#include "ambassador/json_rpc.hpp"
#include "ambassador/version.hpp"

namespace ambassador {

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    nlohmann::json id_j = nullptr;
    if (r.id) to_json(id_j, *r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["result"] = r.result ? *r.result : nlohmann::json::object();
    }
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    if (j.contains("id") && !j.at("id").is_null()) {
        RequestId id;
        from_json(j.at("id"), id);
        r.id = std::move(id);
    }
    if (j.contains("result")) r.result = j.at("result");
    if (j.contains("error")) r.error = j.at("error").get<JsonRpcError>();
}

JsonRpcResponse make_result(const RequestId& id, nlohmann::json result) {
    JsonRpcResponse resp;
    resp.id = id;
    resp.result = std::move(result);
    return resp;
}

JsonRpcResponse make_error(std::optional<RequestId> id, int code, std::string message) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.error = JsonRpcError{code, std::move(message), std::nullopt};
    return resp;
}

} // namespace ambassador
