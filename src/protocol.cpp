#include "ambassador/protocol.hpp"
#include "ambassador/error.hpp"

namespace ambassador {

namespace {

CallToolRequest parse_call_tool(const std::optional<nlohmann::json>& params) {
    if (!params || !params->is_object()) {
        throw ProtocolError(error::InvalidParams, "Invalid params: name required");
    }
    auto name = params->find("name");
    if (name == params->end() || !name->is_string() || name->get<std::string>().empty()) {
        throw ProtocolError(error::InvalidParams, "Invalid params: name required");
    }

    CallToolRequest req;
    req.name = name->get<std::string>();
    auto args = params->find("arguments");
    if (args != params->end() && !args->is_null()) {
        if (!args->is_object()) {
            throw ProtocolError(error::InvalidParams, "Invalid params: arguments must be an object");
        }
        req.arguments = *args;
    }
    return req;
}

} // anonymous namespace

HostRequest parse_host_request(const std::string& method,
                               const std::optional<nlohmann::json>& params) {
    if (method == method::Initialize) return InitializeRequest{};
    if (method == method::Ping) return PingRequest{};
    if (method == method::ToolsList) return ListToolsRequest{};
    if (method == method::ToolsCall) return parse_call_tool(params);
    throw ProtocolError(error::MethodNotFound, "Method not found: " + method);
}

HostNotification parse_host_notification(const std::string& method,
                                         const std::optional<nlohmann::json>& params) {
    if (method == method::Initialized) return InitializedNotification{};
    if (method == method::ToolsList) return ListToolsRequest{};
    if (method == method::ToolsCall) return parse_call_tool(params);
    return IgnoredNotification{method};
}

} // namespace ambassador
