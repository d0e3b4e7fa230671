#include "ambassador/dispatcher.hpp"
#include "ambassador/codec.hpp"
#include "ambassador/error.hpp"
#include "ambassador/version.hpp"

#include <spdlog/spdlog.h>
#include <type_traits>

namespace ambassador {

namespace {

constexpr const char* kToolsPath = "/v1/tools";
constexpr const char* kInvokePath = "/v1/tools/invoke";

std::string describe(const RequestId& id) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) return v;
        else return std::to_string(v);
    }, id);
}

nlohmann::json text_item(const nlohmann::json& value) {
    return nlohmann::json{{"type", "text"},
                          {"text", value.is_string() ? value.get<std::string>() : value.dump()}};
}

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // anonymous namespace

CatalogCache::Fetched fetch_tool_catalog(SessionManager& session) {
    auto reply = session.request("GET", kToolsPath);
    return {reply.body.get<ToolCatalog>(), reply.generation};
}

ToolInvocationResponse invoke_tool(SessionManager& session, const ToolInvocationRequest& request) {
    auto body = session.invoke("POST", kInvokePath, nlohmann::json(request));
    return body.get<ToolInvocationResponse>();
}

ToolDefinition to_tool_definition(const ToolDescriptor& tool) {
    ToolDefinition def;
    def.name = tool.name;
    def.description = tool.description;
    def.input_schema = tool.input_schema.is_object() ? tool.input_schema
                                                     : nlohmann::json{{"type", "object"}};
    return def;
}

CallToolResult to_call_tool_result(const nlohmann::json& result) {
    CallToolResult out;
    if (result.is_array()) {
        out.content = result;
    } else if (result.is_object() && result.contains("content") && result["content"].is_array()) {
        out.content = result["content"];
        auto is_error = result.find("isError");
        out.is_error = is_error != result.end() && is_error->is_boolean() && is_error->get<bool>();
    } else {
        out.content = nlohmann::json::array({text_item(result)});
    }
    return out;
}

Dispatcher::Dispatcher(SessionManager& session, CatalogCache& cache)
    : session_(session), cache_(cache) {}

std::optional<JsonRpcResponse> Dispatcher::handle_line(std::string_view line) {
    JsonRpcMessage msg;
    try {
        msg = Codec::parse(line);
    } catch (const ParseError& e) {
        spdlog::warn("Rejected inbound frame: {}", e.what());
        return make_error(std::nullopt, error::ParseError, "Parse error");
    }
    return dispatch(msg);
}

std::optional<JsonRpcResponse> Dispatcher::dispatch(const JsonRpcMessage& msg) {
    return std::visit(overloaded{
        [this](const JsonRpcRequest& req) -> std::optional<JsonRpcResponse> {
            return handle_request(req);
        },
        [this](const JsonRpcNotification& notif) -> std::optional<JsonRpcResponse> {
            handle_notification(notif);
            return std::nullopt;
        },
        [](const JsonRpcResponse&) -> std::optional<JsonRpcResponse> {
            spdlog::debug("Ignoring JSON-RPC response sent by host");
            return std::nullopt;
        },
    }, msg);
}

JsonRpcResponse Dispatcher::handle_request(const JsonRpcRequest& req) {
    spdlog::debug("Request {} ({})", req.method, describe(req.id));
    try {
        auto request = parse_host_request(req.method, req.params);
        auto result = std::visit(overloaded{
            [this](const InitializeRequest&) { return on_initialize(); },
            [](const PingRequest&) { return nlohmann::json::object(); },
            [this](const ListToolsRequest&) { return on_list_tools(); },
            [this](const CallToolRequest& call) { return on_call_tool(call); },
        }, request);
        return make_result(req.id, std::move(result));
    } catch (const ProtocolError& e) {
        // InternalError causes were already logged where they happened
        if (e.code != error::InternalError) spdlog::warn("Request {} ({}) rejected: {}", req.method, describe(req.id), e.what());
        return make_error(req.id, e.code, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Request {} ({}) failed: {}", req.method, describe(req.id), e.what());
        return make_error(req.id, error::InternalError, "Internal error");
    }
}

void Dispatcher::handle_notification(const JsonRpcNotification& notif) {
    try {
        std::visit(overloaded{
            [](const InitializedNotification&) { spdlog::info("Host initialized"); },
            [this](const ListToolsRequest&) { (void)on_list_tools(); },
            [this](const CallToolRequest& call) { (void)on_call_tool(call); },
            [](const IgnoredNotification& n) { spdlog::debug("Ignoring notification {}", n.method); },
        }, parse_host_notification(notif.method, notif.params));
    } catch (const ProtocolError& e) {
        if (e.code != error::InternalError) spdlog::warn("Notification {} rejected: {}", notif.method, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Notification {} failed: {}", notif.method, e.what());
    }
}

nlohmann::json Dispatcher::on_initialize() {
    InitializeResult result;
    result.protocol_version = std::string(PROTOCOL_VERSION);
    result.capabilities.tools = nlohmann::json::object();
    result.server_info = Implementation{std::string(SERVER_NAME), std::string(LIBRARY_VERSION)};
    return result;
}

nlohmann::json Dispatcher::on_list_tools() {
    CatalogCache::Result catalog;
    try {
        catalog = cache_.get();
    } catch (const std::exception& e) {
        spdlog::error("Failed to fetch tool catalog: {}", e.what());
        throw ProtocolError(error::InternalError, "Failed to fetch tool catalog");
    }

    auto tools = nlohmann::json::array();
    for (const auto& tool : catalog.catalog.tools) {
        tools.push_back(nlohmann::json(to_tool_definition(tool)));
    }
    return nlohmann::json{{"tools", std::move(tools)}};
}

nlohmann::json Dispatcher::on_call_tool(const CallToolRequest& req) {
    ToolInvocationResponse response;
    try {
        response = invoke_tool(session_, ToolInvocationRequest{req.name, req.arguments});
    } catch (const std::exception& e) {
        spdlog::error("Tool invocation failed for '{}': {}", req.name, e.what());
        throw ProtocolError(error::InternalError, "Tool invocation failed");
    }
    spdlog::debug("Tool '{}' completed (request {})", req.name, response.request_id);
    return to_call_tool_result(response.result);
}

} // namespace ambassador
