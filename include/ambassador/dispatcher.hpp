#pragma once
#include "catalog_cache.hpp"
#include "json_rpc.hpp"
#include "protocol.hpp"
#include "session_manager.hpp"
#include "types.hpp"
#include <optional>
#include <string_view>

namespace ambassador {

/// GET /v1/tools through the session's authenticated path, tagged with the
/// session generation that answered it.
[[nodiscard]] CatalogCache::Fetched fetch_tool_catalog(SessionManager& session);

/// POST /v1/tools/invoke through the session's authenticated path.
[[nodiscard]] ToolInvocationResponse invoke_tool(SessionManager& session,
                                                 const ToolInvocationRequest& request);

/// Backend catalog entry -> host tool definition.
[[nodiscard]] ToolDefinition to_tool_definition(const ToolDescriptor& tool);

/// Backend invocation result -> host tools/call result.
[[nodiscard]] CallToolResult to_call_tool_result(const nlohmann::json& result);

/// Turns host lines into responses. Every failure is converted here into one
/// of the generic JSON-RPC error codes; details go to the log only.
class Dispatcher {
public:
    Dispatcher(SessionManager& session, CatalogCache& cache);

    /// Parse and handle one inbound line. Returns nothing for notifications
    /// and for responses sent by the host.
    std::optional<JsonRpcResponse> handle_line(std::string_view line);

    std::optional<JsonRpcResponse> dispatch(const JsonRpcMessage& msg);

private:
    JsonRpcResponse handle_request(const JsonRpcRequest& req);
    void handle_notification(const JsonRpcNotification& notif);

    nlohmann::json on_initialize();
    nlohmann::json on_list_tools();
    nlohmann::json on_call_tool(const CallToolRequest& req);

    SessionManager& session_;
    CatalogCache& cache_;
};

} // namespace ambassador
