#pragma once
#include "json_rpc.hpp"
#include <optional>
#include <string>
#include <variant>

namespace ambassador {

// Closed set of host methods the relay understands. Anything outside it is
// rejected at the parse boundary, so dispatch over HostRequest is exhaustive.

namespace method {
    constexpr const char* Initialize   = "initialize";
    constexpr const char* Ping         = "ping";
    constexpr const char* ToolsList    = "tools/list";
    constexpr const char* ToolsCall    = "tools/call";
    constexpr const char* Initialized  = "notifications/initialized";
} // namespace method

struct InitializeRequest {};
struct PingRequest {};
struct ListToolsRequest {};

struct CallToolRequest {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

struct InitializedNotification {};

/// Any other notification: accepted and ignored.
struct IgnoredNotification {
    std::string method;
};

using HostRequest = std::variant<InitializeRequest, PingRequest, ListToolsRequest,
                                 CallToolRequest>;
// tools/list and tools/call sent without an id still run; only the answer
// is suppressed.
using HostNotification = std::variant<InitializedNotification, ListToolsRequest,
                                      CallToolRequest, IgnoredNotification>;

/// Throws ProtocolError with MethodNotFound or InvalidParams.
[[nodiscard]] HostRequest parse_host_request(const std::string& method,
                                             const std::optional<nlohmann::json>& params);

/// Throws ProtocolError with InvalidParams for a malformed tools/call.
[[nodiscard]] HostNotification parse_host_notification(const std::string& method,
                                                       const std::optional<nlohmann::json>& params);

} // namespace ambassador
