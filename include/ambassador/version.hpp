#pragma once
#include <string_view>

namespace ambassador {

constexpr std::string_view LIBRARY_VERSION     = "0.1.0";
constexpr std::string_view PROTOCOL_VERSION    = "2024-11-05";
constexpr std::string_view JSONRPC_VERSION     = "2.0";
constexpr std::string_view SERVER_NAME         = "@mcpambassador/client";  // serverInfo.name
constexpr std::string_view PROGRAM_NAME        = "mcpambassador-client";

} // namespace ambassador
