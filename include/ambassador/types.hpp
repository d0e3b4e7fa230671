#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace ambassador {

// ---------- Host-facing MCP shapes (serialized only) ----------

struct ToolDefinition {
    std::string name;
    std::optional<std::string> description;
    nlohmann::json input_schema;
};

struct CallToolResult {
    nlohmann::json content = nlohmann::json::array();
    bool is_error = false;
};

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;
};

struct Implementation {
    std::string name;
    std::string version;
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
};

void to_json(nlohmann::json& j, const ToolDefinition& t);
void to_json(nlohmann::json& j, const CallToolResult& r);
void to_json(nlohmann::json& j, const ServerCapabilities& c);
void to_json(nlohmann::json& j, const Implementation& i);
void to_json(nlohmann::json& j, const InitializeResult& r);

} // namespace ambassador
