#include "ambassador/types.hpp"

namespace ambassador {

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"inputSchema", t.input_schema}};
    if (t.description) j["description"] = *t.description;
}

void to_json(nlohmann::json& j, const CallToolResult& r) {
    j = {{"content", r.content}, {"isError", r.is_error}};
}

void to_json(nlohmann::json& j, const ServerCapabilities& c) {
    j = nlohmann::json::object();
    if (c.tools) j["tools"] = *c.tools;
}

void to_json(nlohmann::json& j, const Implementation& i) {
    j = {{"name", i.name}, {"version", i.version}};
}

void to_json(nlohmann::json& j, const InitializeResult& r) {
    j = {
        {"protocolVersion", r.protocol_version},
        {"capabilities", r.capabilities},
        {"serverInfo", r.server_info}
    };
}

} // namespace ambassador
