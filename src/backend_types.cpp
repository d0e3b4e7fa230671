#include "ambassador/backend_types.hpp"
#include "ambassador/error.hpp"

namespace ambassador {

namespace {

std::string required_string(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_string() || j.at(key).get_ref<const std::string&>().empty()) {
        throw InvalidResponseError(std::string("Missing or empty field '") + key + "'");
    }
    return j.at(key).get<std::string>();
}

} // anonymous namespace

// ---------- Registration ----------

void to_json(nlohmann::json& j, const RegistrationRequest& r) {
    j = {
        {"preshared_key", r.preshared_key},
        {"friendly_name", r.friendly_name},
        {"host_tool", r.host_tool}
    };
    if (r.machine_fingerprint) j["machine_fingerprint"] = *r.machine_fingerprint;
}

void from_json(const nlohmann::json& j, RegistrationResponse& r) {
    if (!j.is_object()) {
        throw InvalidResponseError("Registration response must be an object");
    }
    r.session_id = required_string(j, "session_id");
    r.session_token = required_string(j, "session_token");
    r.expires_at = required_string(j, "expires_at");
    r.connection_id = required_string(j, "connection_id");
    if (j.contains("profile_id") && j.at("profile_id").is_string()) {
        r.profile_id = j.at("profile_id").get<std::string>();
    }
}

// ---------- Tool catalog ----------

void from_json(const nlohmann::json& j, ToolMetadata& m) {
    if (j.contains("mcp_server") && j.at("mcp_server").is_string()) {
        m.mcp_server = j.at("mcp_server").get<std::string>();
    }
    if (j.contains("tags") && j.at("tags").is_array()) {
        m.tags = j.at("tags").get<std::vector<std::string>>();
    }
}

void from_json(const nlohmann::json& j, ToolDescriptor& t) {
    t.name = j.at("name").get<std::string>();
    t.description = j.value("description", std::string{});
    t.input_schema = j.value("input_schema", nlohmann::json::object());
    if (j.contains("metadata") && j.at("metadata").is_object()) {
        t.metadata = j.at("metadata").get<ToolMetadata>();
    }
}

void from_json(const nlohmann::json& j, ToolCatalog& c) {
    if (!j.is_object() || !j.contains("tools") || !j.at("tools").is_array()) {
        throw InvalidResponseError("Tool catalog response must contain a 'tools' array");
    }
    try {
        c.tools = j.at("tools").get<std::vector<ToolDescriptor>>();
    } catch (const nlohmann::json::exception& e) {
        throw InvalidResponseError(std::string("Malformed tool descriptor: ") + e.what());
    }
    c.api_version = j.value("api_version", std::string{});
    c.timestamp = j.value("timestamp", std::string{});
}

// ---------- Invocation ----------

void to_json(nlohmann::json& j, const ToolInvocationRequest& r) {
    j = {{"tool", r.tool}, {"arguments", r.arguments}};
}

void from_json(const nlohmann::json& j, ToolInvocationResponse& r) {
    if (!j.is_object() || !j.contains("result")) {
        throw InvalidResponseError("Tool invocation response must contain 'result'");
    }
    r.result = j.at("result");
    r.request_id = j.value("request_id", std::string{});
    r.timestamp = j.value("timestamp", std::string{});
    if (j.contains("metadata")) r.metadata = j.at("metadata");
}

} // namespace ambassador
