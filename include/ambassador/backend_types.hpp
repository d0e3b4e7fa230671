#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace ambassador {

// Request and response bodies of the backend's /v1 REST API.

struct RegistrationRequest {
    std::string preshared_key;
    std::string friendly_name;
    std::string host_tool;
    std::optional<std::string> machine_fingerprint;
};

struct RegistrationResponse {
    std::string session_id;
    std::string session_token;
    std::string expires_at;
    std::string profile_id;
    std::string connection_id;
};

struct ToolMetadata {
    std::optional<std::string> mcp_server;
    std::vector<std::string> tags;

    bool operator==(const ToolMetadata& o) const {
        return mcp_server == o.mcp_server && tags == o.tags;
    }
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();
    std::optional<ToolMetadata> metadata;

    bool operator==(const ToolDescriptor& o) const {
        return name == o.name && description == o.description
               && input_schema == o.input_schema && metadata == o.metadata;
    }
};

struct ToolCatalog {
    std::vector<ToolDescriptor> tools;
    std::string api_version;
    std::string timestamp;
};

struct ToolInvocationRequest {
    std::string tool;
    nlohmann::json arguments = nlohmann::json::object();
};

struct ToolInvocationResponse {
    nlohmann::json result;
    std::string request_id;
    std::string timestamp;
    std::optional<nlohmann::json> metadata;
};

void to_json(nlohmann::json& j, const RegistrationRequest& r);
void from_json(const nlohmann::json& j, RegistrationResponse& r);

void from_json(const nlohmann::json& j, ToolMetadata& m);

void from_json(const nlohmann::json& j, ToolDescriptor& t);

void from_json(const nlohmann::json& j, ToolCatalog& c);

void to_json(nlohmann::json& j, const ToolInvocationRequest& r);
void from_json(const nlohmann::json& j, ToolInvocationResponse& r);

} // namespace ambassador
