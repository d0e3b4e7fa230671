#include <gtest/gtest.h>
#include "ambassador/types.hpp"
#include "ambassador/backend_types.hpp"
#include "ambassador/error.hpp"
#include <nlohmann/json.hpp>

using namespace ambassador;

// ---- Host-facing shapes ----

TEST(Types, ToolDefinitionUsesInputSchemaKey) {
    ToolDefinition def;
    def.name = "search";
    def.description = "Search things";
    def.input_schema = {{"type", "object"}};

    nlohmann::json j = def;
    EXPECT_EQ(j["name"], "search");
    EXPECT_EQ(j["description"], "Search things");
    EXPECT_EQ(j["inputSchema"]["type"], "object");
    EXPECT_FALSE(j.contains("input_schema"));
}

TEST(Types, ToolDefinitionWithoutDescription) {
    ToolDefinition def;
    def.name = "bare";
    def.input_schema = {{"type", "object"}};
    nlohmann::json j = def;
    EXPECT_FALSE(j.contains("description"));
}

TEST(Types, CallToolResultSerializesIsError) {
    CallToolResult r;
    r.content.push_back({{"type", "text"}, {"text", "boom"}});
    r.is_error = true;

    nlohmann::json j = r;
    EXPECT_EQ(j["content"][0]["text"], "boom");
    EXPECT_EQ(j["isError"], true);
}

TEST(Types, InitializeResultShape) {
    InitializeResult r;
    r.protocol_version = "2024-11-05";
    r.capabilities.tools = nlohmann::json::object();
    r.server_info = {"@mcpambassador/client", "0.1.0"};

    nlohmann::json j = r;
    EXPECT_EQ(j["protocolVersion"], "2024-11-05");
    EXPECT_TRUE(j["capabilities"]["tools"].is_object());
    EXPECT_EQ(j["serverInfo"]["name"], "@mcpambassador/client");
    EXPECT_EQ(j["serverInfo"]["version"], "0.1.0");
}

// ---- Backend bodies ----

TEST(BackendTypes, RegistrationRequestBody) {
    RegistrationRequest req{"psk", "laptop", "vscode", std::string("laptop-linux-x86_64")};
    nlohmann::json j = req;
    EXPECT_EQ(j["preshared_key"], "psk");
    EXPECT_EQ(j["friendly_name"], "laptop");
    EXPECT_EQ(j["host_tool"], "vscode");
    EXPECT_EQ(j["machine_fingerprint"], "laptop-linux-x86_64");
}

TEST(BackendTypes, RegistrationResponseRequiresSessionFields) {
    nlohmann::json full = {{"session_id", "s"}, {"session_token", "t"}, {"expires_at", "e"},
                           {"profile_id", "p"}, {"connection_id", "c"}};
    auto r = full.get<RegistrationResponse>();
    EXPECT_EQ(r.session_token, "t");
    EXPECT_EQ(r.profile_id, "p");

    for (const char* key : {"session_id", "session_token", "expires_at", "connection_id"}) {
        auto partial = full;
        partial.erase(key);
        EXPECT_THROW((void)partial.get<RegistrationResponse>(), InvalidResponseError) << key;
    }

    auto no_profile = full;
    no_profile.erase("profile_id");
    EXPECT_NO_THROW((void)no_profile.get<RegistrationResponse>());
}

TEST(BackendTypes, CatalogParsesMetadata) {
    auto j = nlohmann::json::parse(R"({
        "tools": [
            {"name": "a", "description": "A", "input_schema": {"type": "object"},
             "metadata": {"mcp_server": "github", "tags": ["vcs"]}},
            {"name": "b"}
        ],
        "api_version": "v1",
        "timestamp": "2026-01-01T00:00:00Z"
    })");
    auto catalog = j.get<ToolCatalog>();
    ASSERT_EQ(catalog.tools.size(), 2u);
    ASSERT_TRUE(catalog.tools[0].metadata.has_value());
    EXPECT_EQ(catalog.tools[0].metadata->mcp_server, std::optional<std::string>("github"));
    EXPECT_EQ(catalog.tools[0].metadata->tags, std::vector<std::string>{"vcs"});
    EXPECT_EQ(catalog.tools[1].description, "");
    EXPECT_TRUE(catalog.tools[1].input_schema.is_object());
    EXPECT_EQ(catalog.api_version, "v1");
}

TEST(BackendTypes, CatalogWithoutToolsArrayRejected) {
    EXPECT_THROW((void)nlohmann::json({{"tools", "nope"}}).get<ToolCatalog>(), InvalidResponseError);
    EXPECT_THROW((void)nlohmann::json::array().get<ToolCatalog>(), InvalidResponseError);
    EXPECT_THROW((void)nlohmann::json({{"tools", {{{"description", "no name"}}}}}).get<ToolCatalog>(),
                 InvalidResponseError);
}

TEST(BackendTypes, InvocationBodies) {
    nlohmann::json req = ToolInvocationRequest{"search", {{"q", "x"}}};
    EXPECT_EQ(req["tool"], "search");
    EXPECT_EQ(req["arguments"]["q"], "x");

    auto resp = nlohmann::json::parse(R"({"result":[1],"request_id":"r","timestamp":"t"})")
                    .get<ToolInvocationResponse>();
    EXPECT_EQ(resp.request_id, "r");
    EXPECT_TRUE(resp.result.is_array());
    EXPECT_FALSE(resp.metadata.has_value());

    EXPECT_THROW((void)nlohmann::json({{"request_id", "r"}}).get<ToolInvocationResponse>(),
                 InvalidResponseError);
}
