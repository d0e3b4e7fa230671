#include <gtest/gtest.h>
#include "ambassador/json_rpc.hpp"
#include "ambassador/error.hpp"
#include <nlohmann/json.hpp>

using namespace ambassador;

TEST(JsonRpcResponse, WithResult) {
    auto resp = make_result(RequestId{int64_t{42}}, {{"ok", true}});

    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 42);
    EXPECT_EQ(j["result"]["ok"], true);
    EXPECT_FALSE(j.contains("error"));
}

TEST(JsonRpcResponse, EmptyResultIsObject) {
    JsonRpcResponse resp;
    resp.id = RequestId{std::string{"p"}};

    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["id"], "p");
    EXPECT_TRUE(j["result"].is_object());
    EXPECT_TRUE(j["result"].empty());
}

TEST(JsonRpcResponse, WithError) {
    auto resp = make_error(RequestId{int64_t{1}}, error::MethodNotFound, "Method not found");

    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["error"]["code"], -32601);
    EXPECT_EQ(j["error"]["message"], "Method not found");
    EXPECT_FALSE(j["error"].contains("data"));
    EXPECT_FALSE(j.contains("result"));
}

TEST(JsonRpcResponse, ErrorWithoutId) {
    auto resp = make_error(std::nullopt, error::ParseError, "Parse error");

    nlohmann::json j;
    to_json(j, resp);
    ASSERT_TRUE(j.contains("id"));
    EXPECT_TRUE(j["id"].is_null());
}

TEST(JsonRpcResponse, FromJsonNullId) {
    auto j = nlohmann::json::parse(R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"x"}})");
    JsonRpcResponse resp;
    from_json(j, resp);
    EXPECT_FALSE(resp.id.has_value());
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, -32700);
}

TEST(RequestId, IntId) {
    RequestId id = int64_t{123};
    nlohmann::json j;
    to_json(j, id);
    EXPECT_EQ(j, 123);
}

TEST(RequestId, StringId) {
    RequestId id = std::string{"hello"};
    nlohmann::json j;
    to_json(j, id);
    EXPECT_EQ(j, "hello");
}

TEST(RequestId, RejectsOtherTypes) {
    RequestId id;
    EXPECT_THROW(from_json(nlohmann::json(1.5), id), std::invalid_argument);
    EXPECT_THROW(from_json(nlohmann::json::object(), id), std::invalid_argument);
}
