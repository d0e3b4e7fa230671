#include <benchmark/benchmark.h>
#include "ambassador/backend_types.hpp"
#include "ambassador/codec.hpp"
#include "ambassador/json_rpc.hpp"
#include <string>

using namespace ambassador;

static const std::string kPing =
    R"({"jsonrpc":"2.0","id":1,"method":"ping"})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"github_search","arguments":{"query":"is:open label:bug","limit":20}}})";

// Backend GET /v1/tools body with N tools
static std::string make_catalog_body(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "A tool for doing something useful, number " + std::to_string(i)},
            {"input_schema", {
                {"type", "object"},
                {"properties", {
                    {"param1", {{"type", "string"}, {"description", "First parameter"}}},
                    {"param2", {{"type", "integer"}, {"description", "Second parameter"}}}
                }},
                {"required", {"param1"}}
            }},
            {"metadata", {{"mcp_server", "server_" + std::to_string(i % 5)}, {"tags", {"a", "b"}}}}
        });
    }
    nlohmann::json body = {{"tools", tools}, {"api_version", "v1"}, {"timestamp", "2026-01-01T00:00:00Z"}};
    return body.dump();
}

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kPing);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kPing.size());
}
BENCHMARK(BM_ParsePing);

static void BM_ParseToolCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCallRequest);

static void BM_ParseCatalog(benchmark::State& state) {
    const std::string body = make_catalog_body(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto catalog = Codec::parse_json(body).get<ToolCatalog>();
        benchmark::DoNotOptimize(catalog);
    }
    state.SetBytesProcessed(state.iterations() * body.size());
}
BENCHMARK(BM_ParseCatalog)->Arg(10)->Arg(100)->Arg(1000);

static void BM_SerializeResponse(benchmark::State& state) {
    auto resp = make_result(RequestId{int64_t{7}},
                            {{"content", {{{"type", "text"}, {"text", std::string(512, 'x')}}}},
                             {"isError", false}});
    for (auto _ : state) {
        auto out = Codec::serialize(resp);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_SerializeResponse);
