#include <benchmark/benchmark.h>
#include "mcpbridge/codec.hpp"
#include "mcpbridge/error.hpp"
#include "mcpbridge/json_rpc.hpp"
#include <string>

using namespace mcpbridge;

static const std::string kPing =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kToolCall =
    R"({"jsonrpc":"2.0","id":"c-42","method":"tools/call","params":{"name":"get_weather","arguments":{"location":"Warsaw","units":"celsius"}}})";

// A tools/list page as an MCP server would send it on stdout
static std::string make_tools_page(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "Tool number " + std::to_string(i) + " of the upstream server"},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"path", {{"type", "string"}}},
                    {"limit", {{"type", "integer"}}}
                }},
                {"required", {"path"}}
            }}
        });
    }
    return nlohmann::json{{"jsonrpc", "2.0"}, {"id", 7},
                          {"result", {{"tools", tools}, {"nextCursor", "100"}}}}.dump();
}

static const std::string kToolsPage = make_tools_page(100);

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kPing);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kPing.size());
}
BENCHMARK(BM_ParsePing)->MinTime(1.0);

static void BM_ParseInboundToolCall(benchmark::State& state) {
    // Inbound HTTP bodies are parsed to a document, not a typed message
    for (auto _ : state) {
        auto doc = Codec::parse_value(kToolCall);
        benchmark::DoNotOptimize(doc);
    }
    state.SetBytesProcessed(state.iterations() * kToolCall.size());
}
BENCHMARK(BM_ParseInboundToolCall)->MinTime(1.0);

static void BM_ParseToolsPage(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolsPage);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolsPage.size());
}
BENCHMARK(BM_ParseToolsPage)->MinTime(1.0);

static void BM_ParseGarbageLine(benchmark::State& state) {
    const std::string bad = "Starting server on stdio...";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const ParseError& e) {
            benchmark::DoNotOptimize(e);
        }
    }
}
BENCHMARK(BM_ParseGarbageLine)->MinTime(1.0);

static void BM_SerializeOutboundRequest(benchmark::State& state) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/call";
    req.params = nlohmann::json{{"name", "echo"}, {"arguments", {{"text", "hello"}}}};

    for (auto _ : state) {
        auto s = Codec::serialize(req);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeOutboundRequest)->MinTime(1.0);

static void BM_ResultEnvelope(benchmark::State& state) {
    auto page = Codec::parse_value(kToolsPage);
    const auto& result = page["result"];

    for (auto _ : state) {
        auto body = make_result_envelope("req-1", result).dump();
        benchmark::DoNotOptimize(body);
    }
    state.SetBytesProcessed(state.iterations() * kToolsPage.size());
}
BENCHMARK(BM_ResultEnvelope)->MinTime(1.0);
