#include <benchmark/benchmark.h>
#include "mcpbridge/protocol_adapter.hpp"
#include "mcpbridge/session.hpp"
#include "mcpbridge/upstream.hpp"
#include <memory>
#include <string>

using namespace mcpbridge;

// Upstream that answers immediately, so only the adapter is measured
class InstantUpstream : public Upstream {
public:
    explicit InstantUpstream(int n_tools) {
        auto cache = std::make_shared<CapabilityCache>();
        for (int i = 0; i < n_tools; ++i) {
            cache->tools.push_back({{"name", "tool_" + std::to_string(i)},
                                    {"inputSchema", {{"type", "object"}}}});
        }
        cache_ = cache;
    }

    void start() override {}
    void stop() override {}
    void restart() override {}
    bool ensure_running() override { return true; }
    bool is_running() const override { return true; }

    JsonRpcResponse call(const std::string&, const nlohmann::json& params) override {
        JsonRpcResponse resp;
        resp.id = RequestId{int64_t{1}};
        resp.result = nlohmann::json{{"content", nlohmann::json::array({{{"type", "text"},
                                                                         {"text", params.dump()}}})}};
        return resp;
    }

    std::shared_ptr<const CapabilityCache> capabilities() const override { return cache_; }
    nlohmann::json server_info() const override { return nlohmann::json::object(); }
    std::string_view mode_name() const override { return "instant"; }

private:
    std::shared_ptr<const CapabilityCache> cache_;
};

static void BM_AdapterPing(benchmark::State& state) {
    InstantUpstream upstream(1);
    ProtocolAdapter adapter(upstream, nullptr);
    const nlohmann::json req = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}};

    for (auto _ : state) {
        auto resp = adapter.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_AdapterPing)->MinTime(1.0);

static void BM_AdapterCachedToolsList(benchmark::State& state) {
    InstantUpstream upstream(static_cast<int>(state.range(0)));
    ProtocolAdapter adapter(upstream, nullptr);
    const nlohmann::json req = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}};

    for (auto _ : state) {
        auto resp = adapter.handle(req);
        benchmark::DoNotOptimize(resp);
    }
    state.SetLabel(std::to_string(state.range(0)) + " tools");
}
BENCHMARK(BM_AdapterCachedToolsList)->Arg(10)->Arg(100)->Arg(1000)->MinTime(1.0);

static void BM_AdapterForwardToolCall(benchmark::State& state) {
    InstantUpstream upstream(1);
    SessionManager sessions;
    ProtocolAdapter adapter(upstream, &sessions);
    auto sid = sessions.ensure(std::nullopt);
    const nlohmann::json req = {{"jsonrpc", "2.0"}, {"id", "x"}, {"method", "tools/call"},
                                {"params", {{"name", "tool_0"}, {"arguments", {{"a", 1}}}}}};

    for (auto _ : state) {
        auto resp = adapter.handle(req, sid);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_AdapterForwardToolCall)->MinTime(1.0);

static void BM_AdapterUnknownMethod(benchmark::State& state) {
    InstantUpstream upstream(1);
    ProtocolAdapter adapter(upstream, nullptr);
    const nlohmann::json req = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "sampling/createMessage"}};

    for (auto _ : state) {
        auto resp = adapter.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_AdapterUnknownMethod)->MinTime(1.0);

static void BM_AdapterInvalidEnvelope(benchmark::State& state) {
    InstantUpstream upstream(1);
    ProtocolAdapter adapter(upstream, nullptr);
    const nlohmann::json req = {{"jsonrpc", "1.0"}, {"id", 1}, {"method", "ping"}};

    for (auto _ : state) {
        auto resp = adapter.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_AdapterInvalidEnvelope)->MinTime(1.0);
