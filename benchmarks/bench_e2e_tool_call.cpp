#include <benchmark/benchmark.h>
#include "mcpbridge/protocol_adapter.hpp"
#include "mcpbridge/upstream.hpp"
#include <chrono>

using namespace mcpbridge;

static Upstream::Options fake_server() {
    Upstream::Options opts;
    opts.process.command = {MCPBRIDGE_FAKE_SERVER};
    opts.process.startup_probe = std::chrono::milliseconds(50);
    opts.request_timeout = std::chrono::milliseconds(5000);
    return opts;
}

static const nlohmann::json kEchoCall = {
    {"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"},
    {"params", {{"name", "echo"}, {"arguments", {{"text", "hello benchmark"}}}}}};

static void BM_ToolCallPersistent(benchmark::State& state) {
    PersistentUpstream upstream(fake_server());
    upstream.start();
    ProtocolAdapter adapter(upstream, nullptr);

    for (auto _ : state) {
        auto resp = adapter.handle(kEchoCall);
        benchmark::DoNotOptimize(resp);
    }
    upstream.stop();
    state.SetLabel("persistent subprocess tools/call");
}
BENCHMARK(BM_ToolCallPersistent)->MinTime(2.0)->UseRealTime();

static void BM_ToolCallSpawnPerCall(benchmark::State& state) {
    SpawnPerCallUpstream upstream(fake_server());
    upstream.start();
    ProtocolAdapter adapter(upstream, nullptr);

    for (auto _ : state) {
        auto resp = adapter.handle(kEchoCall);
        benchmark::DoNotOptimize(resp);
    }
    state.SetLabel("spawn + handshake + tools/call");
}
BENCHMARK(BM_ToolCallSpawnPerCall)->MinTime(2.0)->UseRealTime();

static void BM_CapabilityLoad(benchmark::State& state) {
    for (auto _ : state) {
        PersistentUpstream upstream(fake_server());
        upstream.start();
        benchmark::DoNotOptimize(upstream.capabilities());
        upstream.stop();
    }
    state.SetLabel("spawn + handshake + paginated lists");
}
BENCHMARK(BM_CapabilityLoad)->MinTime(2.0)->UseRealTime();
