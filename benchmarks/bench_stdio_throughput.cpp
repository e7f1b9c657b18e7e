#include <benchmark/benchmark.h>
#include "mcpbridge/codec.hpp"
#include "mcpbridge/correlator.hpp"
#include "mcpbridge/line_reader.hpp"
#include <nlohmann/json.hpp>
#include <unistd.h>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace mcpbridge;

// Correlator on one end of a pipe pair, an in-process responder on the other
struct PipePair {
    int to_server[2];
    int to_client[2];
    std::unique_ptr<LineReader> responder;
    std::unique_ptr<Correlator> correlator;

    PipePair() {
        if (::pipe(to_server) < 0 || ::pipe(to_client) < 0) {
            throw std::runtime_error("pipe() failed");
        }
        responder = std::make_unique<LineReader>(to_server[0]);
        responder->start([this](std::string_view line) {
            auto req = nlohmann::json::parse(line);
            std::string out = nlohmann::json{{"jsonrpc", "2.0"}, {"id", req["id"]},
                                             {"result", nlohmann::json::object()}}.dump();
            out += '\n';
            ssize_t n = ::write(to_client[1], out.data(), out.size());
            benchmark::DoNotOptimize(n);
        });
        correlator = std::make_unique<Correlator>(to_client[0], to_server[1]);
        correlator->start();
    }

    ~PipePair() {
        correlator->shutdown();
        responder->stop();
        for (int fd : {to_server[0], to_server[1], to_client[0], to_client[1]}) ::close(fd);
    }
};

static void BM_CorrelatorRoundTrip(benchmark::State& state) {
    PipePair pipes;
    for (auto _ : state) {
        auto resp = pipes.correlator->call("ping", std::nullopt, std::chrono::milliseconds(5000));
        benchmark::DoNotOptimize(resp);
    }
    state.SetLabel("sequential ping over pipes");
}
BENCHMARK(BM_CorrelatorRoundTrip)->MinTime(1.0)->UseRealTime();

static void BM_CorrelatorPipelined(benchmark::State& state) {
    const int depth = static_cast<int>(state.range(0));
    PipePair pipes;

    for (auto _ : state) {
        std::vector<RequestId> ids;
        ids.reserve(depth);
        for (int i = 0; i < depth; ++i) {
            ids.push_back(pipes.correlator->send("ping"));
        }
        for (const auto& id : ids) {
            auto resp = pipes.correlator->await_response(id, std::chrono::milliseconds(5000));
            benchmark::DoNotOptimize(resp);
        }
    }
    state.SetItemsProcessed(state.iterations() * depth);
}
BENCHMARK(BM_CorrelatorPipelined)->Arg(10)->Arg(100)->MinTime(1.0)->UseRealTime();

static void BM_CorrelatorConcurrentCallers(benchmark::State& state) {
    const int callers = static_cast<int>(state.range(0));
    PipePair pipes;

    for (auto _ : state) {
        std::vector<std::future<JsonRpcResponse>> futures;
        for (int i = 0; i < callers; ++i) {
            futures.push_back(std::async(std::launch::async, [&pipes] {
                return pipes.correlator->call("ping", std::nullopt, std::chrono::milliseconds(5000));
            }));
        }
        for (auto& f : futures) benchmark::DoNotOptimize(f.get());
    }
    state.SetItemsProcessed(state.iterations() * callers);
}
BENCHMARK(BM_CorrelatorConcurrentCallers)->Arg(4)->Arg(16)->MinTime(1.0)->UseRealTime();
