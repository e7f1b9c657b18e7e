#pragma once
#include "mcpbridge/upstream.hpp"
#include "mcpbridge/error.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace mcpbridge::test {

/// In-memory Upstream that records what reaches it.
class FakeUpstream : public Upstream {
public:
    FakeUpstream() {
        auto cache = std::make_shared<CapabilityCache>();
        cache->tools = nlohmann::json::array({{{"name", "echo"}}, {{"name", "fail"}}});
        cache->prompts = nlohmann::json::array({{{"name", "greet"}}});
        cache_ = cache;
    }

    void start() override { running = true; }
    void stop() override { running = false; }
    void restart() override { running = true; }
    bool ensure_running() override { return running; }
    bool is_running() const override { return running; }

    JsonRpcResponse call(const std::string& method, const nlohmann::json& params) override {
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++calls[method];
            last_params = params;
        }
        if (throw_timeout) throw TimeoutError("No response received for message 1 (" + method + ")");
        JsonRpcResponse resp;
        resp.id = RequestId{int64_t{1}};
        if (params.value("name", std::string()) == "fail") {
            resp.error = JsonRpcError{-32000, "Tool failed", nlohmann::json{{"reason", "requested"}}};
        } else {
            resp.result = nlohmann::json{{"echo", params}};
        }
        return resp;
    }

    std::shared_ptr<const CapabilityCache> capabilities() const override { return cache_; }
    nlohmann::json server_info() const override { return {{"name", "fake"}}; }
    std::string_view mode_name() const override { return "fake"; }

    int call_count(const std::string& method) {
        std::lock_guard<std::mutex> lock(mutex);
        return calls[method];
    }
    int total_calls() {
        std::lock_guard<std::mutex> lock(mutex);
        int n = 0;
        for (const auto& [m, c] : calls) n += c;
        return n;
    }

    std::atomic<bool> running{true};
    std::atomic<bool> throw_timeout{false};
    std::mutex mutex;
    std::map<std::string, int> calls;
    nlohmann::json last_params;

private:
    std::shared_ptr<const CapabilityCache> cache_;
};

} // namespace mcpbridge::test
