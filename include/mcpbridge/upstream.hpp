#pragma once
#include "json_rpc.hpp"
#include "process_supervisor.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace mcpbridge {

namespace detail { struct UpstreamConnection; }

/// Descriptor lists reported by the subprocess during the handshake.
/// Never mutated after load; a restart builds a fresh one.
struct CapabilityCache {
    nlohmann::json tools = nlohmann::json::array();
    nlohmann::json prompts = nlohmann::json::array();
    nlohmann::json resources = nlohmann::json::array();
};

enum class UpstreamMode {
    Persistent,     // one long-lived process shared by every caller
    SpawnPerCall    // a fresh process for each pass-through call
};

/// The wrapped subprocess plus the policy deciding when it lives.
/// Callers see the same interface whichever policy is active.
class Upstream {
public:
    struct Options {
        ProcessSupervisor::Options process;
        std::chrono::milliseconds request_timeout{30000};
        std::chrono::milliseconds handshake_timeout{30000};
        // Per-tool overrides of request_timeout for tools/call
        std::map<std::string, std::chrono::milliseconds> tool_timeouts;
        bool auto_restart = false;
        int max_restarts = 3;
    };

    virtual ~Upstream() = default;

    /// Spawn, run the initialize handshake and load the capability cache.
    /// Throws StartupError.
    virtual void start() = 0;
    virtual void stop() = 0;

    /// Tear down and start from scratch: new process, id counter reset,
    /// capability cache reloaded. Throws StartupError.
    virtual void restart() = 0;

    /// True if calls can be served now, applying the restart policy first.
    [[nodiscard]] virtual bool ensure_running() = 0;
    [[nodiscard]] virtual bool is_running() const = 0;

    /// Forward one request and wait for its response. Throws TimeoutError,
    /// ProcessTerminatedError or StartupError.
    [[nodiscard]] virtual JsonRpcResponse call(const std::string& method,
                                               const nlohmann::json& params) = 0;

    [[nodiscard]] virtual std::shared_ptr<const CapabilityCache> capabilities() const = 0;

    /// The subprocess's initialize result.
    [[nodiscard]] virtual nlohmann::json server_info() const = 0;

    [[nodiscard]] virtual std::string_view mode_name() const = 0;
};

[[nodiscard]] std::unique_ptr<Upstream> make_upstream(UpstreamMode mode, Upstream::Options opts);

[[nodiscard]] std::string_view to_string(UpstreamMode mode);

/// Parses "persistent" or "spawn-per-call". Throws ConfigError.
[[nodiscard]] UpstreamMode upstream_mode_from_string(std::string_view name);

class PersistentUpstream : public Upstream {
public:
    explicit PersistentUpstream(Options opts);
    ~PersistentUpstream() override;

    void start() override;
    void stop() override;
    void restart() override;
    [[nodiscard]] bool ensure_running() override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] JsonRpcResponse call(const std::string& method,
                                       const nlohmann::json& params) override;
    [[nodiscard]] std::shared_ptr<const CapabilityCache> capabilities() const override;
    [[nodiscard]] nlohmann::json server_info() const override;
    [[nodiscard]] std::string_view mode_name() const override { return "persistent"; }

    /// Number of restarts performed by the automatic policy.
    [[nodiscard]] int restart_count() const;

private:
    void open_locked();
    void close_locked();
    std::shared_ptr<detail::UpstreamConnection> current() const;

    Options opts_;
    std::mutex lifecycle_mutex_;  // serializes start/stop/restart

    mutable std::mutex state_mutex_;
    std::shared_ptr<detail::UpstreamConnection> conn_;
    std::shared_ptr<const CapabilityCache> cache_;
    nlohmann::json server_info_;
    int restarts_{0};
};

class SpawnPerCallUpstream : public Upstream {
public:
    explicit SpawnPerCallUpstream(Options opts);

    void start() override;
    void stop() override;
    void restart() override;
    [[nodiscard]] bool ensure_running() override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] JsonRpcResponse call(const std::string& method,
                                       const nlohmann::json& params) override;
    [[nodiscard]] std::shared_ptr<const CapabilityCache> capabilities() const override;
    [[nodiscard]] nlohmann::json server_info() const override;
    [[nodiscard]] std::string_view mode_name() const override { return "spawn-per-call"; }

private:
    Options opts_;
    mutable std::mutex state_mutex_;
    bool started_{false};
    std::shared_ptr<const CapabilityCache> cache_;
    nlohmann::json server_info_;
};

} // namespace mcpbridge
