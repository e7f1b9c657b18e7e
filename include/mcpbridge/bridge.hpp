#pragma once
#include "protocol_adapter.hpp"
#include "session.hpp"
#include "upstream.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcpbridge {

/// One inbound POST as seen by the bridge, stripped of HTTP details.
struct InboundCall {
    std::string body;
    std::optional<std::string> session_id;
    std::optional<std::string> origin;
    bool accepts_stream = false;
};

/// What to send back. When `stream` is set the connection becomes that
/// session's push stream and `body` is unused.
struct BridgeReply {
    int status = 200;
    std::optional<nlohmann::json> body;
    std::string session_id;
    std::shared_ptr<DeliveryQueue> stream;
};

/// Absent or empty origins pass. Otherwise the origin must equal one of
/// the prefixes or continue it with ':' or '/'.
[[nodiscard]] bool is_origin_allowed(const std::optional<std::string>& origin,
                                     const std::vector<std::string>& allowed_prefixes);

/// Owns all shared state of a running bridge: the Upstream, the session
/// table and the protocol adapter, plus a thread sweeping idle sessions.
class Bridge {
public:
    struct Options {
        UpstreamMode mode = UpstreamMode::Persistent;
        Upstream::Options upstream;
        std::vector<std::string> allowed_origins = {
            "http://localhost", "https://localhost",
            "http://127.0.0.1", "https://127.0.0.1"
        };
        std::chrono::milliseconds keepalive_interval{30000};
        std::chrono::milliseconds session_idle_timeout{30 * 60 * 1000};
    };

    explicit Bridge(Options opts);
    /// Use an already-built Upstream (mode in `opts` is ignored).
    Bridge(Options opts, std::unique_ptr<Upstream> upstream);
    ~Bridge();

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    /// Start the Upstream and the session sweeper. Throws StartupError.
    void start();
    void stop();

    /// POST to the MCP endpoint.
    [[nodiscard]] BridgeReply handle(const InboundCall& call);

    /// GET on the MCP endpoint: register a push stream for the session.
    [[nodiscard]] BridgeReply open_stream(const std::optional<std::string>& session_id,
                                          const std::optional<std::string>& origin);

    /// The stream's connection went away.
    void close_stream(const std::string& session_id, const std::shared_ptr<DeliveryQueue>& queue);

    /// DELETE on the MCP endpoint.
    [[nodiscard]] BridgeReply end_session(const std::optional<std::string>& session_id,
                                          const std::optional<std::string>& origin);

    [[nodiscard]] BridgeReply health() const;

    /// Plain REST surface over the cached tools.
    [[nodiscard]] BridgeReply rest_list_tools(const std::optional<std::string>& origin) const;
    [[nodiscard]] BridgeReply rest_call_tool(const std::string& name, const std::string& body,
                                             const std::optional<std::string>& origin);

    [[nodiscard]] std::chrono::milliseconds keepalive_interval() const { return opts_.keepalive_interval; }

    SessionManager& sessions() { return sessions_; }
    Upstream& upstream() { return *upstream_; }
    const Options& options() const { return opts_; }

private:
    [[nodiscard]] BridgeReply forbidden(const std::optional<std::string>& session_id) const;
    void sweep_loop();

    Options opts_;
    std::unique_ptr<Upstream> upstream_;
    SessionManager sessions_;
    ProtocolAdapter adapter_;

    std::atomic<bool> running_{false};
    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    std::thread sweeper_;
};

} // namespace mcpbridge
