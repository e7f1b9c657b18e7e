#pragma once
#include "../bridge.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace mcpbridge {

/// Streamable-HTTP front end: maps HTTP requests onto a Bridge.
///
/// Routes: POST/GET/DELETE on the MCP path, GET /health, GET /, and,
/// when enabled, GET /api/tools and POST /api/tools/<name>.
class HttpServer {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 5000;            // 0 picks a free port
        std::string mcp_path = "/mcp";
        int worker_threads = 8;
        bool rest_api = true;
    };

    HttpServer(Bridge& bridge, Options opts);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind and serve; blocks until stop(). Throws TransportError if the
    /// address cannot be bound.
    void listen();

    /// Close open streams and stop serving. Safe from any thread.
    void stop();

    [[nodiscard]] bool is_running() const;

    /// The bound port (the chosen one when configured with 0).
    [[nodiscard]] uint16_t port() const { return bound_port_; }

private:
    void setup_routes();
    void send(httplib::Response& res, const BridgeReply& reply,
              const std::string& origin) const;
    void serve_stream(httplib::Response& res, const BridgeReply& reply,
                      const std::string& origin);

    Bridge& bridge_;
    Options opts_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<uint16_t> bound_port_{0};
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

/// One server-sent-events frame carrying `payload`.
[[nodiscard]] std::string format_sse_event(const nlohmann::json& payload);

} // namespace mcpbridge
