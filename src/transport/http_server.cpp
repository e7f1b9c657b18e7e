#include "mcpbridge/transport/http_server.hpp"
#include "mcpbridge/error.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace mcpbridge {

namespace {

std::optional<std::string> header(const httplib::Request& req, const char* name) {
    if (!req.has_header(name)) return std::nullopt;
    return req.get_header_value(name);
}

void set_common_headers(httplib::Response& res, const std::string& session_id,
                        const std::string& origin) {
    if (!session_id.empty()) res.set_header("Mcp-Session-Id", session_id);
    res.set_header("Access-Control-Allow-Origin", origin.empty() ? "*" : origin);
    res.set_header("Access-Control-Allow-Headers", "Content-Type, Mcp-Session-Id");
}

} // anonymous namespace

std::string format_sse_event(const nlohmann::json& payload) {
    return "data: " + payload.dump() + "\n\n";
}

HttpServer::HttpServer(Bridge& bridge, Options opts)
    : bridge_(bridge)
    , opts_(std::move(opts))
    , server_(std::make_unique<httplib::Server>()) {
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::send(httplib::Response& res, const BridgeReply& reply,
                      const std::string& origin) const {
    res.status = reply.status;
    set_common_headers(res, reply.session_id, origin);
    if (reply.body) {
        res.set_content(reply.body->dump(), "application/json");
    }
}

void HttpServer::serve_stream(httplib::Response& res, const BridgeReply& reply,
                              const std::string& origin) {
    res.status = 200;
    set_common_headers(res, reply.session_id, origin);
    res.set_header("Cache-Control", "no-cache");

    auto queue = reply.stream;
    auto session_id = reply.session_id;
    auto keepalive = bridge_.keepalive_interval();

    res.set_chunked_content_provider("text/event-stream",
        [queue, keepalive](size_t /*offset*/, httplib::DataSink& sink) -> bool {
            auto item = queue->wait_next(keepalive);
            if (item.kind == DeliveryQueue::Item::Kind::Closed) {
                sink.done();
                return true;
            }
            std::string event = format_sse_event(item.payload);
            // A failed write means the peer is gone
            return sink.write(event.data(), event.size());
        },
        [this, queue, session_id](bool /*success*/) {
            bridge_.close_stream(session_id, queue);
        });
}

void HttpServer::setup_routes() {
    const std::string path = opts_.mcp_path;

    server_->Post(path, [this](const httplib::Request& req, httplib::Response& res) {
        InboundCall call;
        call.body = req.body;
        call.session_id = header(req, "Mcp-Session-Id");
        call.origin = header(req, "Origin");
        call.accepts_stream = req.get_header_value("Accept").find("text/event-stream") != std::string::npos;

        auto reply = bridge_.handle(call);
        const auto origin = call.origin.value_or(std::string());
        if (reply.stream) {
            serve_stream(res, reply, origin);
        } else {
            send(res, reply, origin);
        }
    });

    server_->Get(path, [this](const httplib::Request& req, httplib::Response& res) {
        auto origin = header(req, "Origin");
        auto reply = bridge_.open_stream(header(req, "Mcp-Session-Id"), origin);
        if (reply.stream) {
            serve_stream(res, reply, origin.value_or(std::string()));
        } else {
            send(res, reply, origin.value_or(std::string()));
        }
    });

    server_->Delete(path, [this](const httplib::Request& req, httplib::Response& res) {
        auto origin = header(req, "Origin");
        send(res, bridge_.end_session(header(req, "Mcp-Session-Id"), origin),
             origin.value_or(std::string()));
    });

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        send(res, bridge_.health(), std::string());
    });

    server_->Get("/", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json index = {
            {"name", std::string(BRIDGE_NAME)},
            {"version", std::string(BRIDGE_VERSION)},
            {"mode", std::string(bridge_.upstream().mode_name())},
            {"endpoints", {
                {"mcp", opts_.mcp_path},
                {"health", "/health"}
            }}
        };
        if (opts_.rest_api) {
            index["endpoints"]["tools"] = "/api/tools";
            index["endpoints"]["call_tool"] = "/api/tools/<name>";
        }
        res.set_content(index.dump(), "application/json");
    });

    if (!opts_.rest_api) return;

    server_->Get("/api/tools", [this](const httplib::Request& req, httplib::Response& res) {
        auto origin = header(req, "Origin");
        send(res, bridge_.rest_list_tools(origin), origin.value_or(std::string()));
    });

    server_->Post(R"(/api/tools/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        auto origin = header(req, "Origin");
        send(res, bridge_.rest_call_tool(req.matches[1].str(), req.body, origin),
             origin.value_or(std::string()));
    });
}

void HttpServer::listen() {
    if (running_.exchange(true)) return;

    const int workers = opts_.worker_threads > 0 ? opts_.worker_threads : 1;
    // httplib::Server owns the queue and deletes it when listen() returns
    server_->new_task_queue = [workers] { return new httplib::ThreadPool(static_cast<size_t>(workers)); };
    setup_routes();

    int port = opts_.port;
    if (port == 0) {
        port = server_->bind_to_any_port(opts_.host);
        if (port < 0) {
            running_ = false;
            throw TransportError("Failed to bind HTTP server on " + opts_.host);
        }
    } else if (!server_->bind_to_port(opts_.host, port)) {
        running_ = false;
        throw TransportError("Failed to start HTTP server on " + opts_.host + ":" + std::to_string(port));
    }
    bound_port_ = static_cast<uint16_t>(port);
    if (stop_requested_) {
        running_ = false;
        return;
    }

    spdlog::info("Listening on http://{}:{}{}", opts_.host, port, opts_.mcp_path);
    if (!server_->listen_after_bind()) {
        running_ = false;
        throw TransportError("HTTP server on " + opts_.host + ":" + std::to_string(port)
                             + " stopped unexpectedly");
    }
    running_ = false;
}

void HttpServer::stop() {
    stop_requested_ = true;
    // Streams block their workers on the queues; release them first
    bridge_.sessions().clear();
    if (server_->is_running()) server_->stop();
}

bool HttpServer::is_running() const {
    return running_ && server_->is_running();
}

} // namespace mcpbridge
