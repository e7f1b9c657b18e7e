#include "mcpbridge/bridge.hpp"
#include "mcpbridge/codec.hpp"
#include "mcpbridge/error.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace mcpbridge {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

BridgeReply json_reply(int status, nlohmann::json body, std::string session_id = {}) {
    BridgeReply reply;
    reply.status = status;
    reply.body = std::move(body);
    reply.session_id = std::move(session_id);
    return reply;
}

} // anonymous namespace

bool is_origin_allowed(const std::optional<std::string>& origin,
                       const std::vector<std::string>& allowed_prefixes) {
    if (!origin || origin->empty()) return true;
    for (const auto& prefix : allowed_prefixes) {
        if (origin->compare(0, prefix.size(), prefix) != 0) continue;
        // "http://localhost.evil.example" must not pass as localhost
        if (origin->size() == prefix.size()) return true;
        char next = (*origin)[prefix.size()];
        if (next == ':' || next == '/') return true;
    }
    return false;
}

Bridge::Bridge(Options opts)
    : Bridge(opts, make_upstream(opts.mode, opts.upstream)) {
}

Bridge::Bridge(Options opts, std::unique_ptr<Upstream> upstream)
    : opts_(std::move(opts))
    , upstream_(std::move(upstream))
    , adapter_(*upstream_, &sessions_) {
}

Bridge::~Bridge() {
    stop();
}

void Bridge::start() {
    if (running_) return;
    spdlog::info("Starting MCP server in {} mode", upstream_->mode_name());
    upstream_->start();
    running_ = true;
    sweeper_ = std::thread([this] { sweep_loop(); });
}

void Bridge::stop() {
    if (running_.exchange(false)) {
        {
            std::lock_guard<std::mutex> lock(sweep_mutex_);
        }
        sweep_cv_.notify_all();
        if (sweeper_.joinable()) sweeper_.join();
    }
    sessions_.clear();
    upstream_->stop();
}

void Bridge::sweep_loop() {
    auto period = std::clamp(opts_.session_idle_timeout / 4,
                             std::chrono::milliseconds(10), std::chrono::milliseconds(60000));
    std::unique_lock<std::mutex> lock(sweep_mutex_);
    while (running_) {
        sweep_cv_.wait_for(lock, period, [this] { return !running_; });
        if (!running_) break;
        auto removed = sessions_.expire_idle(opts_.session_idle_timeout);
        if (removed > 0) spdlog::info("Expired {} idle session(s)", removed);
    }
}

BridgeReply Bridge::forbidden(const std::optional<std::string>& session_id) const {
    spdlog::warn("Rejected request with disallowed Origin");
    return json_reply(403,
                      make_error_envelope(nullptr, error::InternalError, "Invalid Origin header"),
                      session_id.value_or(std::string()));
}

BridgeReply Bridge::handle(const InboundCall& call) {
    if (!is_origin_allowed(call.origin, opts_.allowed_origins)) {
        return forbidden(call.session_id);
    }

    std::string sid = sessions_.ensure(call.session_id);

    if (is_blank(call.body)) {
        return json_reply(400, make_error_envelope(nullptr, error::InvalidRequest, "Invalid Request",
                                                   nlohmann::json("Empty request body")), sid);
    }

    nlohmann::json envelope;
    try {
        envelope = Codec::parse_value(call.body);
    } catch (const ParseError& e) {
        return json_reply(400, make_error_envelope(nullptr, error::ParseError, "Parse error",
                                                   nlohmann::json(e.what())), sid);
    }
    if (envelope.is_null()) {
        return json_reply(400, make_error_envelope(nullptr, error::InvalidRequest, "Invalid Request",
                                                   nlohmann::json("Empty request body")), sid);
    }

    auto response = adapter_.handle(envelope, sid);
    if (!response) {
        BridgeReply ack;
        ack.status = 202;
        ack.session_id = sid;
        return ack;
    }

    if (call.accepts_stream) {
        BridgeReply reply;
        reply.session_id = sid;
        reply.stream = sessions_.open_stream(sid);
        reply.stream->push(std::move(*response));
        return reply;
    }

    // A stream is already open for this session: answer through it.
    if (sessions_.deliver(sid, *response)) {
        return json_reply(202, {{"status", "sent_via_sse"}}, sid);
    }
    return json_reply(200, std::move(*response), sid);
}

BridgeReply Bridge::open_stream(const std::optional<std::string>& session_id,
                                const std::optional<std::string>& origin) {
    if (!is_origin_allowed(origin, opts_.allowed_origins)) {
        return forbidden(session_id);
    }
    BridgeReply reply;
    reply.session_id = sessions_.ensure(session_id);
    reply.stream = sessions_.open_stream(reply.session_id);
    spdlog::debug("Session {}: stream opened", reply.session_id);
    return reply;
}

void Bridge::close_stream(const std::string& session_id,
                          const std::shared_ptr<DeliveryQueue>& queue) {
    sessions_.close_stream(session_id, queue);
}

BridgeReply Bridge::end_session(const std::optional<std::string>& session_id,
                                const std::optional<std::string>& origin) {
    if (!is_origin_allowed(origin, opts_.allowed_origins)) {
        return forbidden(session_id);
    }
    if (!session_id || session_id->empty()) {
        return json_reply(400, {{"error", "Missing Mcp-Session-Id header"}});
    }
    if (!sessions_.erase(*session_id)) {
        return json_reply(404, {{"error", "Session not found"}}, *session_id);
    }
    return json_reply(200, {{"status", "terminated"}}, *session_id);
}

BridgeReply Bridge::health() const {
    if (!upstream_->is_running()) {
        return json_reply(503, {{"status", "unhealthy"}});
    }
    return json_reply(200, {
        {"status", "healthy"},
        {"mode", std::string(upstream_->mode_name())},
        {"server", upstream_->server_info()},
        {"tools", upstream_->capabilities()->tools.size()},
        {"sessions", sessions_.size()}
    });
}

BridgeReply Bridge::rest_list_tools(const std::optional<std::string>& origin) const {
    if (!is_origin_allowed(origin, opts_.allowed_origins)) {
        return forbidden(std::nullopt);
    }
    auto tools = nlohmann::json::array();
    for (const auto& tool : upstream_->capabilities()->tools) {
        if (!tool.is_object() || !tool.contains("name") || !tool["name"].is_string()) continue;
        const auto name = tool["name"].get<std::string>();
        auto description = tool.find("description");
        tools.push_back({
            {"name", name},
            {"description", description != tool.end() ? *description : nlohmann::json("")},
            {"endpoint", "/api/tools/" + name}
        });
    }
    return json_reply(200, {{"tools", std::move(tools)}});
}

BridgeReply Bridge::rest_call_tool(const std::string& name, const std::string& body,
                                   const std::optional<std::string>& origin) {
    if (!is_origin_allowed(origin, opts_.allowed_origins)) {
        return forbidden(std::nullopt);
    }

    nlohmann::json arguments = nlohmann::json::object();
    if (!is_blank(body)) {
        try {
            arguments = Codec::parse_value(body);
        } catch (const ParseError& e) {
            return json_reply(400, {{"success", false}, {"error", e.what()}});
        }
        if (!arguments.is_object()) {
            return json_reply(400, {{"success", false}, {"error", "Arguments must be a JSON object"}});
        }
    }

    if (!upstream_->ensure_running()) {
        return json_reply(503, {{"success", false}, {"error", "MCP server not running"}});
    }

    try {
        auto resp = upstream_->call("tools/call", {{"name", name}, {"arguments", arguments}});
        if (resp.error) {
            return json_reply(400, {{"success", false}, {"error", nlohmann::json(*resp.error)}});
        }
        return json_reply(200, {{"success", true},
                                {"data", resp.result.value_or(nlohmann::json::object())}});
    } catch (const BridgeError& e) {
        spdlog::error("REST call to {} failed: {}", name, e.what());
        return json_reply(500, {{"success", false}, {"error", e.what()}});
    }
}

} // namespace mcpbridge
