#include "mcpbridge/protocol_adapter.hpp"
#include "mcpbridge/error.hpp"

#include <spdlog/spdlog.h>

namespace mcpbridge {

namespace {

// Ids are echoed back only when they are a legal JSON-RPC id.
nlohmann::json extract_id(const nlohmann::json& envelope) {
    if (!envelope.is_object()) return nullptr;
    auto it = envelope.find("id");
    if (it == envelope.end()) return nullptr;
    if (it->is_string() || it->is_number_integer() || it->is_number_unsigned()) return *it;
    return nullptr;
}

JsonRpcError invalid_request(const std::string& detail) {
    return JsonRpcError{error::InvalidRequest, "Invalid Request", nlohmann::json(detail)};
}

/// `params` must be an object carrying a non-empty string `field`.
std::optional<JsonRpcError> require_string(const nlohmann::json& params, const char* field) {
    if (!params.is_object()) {
        return JsonRpcError{error::InvalidParams, "Invalid params",
                            nlohmann::json("params must be an object")};
    }
    auto it = params.find(field);
    if (it == params.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        return JsonRpcError{error::InvalidParams, "Invalid params",
                            nlohmann::json(std::string("Missing '") + field + "' parameter")};
    }
    return std::nullopt;
}

nlohmann::json member_or_empty(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_object() ? *it : nlohmann::json::object();
}

} // anonymous namespace

ProtocolAdapter::ProtocolAdapter(Upstream& upstream, SessionManager* sessions, Options opts)
    : upstream_(upstream), sessions_(sessions), opts_(std::move(opts)) {
    register_handlers();
}

ProtocolAdapter::ProtocolAdapter(Upstream& upstream, SessionManager* sessions)
    : ProtocolAdapter(upstream, sessions, Options{}) {
}

nlohmann::json ProtocolAdapter::advertisement() const {
    return {
        {"protocolVersion", std::string(PROTOCOL_VERSION)},
        {"capabilities", {
            {"tools", nlohmann::json::object()},
            {"prompts", nlohmann::json::object()},
            {"resources", nlohmann::json::object()}
        }},
        {"serverInfo", {{"name", opts_.server_name}, {"version", opts_.server_version}}}
    };
}

void ProtocolAdapter::register_handlers() {
    router_.on_request("initialize", [this](const nlohmann::json& params, const CallContext& ctx) -> HandlerResult {
        if (!params.is_object()) {
            return JsonRpcError{error::InvalidParams, "Invalid params",
                                nlohmann::json("params must be an object")};
        }
        auto client_info = member_or_empty(params, "clientInfo");
        spdlog::info("Client initialized session {}: {}", ctx.session_id, client_info.dump());
        if (sessions_ && !ctx.session_id.empty()) {
            auto version = params.find("protocolVersion");
            sessions_->set_init_metadata(ctx.session_id, std::move(client_info),
                                         member_or_empty(params, "capabilities"),
                                         version != params.end() && version->is_string()
                                             ? version->get<std::string>() : std::string());
        }
        return advertisement();
    });

    router_.on_request("ping", [](const nlohmann::json&, const CallContext&) -> HandlerResult {
        return nlohmann::json::object();
    });

    router_.on_request("tools/list", [this](const nlohmann::json&, const CallContext&) -> HandlerResult {
        return nlohmann::json{{"tools", upstream_.capabilities()->tools}};
    });
    router_.on_request("prompts/list", [this](const nlohmann::json&, const CallContext&) -> HandlerResult {
        return nlohmann::json{{"prompts", upstream_.capabilities()->prompts}};
    });
    router_.on_request("resources/list", [this](const nlohmann::json&, const CallContext&) -> HandlerResult {
        return nlohmann::json{{"resources", upstream_.capabilities()->resources}};
    });

    router_.on_request("tools/call", [this](const nlohmann::json& params, const CallContext&) -> HandlerResult {
        if (auto err = require_string(params, "name")) return *err;
        return forward("tools/call", params);
    });
    router_.on_request("prompts/get", [this](const nlohmann::json& params, const CallContext&) -> HandlerResult {
        if (auto err = require_string(params, "name")) return *err;
        return forward("prompts/get", params);
    });
    router_.on_request("resources/read", [this](const nlohmann::json& params, const CallContext&) -> HandlerResult {
        if (auto err = require_string(params, "uri")) return *err;
        return forward("resources/read", params);
    });

    router_.on_notification("notifications/initialized", [this](const nlohmann::json&, const CallContext& ctx) {
        if (sessions_ && !ctx.session_id.empty()) sessions_->mark_initialized(ctx.session_id);
    });
}

HandlerResult ProtocolAdapter::forward(const std::string& method, const nlohmann::json& params) {
    auto resp = upstream_.call(method, params);
    if (resp.error) {
        return JsonRpcError{error::InternalError, "Internal error", nlohmann::json(*resp.error)};
    }
    return resp.result.value_or(nlohmann::json::object());
}

std::optional<nlohmann::json> ProtocolAdapter::handle(const nlohmann::json& envelope,
                                                      const std::string& session_id) {
    const auto id = extract_id(envelope);

    if (!envelope.is_object()) {
        return make_error_envelope(id, invalid_request("Request must be a JSON object"));
    }
    auto version = envelope.find("jsonrpc");
    if (version == envelope.end() || !version->is_string()
        || version->get_ref<const std::string&>() != JSONRPC_VERSION) {
        return make_error_envelope(id, invalid_request("Invalid or missing jsonrpc version"));
    }
    auto method_it = envelope.find("method");
    if (method_it == envelope.end() || !method_it->is_string()
        || method_it->get_ref<const std::string&>().empty()) {
        return make_error_envelope(id, invalid_request("Missing or invalid method"));
    }
    const auto& method = method_it->get_ref<const std::string&>();

    CallContext ctx{session_id};
    auto params_it = envelope.find("params");
    const nlohmann::json params = params_it != envelope.end() && !params_it->is_null()
        ? *params_it : nlohmann::json::object();

    // Notifications are acknowledged and never forwarded.
    if (!envelope.contains("id") || method.rfind("notifications/", 0) == 0) {
        router_.dispatch_notification(method, params, ctx);
        return std::nullopt;
    }

    if (!upstream_.ensure_running()) {
        return make_error_envelope(id, error::ServerNotRunning, "MCP server not running");
    }

    auto result = router_.dispatch_request(method, params, ctx);
    if (auto* err = std::get_if<JsonRpcError>(&result)) {
        if (err->code != error::MethodNotFound && err->code != error::InvalidParams) {
            spdlog::warn("{} failed: {} ({})", method, err->message,
                         err->data ? err->data->dump() : std::string());
        }
        return make_error_envelope(id, *err);
    }
    return make_result_envelope(id, std::move(std::get<nlohmann::json>(result)));
}

} // namespace mcpbridge
