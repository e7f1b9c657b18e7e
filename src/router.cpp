#include "mcpbridge/router.hpp"
#include "mcpbridge/error.hpp"

#include <spdlog/spdlog.h>

namespace mcpbridge {

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

HandlerResult Router::dispatch_request(const std::string& method,
                                       const nlohmann::json& params,
                                       const CallContext& ctx) const {
    RequestHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = request_handlers_.find(method);
        if (it == request_handlers_.end()) {
            return JsonRpcError{error::MethodNotFound, "Method not found",
                                nlohmann::json("Unknown method: " + method)};
        }
        handler = it->second;
    }

    // Handlers block on the subprocess; never hold the lock across them.
    try {
        return handler(params, ctx);
    } catch (const ProtocolError& e) {
        return JsonRpcError{e.code, e.what(), std::nullopt};
    } catch (const TimeoutError& e) {
        return JsonRpcError{error::RequestTimeout, "Request timed out", nlohmann::json(e.what())};
    } catch (const ProcessTerminatedError& e) {
        return JsonRpcError{error::ProcessTerminated, "MCP server process terminated",
                            nlohmann::json(e.what())};
    } catch (const std::exception& e) {
        spdlog::error("Handler for {} failed: {}", method, e.what());
        return JsonRpcError{error::InternalError, "Internal error", nlohmann::json(e.what())};
    }
}

void Router::dispatch_notification(const std::string& method,
                                   const nlohmann::json& params,
                                   const CallContext& ctx) const {
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = notification_handlers_.find(method);
        if (it == notification_handlers_.end()) {
            spdlog::debug("Acknowledged notification {}", method);
            return;
        }
        handler = it->second;
    }
    try {
        handler(params, ctx);
    } catch (const std::exception& e) {
        spdlog::warn("Notification handler for {} failed: {}", method, e.what());
    }
}

} // namespace mcpbridge
