#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>

namespace mcpbridge {

/// Who is calling. Handlers that touch per-session state read it from here.
struct CallContext {
    std::string session_id;
};

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params,
                                                   const CallContext& ctx)>;
using NotificationHandler = std::function<void(const nlohmann::json& params,
                                               const CallContext& ctx)>;

/// Method-name dispatch table.
class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a notification handler.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Run the handler for `method`. Never throws: a missing handler is
    /// MethodNotFound, a handler exception becomes the matching error.
    [[nodiscard]] HandlerResult dispatch_request(const std::string& method,
                                                 const nlohmann::json& params,
                                                 const CallContext& ctx) const;

    /// Run the notification handler if there is one. Unknown
    /// notifications are ignored.
    void dispatch_notification(const std::string& method,
                               const nlohmann::json& params,
                               const CallContext& ctx) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace mcpbridge
