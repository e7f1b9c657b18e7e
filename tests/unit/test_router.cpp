#include <gtest/gtest.h>
#include "mcpbridge/router.hpp"
#include "mcpbridge/error.hpp"
#include <string>

using namespace mcpbridge;

TEST(Router, DispatchKnownRequest) {
    Router router;
    std::string seen_session;
    router.on_request("ping", [&](const nlohmann::json&, const CallContext& ctx) -> HandlerResult {
        seen_session = ctx.session_id;
        return nlohmann::json::object();
    });

    auto result = router.dispatch_request("ping", nlohmann::json::object(), CallContext{"s-1"});
    ASSERT_TRUE(std::holds_alternative<nlohmann::json>(result));
    EXPECT_EQ(seen_session, "s-1");
}

TEST(Router, DispatchUnknownMethod) {
    Router router;
    auto result = router.dispatch_request("unknown/method", nlohmann::json::object(), {});
    ASSERT_TRUE(std::holds_alternative<JsonRpcError>(result));
    const auto& err = std::get<JsonRpcError>(result);
    EXPECT_EQ(err.code, error::MethodNotFound);
    ASSERT_TRUE(err.data.has_value());
    EXPECT_EQ(*err.data, "Unknown method: unknown/method");
}

TEST(Router, HandlerReturnsError) {
    Router router;
    router.on_request("fails", [](const nlohmann::json&, const CallContext&) -> HandlerResult {
        return JsonRpcError{error::InvalidParams, "Invalid params", std::nullopt};
    });
    auto result = router.dispatch_request("fails", nullptr, {});
    ASSERT_TRUE(std::holds_alternative<JsonRpcError>(result));
    EXPECT_EQ(std::get<JsonRpcError>(result).code, error::InvalidParams);
}

TEST(Router, ExceptionsMapToErrorCodes) {
    Router router;
    router.on_request("timeout", [](const nlohmann::json&, const CallContext&) -> HandlerResult {
        throw TimeoutError("No response received for message 3 (tools/call)");
    });
    router.on_request("gone", [](const nlohmann::json&, const CallContext&) -> HandlerResult {
        throw ProcessTerminatedError("pipe closed");
    });
    router.on_request("protocol", [](const nlohmann::json&, const CallContext&) -> HandlerResult {
        throw ProtocolError(error::InvalidParams, "bad cursor");
    });
    router.on_request("other", [](const nlohmann::json&, const CallContext&) -> HandlerResult {
        throw std::runtime_error("unexpected");
    });

    auto code_of = [&](const std::string& method) {
        auto result = router.dispatch_request(method, nlohmann::json::object(), {});
        return std::get<JsonRpcError>(result).code;
    };
    EXPECT_EQ(code_of("timeout"), error::RequestTimeout);
    EXPECT_EQ(code_of("gone"), error::ProcessTerminated);
    EXPECT_EQ(code_of("protocol"), error::InvalidParams);
    EXPECT_EQ(code_of("other"), error::InternalError);

    auto result = router.dispatch_request("timeout", nlohmann::json::object(), {});
    const auto& err = std::get<JsonRpcError>(result);
    EXPECT_EQ(err.message, "Request timed out");
    EXPECT_NE(err.data->get<std::string>().find("message 3"), std::string::npos);
}

TEST(Router, DispatchNotification) {
    Router router;
    bool called = false;
    router.on_notification("notifications/initialized",
                           [&called](const nlohmann::json&, const CallContext&) { called = true; });
    router.dispatch_notification("notifications/initialized", nlohmann::json::object(), {});
    EXPECT_TRUE(called);
}

TEST(Router, UnknownNotificationIgnored) {
    Router router;
    EXPECT_NO_THROW(router.dispatch_notification("notifications/cancelled", nlohmann::json::object(), {}));
}

TEST(Router, NotificationHandlerExceptionContained) {
    Router router;
    router.on_notification("notifications/bad", [](const nlohmann::json&, const CallContext&) {
        throw std::runtime_error("handler failed");
    });
    EXPECT_NO_THROW(router.dispatch_notification("notifications/bad", nlohmann::json::object(), {}));
}
