#include <gtest/gtest.h>
#include "mcpbridge/bridge.hpp"
#include "mcpbridge/transport/http_server.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>
#include <thread>

using namespace mcpbridge;
using namespace std::chrono_literals;
using json = nlohmann::json;

class HttpBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        Bridge::Options opts;
        opts.mode = UpstreamMode::Persistent;
        opts.upstream.process.command = {MCPBRIDGE_FAKE_SERVER};
        opts.upstream.process.startup_probe = 50ms;
        opts.upstream.request_timeout = 5000ms;
        opts.keepalive_interval = 100ms;
        bridge_ = std::make_unique<Bridge>(opts);
        bridge_->start();

        HttpServer::Options sopts;
        sopts.port = 0;
        sopts.worker_threads = 4;
        server_ = std::make_unique<HttpServer>(*bridge_, sopts);
        server_thread_ = std::thread([this] { server_->listen(); });

        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (!server_->is_running() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(10ms);
        }
        ASSERT_TRUE(server_->is_running());
        client_ = std::make_unique<httplib::Client>("127.0.0.1", server_->port());
        client_->set_read_timeout(5, 0);
    }

    void TearDown() override {
        client_.reset();
        if (server_) server_->stop();
        if (server_thread_.joinable()) server_thread_.join();
        server_.reset();
        if (bridge_) bridge_->stop();
    }

    httplib::Result post_mcp(const json& body, httplib::Headers headers = {}) {
        return client_->Post("/mcp", headers, body.dump(), "application/json");
    }

    std::unique_ptr<Bridge> bridge_;
    std::unique_ptr<HttpServer> server_;
    std::unique_ptr<httplib::Client> client_;
    std::thread server_thread_;
};

TEST_F(HttpBridgeTest, InitializeInline) {
    auto res = post_mcp({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
                         {"params", {{"protocolVersion", "2024-11-05"},
                                     {"clientInfo", {{"name", "e2e"}}}}}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    ASSERT_TRUE(res->has_header("Mcp-Session-Id"));
    EXPECT_FALSE(res->get_header_value("Mcp-Session-Id").empty());

    auto body = json::parse(res->body);
    EXPECT_EQ(body["id"], 1);
    EXPECT_EQ(body["result"]["protocolVersion"], "2024-11-05");
    EXPECT_TRUE(body["result"]["capabilities"].contains("tools"));
}

TEST_F(HttpBridgeTest, ToolCallInlineKeepsSession) {
    auto first = post_mcp({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}});
    ASSERT_TRUE(first);
    auto sid = first->get_header_value("Mcp-Session-Id");

    auto res = post_mcp({{"jsonrpc", "2.0"}, {"id", "call-1"}, {"method", "tools/call"},
                         {"params", {{"name", "echo"}, {"arguments", {{"text", "over http"}}}}}},
                        {{"Mcp-Session-Id", sid}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->get_header_value("Mcp-Session-Id"), sid);
    auto body = json::parse(res->body);
    EXPECT_EQ(body["id"], "call-1");
    EXPECT_EQ(body["result"]["content"][0]["text"], "over http");
}

TEST_F(HttpBridgeTest, NotificationAccepted) {
    auto res = post_mcp({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
    EXPECT_TRUE(res->body.empty());
}

TEST_F(HttpBridgeTest, ParseErrorIs400) {
    auto res = client_->Post("/mcp", "{not json", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(json::parse(res->body)["error"]["code"], -32700);
}

TEST_F(HttpBridgeTest, ForeignOriginRejected) {
    auto res = post_mcp({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}},
                        {{"Origin", "http://evil.example"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 403);
    auto body = json::parse(res->body);
    EXPECT_TRUE(body["id"].is_null());
    EXPECT_EQ(body["error"]["message"], "Invalid Origin header");

    auto ok = post_mcp({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}},
                       {{"Origin", "http://localhost:3000"}});
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok->status, 200);
    EXPECT_EQ(ok->get_header_value("Access-Control-Allow-Origin"), "http://localhost:3000");
}

TEST_F(HttpBridgeTest, StreamedResponse) {
    httplib::Request req;
    req.method = "POST";
    req.path = "/mcp";
    req.body = json{{"jsonrpc", "2.0"}, {"id", 9}, {"method", "tools/list"}}.dump();
    req.set_header("Content-Type", "application/json");
    req.set_header("Accept", "application/json, text/event-stream");

    std::string received;
    req.content_receiver = [&received](const char* data, size_t len, uint64_t, uint64_t) {
        received.append(data, len);
        return received.find("\n\n") == std::string::npos;
    };
    (void)client_->send(req);

    ASSERT_EQ(received.rfind("data: ", 0), 0u) << received;
    auto frame = json::parse(received.substr(6, received.find("\n\n") - 6));
    EXPECT_EQ(frame["id"], 9);
    EXPECT_EQ(frame["result"]["tools"].size(), 7u);
}

TEST_F(HttpBridgeTest, GetStreamSendsHeartbeats) {
    std::string received;
    auto res = client_->Get("/mcp", httplib::Headers{},
        [&received](const char* data, size_t len) {
            received.append(data, len);
            return received.find("heartbeat") == std::string::npos;
        });
    (void)res;
    EXPECT_NE(received.find("\"type\":\"heartbeat\""), std::string::npos) << received;
}

TEST_F(HttpBridgeTest, DeleteWithoutSessionIs400) {
    auto res = client_->Delete("/mcp");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);

    auto unknown = client_->Delete("/mcp", httplib::Headers{{"Mcp-Session-Id", "nope"}});
    ASSERT_TRUE(unknown);
    EXPECT_EQ(unknown->status, 404);
}

TEST_F(HttpBridgeTest, Health) {
    auto res = client_->Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = json::parse(res->body);
    EXPECT_EQ(body["status"], "healthy");
    EXPECT_EQ(body["mode"], "persistent");
    EXPECT_EQ(body["tools"], 7);
}

TEST_F(HttpBridgeTest, IndexListsEndpoints) {
    auto res = client_->Get("/");
    ASSERT_TRUE(res);
    auto body = json::parse(res->body);
    EXPECT_EQ(body["name"], "mcp-bridge");
    EXPECT_EQ(body["endpoints"]["mcp"], "/mcp");
}

TEST_F(HttpBridgeTest, RestApi) {
    auto list = client_->Get("/api/tools");
    ASSERT_TRUE(list);
    auto tools = json::parse(list->body)["tools"];
    ASSERT_EQ(tools.size(), 7u);
    EXPECT_EQ(tools[0]["endpoint"], "/api/tools/echo");

    auto call = client_->Post("/api/tools/echo", R"({"text":"rest"})", "application/json");
    ASSERT_TRUE(call);
    EXPECT_EQ(call->status, 200);
    auto body = json::parse(call->body);
    EXPECT_TRUE(body["success"].get<bool>());
    EXPECT_EQ(body["data"]["content"][0]["text"], "rest");

    auto failed = client_->Post("/api/tools/fail", "{}", "application/json");
    ASSERT_TRUE(failed);
    EXPECT_EQ(failed->status, 400);
    EXPECT_FALSE(json::parse(failed->body)["success"].get<bool>());
}
