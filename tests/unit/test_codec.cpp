#include <gtest/gtest.h>
#include "mcpbridge/codec.hpp"
#include "mcpbridge/error.hpp"

using namespace mcpbridge;

// ---- Parse tests ----

TEST(CodecParse, ValidRequest) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<int64_t>(req.id), 1);
    EXPECT_EQ(req.method, "ping");
}

TEST(CodecParse, ValidRequestStringId) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":"abc-123","method":"tools/list"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_EQ(std::get<std::string>(std::get<JsonRpcRequest>(msg).id), "abc-123");
}

TEST(CodecParse, ValidResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":42,"result":{"tools":[]}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    EXPECT_EQ(std::get<int64_t>(resp.id), 42);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_TRUE(resp.result->contains("tools"));
}

TEST(CodecParse, ValidErrorResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"Method not found","data":{"x":1}}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, -32601);
    EXPECT_EQ(resp.error->message, "Method not found");
    ASSERT_TRUE(resp.error->data.has_value());
    EXPECT_EQ((*resp.error->data)["x"], 1);
}

TEST(CodecParse, ValidNotification) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
    EXPECT_EQ(std::get<JsonRpcNotification>(msg).method, "notifications/initialized");
}

TEST(CodecParse, InvalidJson) {
    EXPECT_THROW(Codec::parse("{invalid json"), ParseError);
}

TEST(CodecParse, MissingJsonrpc) {
    EXPECT_THROW(Codec::parse(R"({"id":1,"method":"ping"})"), ParseError);
}

TEST(CodecParse, WrongJsonrpcVersion) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"1.0","id":1,"method":"ping"})"), ParseError);
}

TEST(CodecParse, NullId) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":null,"method":"ping"})"), ParseError);
}

TEST(CodecParse, ResponseWithoutResultOrError) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":7})"), ParseError);
}

TEST(CodecParse, BadIdType) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":{"a":1},"result":{}})"), ParseError);
}

TEST(CodecParse, EmptyInput) {
    EXPECT_THROW(Codec::parse(""), ParseError);
}

TEST(CodecParse, NotAnObject) {
    EXPECT_THROW(Codec::parse("[1,2,3]"), ParseError);
}

TEST(CodecParse, RequestWithParams) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hello"}}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    ASSERT_TRUE(req.params.has_value());
    EXPECT_EQ(req.params->at("name"), "echo");
    EXPECT_EQ(req.params->at("arguments").at("text"), "hello");
}

// ---- parse_value ----

TEST(CodecParseValue, Scalars) {
    EXPECT_EQ(Codec::parse_value("42"), 42);
    EXPECT_EQ(Codec::parse_value("\"hi\""), "hi");
    EXPECT_EQ(Codec::parse_value("true"), true);
    EXPECT_TRUE(Codec::parse_value("null").is_null());
}

TEST(CodecParseValue, NestedDocument) {
    auto j = Codec::parse_value(R"({"a":[1,2.5,"x",null,{"b":false}]})");
    ASSERT_TRUE(j["a"].is_array());
    EXPECT_EQ(j["a"].size(), 5u);
    EXPECT_DOUBLE_EQ(j["a"][1].get<double>(), 2.5);
    EXPECT_EQ(j["a"][4]["b"], false);
}

TEST(CodecParseValue, TrailingContentRejected) {
    EXPECT_THROW(Codec::parse_value(R"({"a":1} {"b":2})"), ParseError);
}

TEST(CodecParseValue, Utf8Passthrough) {
    auto j = Codec::parse_value(R"({"s":"café"})");
    EXPECT_EQ(j["s"], "caf\xc3\xa9");
}

// ---- Serialize ----

TEST(CodecSerialize, SingleLine) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/call";
    req.params = nlohmann::json{{"name", "echo"}, {"arguments", {{"text", "line1\nline2"}}}};
    std::string out = Codec::serialize(req);
    EXPECT_EQ(out.find('\n'), std::string::npos);

    auto parsed = Codec::parse(out);
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(parsed));
    EXPECT_EQ(std::get<JsonRpcRequest>(parsed).params->at("arguments").at("text"), "line1\nline2");
}

TEST(CodecParse, LargeMessage) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < 100; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "Description for tool " + std::to_string(i)},
            {"inputSchema", {{"type", "object"}, {"properties", nlohmann::json::object()}}}
        });
    }
    nlohmann::json response = {{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"tools", tools}}}};
    auto msg = Codec::parse(response.dump());
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    EXPECT_EQ(std::get<JsonRpcResponse>(msg).result->at("tools").size(), 100u);
}
