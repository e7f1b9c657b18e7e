#include <gtest/gtest.h>
#include "mcpbridge/session.hpp"
#include <chrono>
#include <regex>
#include <thread>

using namespace mcpbridge;
using namespace std::chrono_literals;

TEST(DeliveryQueue, DeliversInOrder) {
    DeliveryQueue q;
    EXPECT_EQ(q.state(), DeliveryQueue::State::Created);
    ASSERT_TRUE(q.push({{"n", 1}}));
    ASSERT_TRUE(q.push({{"n", 2}}));

    auto a = q.wait_next(1s);
    auto b = q.wait_next(1s);
    EXPECT_EQ(q.state(), DeliveryQueue::State::Active);
    ASSERT_EQ(a.kind, DeliveryQueue::Item::Kind::Message);
    EXPECT_EQ(a.payload["n"], 1);
    EXPECT_EQ(b.payload["n"], 2);
}

TEST(DeliveryQueue, HeartbeatWhenIdle) {
    DeliveryQueue q;
    auto before = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    auto item = q.wait_next(20ms);
    ASSERT_EQ(item.kind, DeliveryQueue::Item::Kind::Heartbeat);
    EXPECT_EQ(item.payload["type"], "heartbeat");
    EXPECT_GE(item.payload["timestamp"].get<int64_t>(), before);
}

TEST(DeliveryQueue, CloseWakesConsumerAndRefusesPushes) {
    DeliveryQueue q;
    std::thread closer([&q] {
        std::this_thread::sleep_for(20ms);
        q.close();
    });
    auto item = q.wait_next(10s);
    closer.join();
    EXPECT_EQ(item.kind, DeliveryQueue::Item::Kind::Closed);
    EXPECT_FALSE(q.push({{"late", true}}));
    EXPECT_EQ(q.state(), DeliveryQueue::State::Closed);
}

TEST(DeliveryQueue, QueuedItemsDrainBeforeClosed) {
    DeliveryQueue q;
    ASSERT_TRUE(q.push({{"n", 1}}));
    q.close();
    EXPECT_EQ(q.wait_next(1s).kind, DeliveryQueue::Item::Kind::Message);
    EXPECT_EQ(q.wait_next(1s).kind, DeliveryQueue::Item::Kind::Closed);
}

TEST(SessionManager, MintsUuidWhenAbsent) {
    SessionManager sessions;
    auto id = sessions.ensure(std::nullopt);
    std::regex uuid_v4("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    EXPECT_TRUE(std::regex_match(id, uuid_v4)) << id;
    EXPECT_TRUE(sessions.exists(id));
    EXPECT_NE(sessions.ensure(std::nullopt), id);
}

TEST(SessionManager, AdoptsClientProvidedId) {
    SessionManager sessions;
    EXPECT_EQ(sessions.ensure(std::string("client-chosen")), "client-chosen");
    EXPECT_EQ(sessions.ensure(std::string("client-chosen")), "client-chosen");
    EXPECT_EQ(sessions.size(), 1u);
}

TEST(SessionManager, DeliverWithoutStreamFails) {
    SessionManager sessions;
    auto id = sessions.ensure(std::nullopt);
    EXPECT_FALSE(sessions.has_stream(id));
    EXPECT_FALSE(sessions.deliver(id, {{"x", 1}}));
    EXPECT_FALSE(sessions.deliver("unknown", {{"x", 1}}));
}

TEST(SessionManager, SecondStreamReplacesFirst) {
    SessionManager sessions;
    auto id = sessions.ensure(std::nullopt);
    auto first = sessions.open_stream(id);
    auto second = sessions.open_stream(id);

    EXPECT_EQ(first->state(), DeliveryQueue::State::Closed);
    ASSERT_TRUE(sessions.deliver(id, {{"result", "late"}}));

    EXPECT_EQ(first->size(), 0u);
    EXPECT_EQ(second->size(), 1u);
    auto item = second->wait_next(1s);
    EXPECT_EQ(item.payload["result"], "late");
}

TEST(SessionManager, StaleCloseKeepsCurrentStream) {
    SessionManager sessions;
    auto id = sessions.ensure(std::nullopt);
    auto first = sessions.open_stream(id);
    auto second = sessions.open_stream(id);

    // The replaced stream's connection finishes after the replacement
    sessions.close_stream(id, first);
    EXPECT_TRUE(sessions.has_stream(id));

    sessions.close_stream(id, second);
    EXPECT_FALSE(sessions.has_stream(id));
    EXPECT_EQ(second->state(), DeliveryQueue::State::Closed);
}

TEST(SessionManager, InitMetadataRecorded) {
    SessionManager sessions;
    auto id = sessions.ensure(std::nullopt);
    sessions.set_init_metadata(id, {{"name", "inspector"}}, {{"roots", nlohmann::json::object()}}, "2024-11-05");
    sessions.mark_initialized(id);

    auto rec = sessions.find(id);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->client_info["name"], "inspector");
    EXPECT_TRUE(rec->client_capabilities.contains("roots"));
    EXPECT_EQ(rec->protocol_version, "2024-11-05");
    EXPECT_TRUE(rec->initialized);
}

TEST(SessionManager, ExpiresIdleSessionsWithoutStreams) {
    SessionManager sessions;
    auto idle = sessions.ensure(std::nullopt);
    auto streaming = sessions.ensure(std::nullopt);
    auto queue = sessions.open_stream(streaming);

    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(sessions.expire_idle(10ms), 1u);
    EXPECT_FALSE(sessions.exists(idle));
    EXPECT_TRUE(sessions.exists(streaming));
    EXPECT_EQ(sessions.expire_idle(10s), 0u);
}

TEST(SessionManager, EraseClosesStream) {
    SessionManager sessions;
    auto id = sessions.ensure(std::nullopt);
    auto queue = sessions.open_stream(id);
    EXPECT_TRUE(sessions.erase(id));
    EXPECT_EQ(queue->state(), DeliveryQueue::State::Closed);
    EXPECT_FALSE(sessions.erase(id));
}
