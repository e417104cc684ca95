/**
 * @file test_notification_channel.cpp
 * @brief Unit tests for in-memory and stream notification channels.
 */

#include "notify/notification_channel.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace code_sandbox;

TEST(InMemoryChannelTest, DeliversToRegisteredHandle) {
    InMemoryNotificationChannel channel;
    std::vector<std::string> received;
    channel.register_handle("client-1", [&](std::string_view payload) {
        received.emplace_back(payload);
    });

    ASSERT_TRUE(channel.publish("client-1", R"({"x":1})"));
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], R"({"x":1})");
    EXPECT_EQ(channel.delivered_count(), 1u);
}

TEST(InMemoryChannelTest, UnknownHandleIsGone) {
    InMemoryNotificationChannel channel;
    auto result = channel.publish("nobody", "{}");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ChannelGone);
    EXPECT_EQ(result.error().message, "No live recipient for handle nobody");
    EXPECT_EQ(channel.delivered_count(), 0u);
}

TEST(InMemoryChannelTest, UnregisteredHandleIsGone) {
    InMemoryNotificationChannel channel;
    channel.register_handle("c", [](std::string_view) {});
    EXPECT_EQ(channel.handle_count(), 1u);
    channel.unregister_handle("c");
    EXPECT_EQ(channel.handle_count(), 0u);

    auto result = channel.publish("c", "{}");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ChannelGone);
}

TEST(InMemoryChannelTest, CallbackMayUnregisterItself) {
    InMemoryNotificationChannel channel;
    channel.register_handle("once", [&](std::string_view) { channel.unregister_handle("once"); });
    ASSERT_TRUE(channel.publish("once", "{}"));
    EXPECT_FALSE(channel.publish("once", "{}"));
}

TEST(StreamChannelTest, WritesEnvelopeLine) {
    std::ostringstream out;
    std::mutex mutex;
    StreamNotificationChannel channel(out, mutex);

    ASSERT_TRUE(channel.publish("client-9", R"({"type":"execution_result","job_id":"j1"})"));
    ASSERT_TRUE(channel.publish("client-9", R"({"type":"execution_result","job_id":"j2"})"));

    std::istringstream lines(out.str());
    std::string line;
    std::vector<nlohmann::json> docs;
    while (std::getline(lines, line)) docs.push_back(nlohmann::json::parse(line));

    ASSERT_EQ(docs.size(), 2u);
    EXPECT_EQ(docs[0]["handle"], "client-9");
    EXPECT_EQ(docs[0]["payload"]["job_id"], "j1");
    EXPECT_EQ(docs[1]["payload"]["job_id"], "j2");
}

TEST(StreamChannelTest, InvalidPayloadIsInternalError) {
    std::ostringstream out;
    std::mutex mutex;
    StreamNotificationChannel channel(out, mutex);

    auto result = channel.publish("c", "{broken");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::Internal);
    EXPECT_TRUE(out.str().empty());
}

TEST(StreamChannelTest, BrokenStreamIsUnavailable) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    std::mutex mutex;
    StreamNotificationChannel channel(out, mutex);

    auto result = channel.publish("c", "{}");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ChannelUnavailable);
}
