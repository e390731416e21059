/**
 * test_event_channel.cpp
 */

#include <gtest/gtest.h>

#include "core/EventChannel.hpp"

#include <stdexcept>
#include <vector>

namespace surge::test {

using core::EventChannel;

TEST(EventChannelTest, Publish_DeliversInSubscriptionOrder) {
    EventChannel<int> channel;
    std::vector<std::string> seen;

    channel.subscribe([&seen](const int& v) { seen.push_back("a" + std::to_string(v)); });
    channel.subscribe([&seen](const int& v) { seen.push_back("b" + std::to_string(v)); });

    channel.publish(1);
    channel.publish(2);

    EXPECT_EQ(seen, (std::vector<std::string>{"a1", "b1", "a2", "b2"}));
}

TEST(EventChannelTest, Unsubscribe_IsIdempotent) {
    EventChannel<int> channel;
    int calls = 0;

    auto handle = channel.subscribe([&calls](const int&) { ++calls; });
    channel.publish(1);

    EXPECT_TRUE(channel.unsubscribe(handle));
    EXPECT_FALSE(channel.unsubscribe(handle));
    EXPECT_FALSE(channel.unsubscribe(nullptr));

    channel.publish(2);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(channel.subscriberCount(), 0u);
}

TEST(EventChannelTest, ThrowingSubscriberDoesNotStopDelivery) {
    EventChannel<int> channel;
    int calls = 0;

    channel.subscribe([](const int&) { throw std::runtime_error("boom"); });
    channel.subscribe([&calls](const int&) { ++calls; });

    EXPECT_NO_THROW(channel.publish(1));
    EXPECT_EQ(calls, 1);
}

TEST(EventChannelTest, SubscriberMayUnsubscribeItself) {
    EventChannel<int> channel;
    int calls = 0;
    core::SubscriptionPtr handle;

    handle = channel.subscribe([&](const int&) {
        ++calls;
        channel.unsubscribe(handle);
    });

    channel.publish(1);
    channel.publish(2);
    EXPECT_EQ(calls, 1);
}

} // namespace surge::test
