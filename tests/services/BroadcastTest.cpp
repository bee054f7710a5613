#include "services/Broadcast.hpp"

#include <gtest/gtest.h>

#include <vector>

using esc::services::Broadcast;
using esc::services::Subscription;

TEST(Broadcast, DeliversToEverySubscriber) {
    Broadcast<int> channel;
    std::vector<int> first, second;
    auto a = channel.subscribe([&](const int& v) { first.push_back(v); });
    auto b = channel.subscribe([&](const int& v) { second.push_back(v); });

    channel.publish(1);
    channel.publish(2);
    EXPECT_EQ(first, (std::vector<int>{1, 2}));
    EXPECT_EQ(second, (std::vector<int>{1, 2}));
}

TEST(Broadcast, LateSubscriberSeesOnlyNewValues) {
    Broadcast<int> channel;
    channel.publish(1);

    std::vector<int> seen;
    auto sub = channel.subscribe([&](const int& v) { seen.push_back(v); });
    channel.publish(2);
    EXPECT_EQ(seen, (std::vector<int>{2}));
}

TEST(Broadcast, SubscriptionUnsubscribesWhenDestroyed) {
    Broadcast<int> channel;
    int calls = 0;
    {
        auto sub = channel.subscribe([&](const int&) { ++calls; });
        channel.publish(1);
        EXPECT_EQ(channel.listener_count(), 1u);
    }
    channel.publish(2);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(channel.listener_count(), 0u);
}

TEST(Broadcast, CancelIsIdempotent) {
    Broadcast<int> channel;
    auto sub = channel.subscribe([](const int&) {});
    sub.cancel();
    sub.cancel();
    EXPECT_FALSE(sub.active());
    EXPECT_EQ(channel.listener_count(), 0u);
}

TEST(Broadcast, MovedSubscriptionStaysRegistered) {
    Broadcast<int> channel;
    int calls = 0;
    Subscription outer;
    {
        auto inner = channel.subscribe([&](const int&) { ++calls; });
        outer = std::move(inner);
    }
    channel.publish(1);
    EXPECT_EQ(calls, 1);
}

TEST(Broadcast, CloseDropsListenersAndIgnoresPublish) {
    Broadcast<int> channel;
    int calls = 0;
    auto sub = channel.subscribe([&](const int&) { ++calls; });
    channel.close();
    channel.publish(1);
    EXPECT_EQ(calls, 0);
    EXPECT_TRUE(channel.closed());

    auto late = channel.subscribe([&](const int&) { ++calls; });
    EXPECT_FALSE(late.active());
}

TEST(Broadcast, SubscriptionMayOutliveChannel) {
    Subscription sub;
    {
        Broadcast<int> channel;
        sub = channel.subscribe([](const int&) {});
    }
    EXPECT_NO_THROW(sub.cancel());
}
