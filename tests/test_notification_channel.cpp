#include <gtest/gtest.h>
#include "supervisor/notification_channel.hpp"

#include <chrono>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST(LifecycleEventTest, Describe) {
    EXPECT_EQ(describe(StatusChanged{StatusNotice::Running}), "status-changed:running");
    EXPECT_EQ(describe(StatusChanged{StatusNotice::Failed}), "status-changed:failed");
    EXPECT_EQ(describe(RestartNeeded{}), "restart-needed");
}

TEST(LifecycleEventTest, NoticeNames) {
    EXPECT_STREQ(to_string(StatusNotice::Starting), "starting");
    EXPECT_STREQ(to_string(StatusNotice::Running), "running");
    EXPECT_STREQ(to_string(StatusNotice::Crashed), "crashed");
    EXPECT_STREQ(to_string(StatusNotice::Stopped), "stopped");
    EXPECT_STREQ(to_string(StatusNotice::Failed), "failed");
}

TEST(NotificationChannelTest, DeliversInOrder) {
    NotificationChannel channel(8);
    EXPECT_TRUE(channel.try_push(StatusChanged{StatusNotice::Starting}));
    EXPECT_TRUE(channel.push(RestartNeeded{}));
    EXPECT_TRUE(channel.try_push(StatusChanged{StatusNotice::Running}));
    EXPECT_EQ(channel.size(), 3u);

    LifecycleEvent ev;
    ASSERT_TRUE(channel.pop(ev, 10ms));
    EXPECT_EQ(describe(ev), "status-changed:starting");
    ASSERT_TRUE(channel.pop(ev, 10ms));
    EXPECT_TRUE(std::holds_alternative<RestartNeeded>(ev));
    ASSERT_TRUE(channel.pop(ev, 10ms));
    EXPECT_EQ(describe(ev), "status-changed:running");
    EXPECT_FALSE(channel.pop(ev, 10ms));
}

TEST(NotificationChannelTest, TryPushDropsWhenFull) {
    NotificationChannel channel(2);
    EXPECT_TRUE(channel.try_push(StatusChanged{StatusNotice::Starting}));
    EXPECT_TRUE(channel.try_push(StatusChanged{StatusNotice::Running}));
    EXPECT_FALSE(channel.try_push(StatusChanged{StatusNotice::Crashed}));
    EXPECT_EQ(channel.size(), 2u);
}

TEST(NotificationChannelTest, PushBlocksUntilSpace) {
    BoundedChannel<int> channel(1);
    ASSERT_TRUE(channel.push(1));

    std::thread producer([&]() { channel.push(2); });
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(channel.size(), 1u);

    int v = 0;
    ASSERT_TRUE(channel.pop(v, 100ms));
    EXPECT_EQ(v, 1);
    producer.join();
    ASSERT_TRUE(channel.pop(v, 100ms));
    EXPECT_EQ(v, 2);
}

TEST(NotificationChannelTest, CloseRefusesProducersAndDrains) {
    BoundedChannel<int> channel(4);
    ASSERT_TRUE(channel.push(7));
    channel.close();

    EXPECT_TRUE(channel.closed());
    EXPECT_FALSE(channel.push(8));
    EXPECT_FALSE(channel.try_push(9));

    int v = 0;
    ASSERT_TRUE(channel.pop(v, 10ms));
    EXPECT_EQ(v, 7);
    EXPECT_FALSE(channel.pop(v, 10ms));
}

TEST(NotificationChannelTest, CloseWakesBlockedProducer) {
    BoundedChannel<int> channel(1);
    ASSERT_TRUE(channel.push(1));

    bool pushed = true;
    std::thread producer([&]() { pushed = channel.push(2); });
    std::this_thread::sleep_for(50ms);
    channel.close();
    producer.join();
    EXPECT_FALSE(pushed);
}

TEST(NotificationChannelTest, PopTimesOutWhenEmpty) {
    NotificationChannel channel;
    EXPECT_EQ(channel.capacity(), 64u);

    LifecycleEvent ev;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.pop(ev, 50ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 40ms);
}

TEST(NotificationChannelTest, ManyProducersOneConsumer) {
    BoundedChannel<int> channel(4);
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&channel, p]() {
            for (int i = 0; i < 25; ++i) channel.push(p * 100 + i);
        });
    }

    int received = 0;
    int v;
    while (received < 100 && channel.pop(v, 1000ms)) {
        ++received;
    }
    for (auto& t : producers) t.join();
    EXPECT_EQ(received, 100);
}
