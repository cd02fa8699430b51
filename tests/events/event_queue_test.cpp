#include <gtest/gtest.h>
#include "wfsync/events/event_queue.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace wfsync::events;

TEST(CoalescingQueue, PushAndPopInOrder) {
    CoalescingQueue<std::string, int> queue;

    EXPECT_TRUE(queue.push("a.json", 1));
    EXPECT_TRUE(queue.push("b.json", 2));

    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), 1);

    auto second = queue.pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value(), 2);
}

TEST(CoalescingQueue, SameKeyReplacesPendingItem) {
    CoalescingQueue<std::string, int> queue;

    EXPECT_TRUE(queue.push("a.json", 1));
    EXPECT_TRUE(queue.push("b.json", 2));
    EXPECT_FALSE(queue.push("a.json", 3));

    EXPECT_EQ(queue.size(), 2u);

    // Keeps its original position, carries the latest item
    EXPECT_EQ(queue.pop().value(), 3);
    EXPECT_EQ(queue.pop().value(), 2);
}

TEST(CoalescingQueue, KeyCanBeQueuedAgainAfterPop) {
    CoalescingQueue<std::string, int> queue;

    queue.push("a.json", 1);
    queue.pop();

    EXPECT_TRUE(queue.push("a.json", 2));
    EXPECT_EQ(queue.pop().value(), 2);
}

TEST(CoalescingQueue, TryPop) {
    CoalescingQueue<std::string, int> queue;

    EXPECT_FALSE(queue.try_pop().has_value());

    queue.push("a.json", 123);

    auto val = queue.try_pop();
    ASSERT_TRUE(val.has_value());
    EXPECT_EQ(val.value(), 123);
    EXPECT_TRUE(queue.empty());
}

TEST(CoalescingQueue, PopTimeout) {
    CoalescingQueue<std::string, int> queue;

    auto start = std::chrono::steady_clock::now();
    auto val = queue.pop_for(std::chrono::milliseconds(100));
    auto end = std::chrono::steady_clock::now();

    EXPECT_FALSE(val.has_value());

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    EXPECT_GE(duration.count(), 90);
}

TEST(CoalescingQueue, ShutdownWakesConsumerAndRejectsPush) {
    CoalescingQueue<std::string, int> queue;

    std::thread consumer([&queue]() {
        auto val = queue.pop();
        EXPECT_FALSE(val.has_value());
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.shutdown();
    consumer.join();

    EXPECT_TRUE(queue.is_shutdown());
    EXPECT_FALSE(queue.push("a.json", 1));
    EXPECT_TRUE(queue.empty());
}

TEST(CoalescingQueue, ProducerConsumer) {
    CoalescingQueue<int, int> queue;
    std::atomic<int> sum{0};

    std::thread producer([&queue]() {
        for (int i = 0; i < 100; ++i) {
            queue.push(i, i);
        }
    });

    std::thread consumer([&queue, &sum]() {
        for (int received = 0; received < 100; ++received) {
            auto val = queue.pop();
            if (!val.has_value()) {
                break;
            }
            sum += val.value();
        }
    });

    producer.join();
    consumer.join();

    EXPECT_EQ(sum, 4950);
}
