#include <gtest/gtest.h>
#include "dsync/events/event_queue.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace dsync::events;

TEST(ThreadSafeQueue, PushAndPopInOrder) {
    ThreadSafeQueue<int> queue;

    EXPECT_TRUE(queue.push(42));
    EXPECT_TRUE(queue.push(100));

    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), 42);

    auto second = queue.pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value(), 100);
}

TEST(ThreadSafeQueue, TryPop) {
    ThreadSafeQueue<int> queue;

    EXPECT_FALSE(queue.try_pop().has_value());

    queue.push(123);
    auto val = queue.try_pop();
    ASSERT_TRUE(val.has_value());
    EXPECT_EQ(val.value(), 123);
}

TEST(ThreadSafeQueue, PopTimeout) {
    ThreadSafeQueue<int> queue;

    auto start = std::chrono::steady_clock::now();
    auto val = queue.pop_for(std::chrono::milliseconds(100));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    EXPECT_FALSE(val.has_value());
    EXPECT_GE(elapsed.count(), 90);
}

TEST(ThreadSafeQueue, Size) {
    ThreadSafeQueue<int> queue;

    EXPECT_EQ(queue.size(), 0u);
    EXPECT_TRUE(queue.empty());

    queue.push(1);
    queue.push(2);
    EXPECT_EQ(queue.size(), 2u);
    EXPECT_FALSE(queue.empty());

    queue.pop();
    EXPECT_EQ(queue.size(), 1u);
}

TEST(ThreadSafeQueue, ShutdownDrainsThenReportsEnd) {
    ThreadSafeQueue<int> queue;
    queue.push(7);
    queue.shutdown();

    EXPECT_TRUE(queue.is_shut_down());
    EXPECT_FALSE(queue.push(8));

    auto left = queue.pop();
    ASSERT_TRUE(left.has_value());
    EXPECT_EQ(left.value(), 7);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(ThreadSafeQueue, ProducerConsumer) {
    ThreadSafeQueue<int> queue;
    std::atomic<int> sum{0};

    std::thread producer([&queue]() {
        for (int i = 0; i < 100; ++i) {
            queue.push(i);
        }
        queue.shutdown();
    });

    std::thread consumer([&queue, &sum]() {
        while (auto val = queue.pop()) {
            sum += val.value();
        }
    });

    producer.join();
    consumer.join();

    EXPECT_EQ(sum, 4950);
}
