#include <gtest/gtest.h>
#include "gesu/events/event_queue.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace gesu::events;

TEST(ThreadSafeQueue, PushAndPopInOrder) {
    ThreadSafeQueue<std::string> queue;

    queue.push(R"({"event":"transfer_queued"})");
    queue.push(R"({"event":"transfer_started"})");

    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, R"({"event":"transfer_queued"})");

    auto second = queue.pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, R"({"event":"transfer_started"})");
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

TEST(ThreadSafeQueue, ShutdownDrainsBeforeEnd) {
    ThreadSafeQueue<int> queue;
    queue.push(7);
    queue.shutdown();

    EXPECT_FALSE(queue.push(8));

    auto last = queue.pop();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(*last, 7);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(ThreadSafeQueue, ShutdownWakesBlockedConsumer) {
    ThreadSafeQueue<int> queue;
    std::atomic<bool> woke{false};

    std::thread consumer([&] {
        auto val = queue.pop();
        woke = !val.has_value();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.shutdown();
    consumer.join();

    EXPECT_TRUE(woke.load());
}

TEST(ThreadSafeQueue, ProducersAndSingleWriter) {
    ThreadSafeQueue<int> queue;
    std::atomic<int> sum{0};

    std::thread writer([&queue, &sum]() {
        while (auto val = queue.pop()) {
            sum += *val;
        }
    });

    std::thread first([&queue]() {
        for (int i = 0; i < 50; ++i) {
            queue.push(i);
        }
    });
    std::thread second([&queue]() {
        for (int i = 50; i < 100; ++i) {
            queue.push(i);
        }
    });
    first.join();
    second.join();
    queue.shutdown();
    writer.join();

    EXPECT_EQ(sum, 4950);
}
