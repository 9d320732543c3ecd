#include <gtest/gtest.h>
#include "peerlink/events/event_queue.hpp"
#include "peerlink/transport/transport.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <variant>

using namespace peerlink::events;
namespace transport_event = peerlink::transport::transport_event;
using peerlink::transport::TransportEvent;

TEST(ThreadSafeQueue, PreservesPushOrder) {
    ThreadSafeQueue<TransportEvent> queue;

    queue.push(transport_event::ChannelOpened{});
    queue.push(transport_event::ChannelMessage{{0x01, 'h', 'i'}});
    queue.push(transport_event::ChannelClosed{});

    auto first = queue.try_pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(std::holds_alternative<transport_event::ChannelOpened>(*first));

    auto second = queue.try_pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE(std::holds_alternative<transport_event::ChannelMessage>(*second));

    auto third = queue.try_pop();
    ASSERT_TRUE(third.has_value());
    EXPECT_TRUE(std::holds_alternative<transport_event::ChannelClosed>(*third));
}

TEST(ThreadSafeQueue, TryPop) {
    ThreadSafeQueue<int> queue;

    auto val = queue.try_pop();
    EXPECT_FALSE(val.has_value());

    queue.push(123);

    val = queue.try_pop();
    ASSERT_TRUE(val.has_value());
    EXPECT_EQ(val.value(), 123);
}

TEST(ThreadSafeQueue, PopTimeout) {
    ThreadSafeQueue<int> queue;

    auto start = std::chrono::steady_clock::now();
    auto val = queue.pop_for(std::chrono::milliseconds(100));
    auto end = std::chrono::steady_clock::now();

    EXPECT_FALSE(val.has_value());

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    EXPECT_GE(duration.count(), 90);
}

TEST(ThreadSafeQueue, Size) {
    ThreadSafeQueue<int> queue;

    EXPECT_EQ(queue.size(), 0u);
    EXPECT_TRUE(queue.empty());

    queue.push(1);
    queue.push(2);
    EXPECT_EQ(queue.size(), 2u);
    EXPECT_FALSE(queue.empty());

    queue.clear();
    EXPECT_TRUE(queue.empty());
}

TEST(ThreadSafeQueue, ShutdownWakesWaiter) {
    ThreadSafeQueue<int> queue;

    queue.shutdown();

    auto start = std::chrono::steady_clock::now();
    auto val = queue.pop_for(std::chrono::seconds(5));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(val.has_value());
    EXPECT_LT(elapsed, std::chrono::seconds(1));
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
        while (true) {
            auto val = queue.pop_for(std::chrono::seconds(5));
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

TEST(ThreadSafeQueue, DrainTakesEverythingInOrder) {
    ThreadSafeQueue<int> queue;
    for (int i = 1; i <= 3; ++i) {
        queue.push(i);
    }

    auto batch = queue.drain();

    ASSERT_EQ(batch.size(), 3u);
    EXPECT_EQ(batch[0], 1);
    EXPECT_EQ(batch[2], 3);
    EXPECT_TRUE(queue.empty());
    EXPECT_TRUE(queue.drain().empty());
}
