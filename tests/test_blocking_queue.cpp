#include <gtest/gtest.h>
#include "droneid/pipeline/blocking_queue.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
using namespace droneid::pipeline;
using namespace std::chrono_literals;

TEST(BlockingQueue, FifoOrder) {
    BlockingQueue<int> q(4);
    for (int i = 0; i < 4; ++i) EXPECT_TRUE(q.push(i, 10ms));
    EXPECT_EQ(q.size(), 4u);
    for (int i = 0; i < 4; ++i) {
        int v = -1;
        ASSERT_TRUE(q.pop(v, 10ms));
        EXPECT_EQ(v, i);
    }
}

TEST(BlockingQueue, BoundedPushAndEmptyPopTimeOut) {
    BlockingQueue<int> q(2);
    EXPECT_TRUE(q.try_push(1));
    EXPECT_TRUE(q.try_push(2));
    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(q.push(3, 30ms));
    EXPECT_GE(std::chrono::steady_clock::now() - t0, 25ms);

    int v;
    EXPECT_TRUE(q.try_pop(v));
    EXPECT_TRUE(q.try_pop(v));
    EXPECT_FALSE(q.pop(v, 20ms));
}

TEST(BlockingQueue, CloseWakesWaitersAndDrains) {
    BlockingQueue<int> q(2);
    ASSERT_TRUE(q.push(7, 10ms));
    std::atomic<bool> woke{false};
    std::thread consumer([&] {
        int v;
        while (q.pop(v, 5s)) {}
        woke = true;
    });
    std::this_thread::sleep_for(20ms);
    q.close();
    consumer.join();
    EXPECT_TRUE(woke);
    EXPECT_TRUE(q.closed());
    EXPECT_FALSE(q.push(1, 10ms));
}

TEST(BlockingQueue, ManyProducersManyConsumers) {
    BlockingQueue<int> q(8);
    constexpr int kProducers = 4, kPerProducer = 500;
    std::atomic<long> sum{0};
    std::atomic<int> count{0};

    std::vector<std::thread> consumers;
    for (int c = 0; c < 3; ++c) {
        consumers.emplace_back([&] {
            int v;
            while (q.pop(v, 200ms)) {
                sum += v;
                ++count;
            }
        });
    }
    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&, p] {
            for (int i = 0; i < kPerProducer; ++i)
                while (!q.push(p * kPerProducer + i, 50ms)) {}
        });
    }
    for (auto& t : producers) t.join();
    for (auto& t : consumers) t.join();

    const long n = kProducers * kPerProducer;
    EXPECT_EQ(count.load(), n);
    EXPECT_EQ(sum.load(), n * (n - 1) / 2);
}
