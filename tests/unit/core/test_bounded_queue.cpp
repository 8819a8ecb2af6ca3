/**
 * @file test_bounded_queue.cpp
 * @brief Unit tests for bounded_queue
 */

#include <gtest/gtest.h>

#include <kcenon/vector_transfer/core/bounded_queue.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

namespace kcenon::vector_transfer::test {

class BoundedQueueTest : public ::testing::Test {};

TEST_F(BoundedQueueTest, FifoOrder) {
    bounded_queue<int> queue(4);

    ASSERT_TRUE(queue.push(1));
    ASSERT_TRUE(queue.push(2));
    ASSERT_TRUE(queue.push(3));

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.pop(), 1);
    EXPECT_EQ(queue.pop(), 2);
    EXPECT_EQ(queue.pop(), 3);
}

TEST_F(BoundedQueueTest, ZeroCapacityBecomesOne) {
    bounded_queue<int> queue(0);

    EXPECT_EQ(queue.capacity(), 1u);
}

TEST_F(BoundedQueueTest, CloseDrainsRemainingItems) {
    bounded_queue<std::unique_ptr<int>> queue(2);
    ASSERT_TRUE(queue.push(std::make_unique<int>(5)));

    queue.close();

    EXPECT_TRUE(queue.is_closed());
    EXPECT_FALSE(queue.push(std::make_unique<int>(6)));
    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(**first, 5);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST_F(BoundedQueueTest, PushBlocksWhileFull) {
    bounded_queue<int> queue(1);
    ASSERT_TRUE(queue.push(1));
    std::atomic<bool> second_pushed{false};

    std::thread producer([&] {
        EXPECT_TRUE(queue.push(2));
        second_pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(second_pushed.load());

    EXPECT_EQ(queue.pop(), 1);
    producer.join();
    EXPECT_TRUE(second_pushed.load());
    EXPECT_EQ(queue.pop(), 2);
}

TEST_F(BoundedQueueTest, CloseWakesBlockedProducer) {
    bounded_queue<int> queue(1);
    ASSERT_TRUE(queue.push(1));
    std::atomic<bool> rejected{false};

    std::thread producer([&] { rejected = !queue.push(2); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();
    producer.join();

    EXPECT_TRUE(rejected.load());
}

TEST_F(BoundedQueueTest, CloseWakesBlockedConsumer) {
    bounded_queue<int> queue(1);
    std::atomic<bool> got_end{false};

    std::thread consumer([&] { got_end = !queue.pop().has_value(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();
    consumer.join();

    EXPECT_TRUE(got_end.load());
}

TEST_F(BoundedQueueTest, ProducerConsumerTransfersEverything) {
    constexpr int count = 10000;
    bounded_queue<int> queue(3);
    std::vector<int> received;

    std::thread producer([&] {
        for (int i = 0; i < count; ++i) {
            if (!queue.push(i)) {
                return;
            }
        }
        queue.close();
    });

    while (auto item = queue.pop()) {
        EXPECT_LE(queue.size(), queue.capacity());
        received.push_back(*item);
    }
    producer.join();

    ASSERT_EQ(received.size(), static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        EXPECT_EQ(received[i], i);
    }
}

}  // namespace kcenon::vector_transfer::test
