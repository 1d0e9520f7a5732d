// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/ingestion_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

namespace logship::test {

class IngestionQueueTest : public ::testing::Test {
protected:
    LogRecord make_record(int64_t seq) {
        return LogRecord("ERROR", "queue_test", {{"seq", seq}});
    }

    int64_t seq_of(const LogRecord& record) {
        return std::get<int64_t>(record.fields().at("seq"));
    }

    IngestionQueue::Clock::time_point soon() {
        return IngestionQueue::Clock::now() + std::chrono::milliseconds(50);
    }
};

TEST_F(IngestionQueueTest, CapacityAtLeastOne) {
    IngestionQueue queue(0);
    EXPECT_EQ(queue.capacity(), 1u);
    EXPECT_EQ(queue.try_push(make_record(1)), OfferResult::Accepted);
    EXPECT_EQ(queue.try_push(make_record(2)), OfferResult::Rejected);
}

TEST_F(IngestionQueueTest, FifoOrder) {
    IngestionQueue queue(8);
    for (int64_t i = 0; i < 5; ++i) {
        ASSERT_EQ(queue.try_push(make_record(i)), OfferResult::Accepted);
    }
    EXPECT_EQ(queue.size(), 5u);

    for (int64_t i = 0; i < 5; ++i) {
        auto record = queue.pop_until(soon());
        ASSERT_TRUE(record.has_value());
        EXPECT_EQ(seq_of(*record), i);
    }
    EXPECT_EQ(queue.size(), 0u);
}

// Three offers into a queue of two: the third is rejected and the first two
// come out untouched.
TEST_F(IngestionQueueTest, FullQueueRejectsWithoutDisturbingContents) {
    IngestionQueue queue(2);

    EXPECT_EQ(queue.try_push(make_record(1)), OfferResult::Accepted);
    EXPECT_EQ(queue.try_push(make_record(2)), OfferResult::Accepted);
    EXPECT_EQ(queue.try_push(make_record(3)), OfferResult::Rejected);
    EXPECT_EQ(queue.size(), 2u);

    auto first = queue.try_pop();
    auto second = queue.try_pop();
    ASSERT_TRUE(first && second);
    EXPECT_EQ(seq_of(*first), 1);
    EXPECT_EQ(seq_of(*second), 2);
    EXPECT_FALSE(queue.try_pop().has_value());

    // Space again after draining
    EXPECT_EQ(queue.try_push(make_record(4)), OfferResult::Accepted);
}

TEST_F(IngestionQueueTest, PopTimesOutWhenEmpty) {
    IngestionQueue queue(4);

    auto start = IngestionQueue::Clock::now();
    auto record = queue.pop_until(start + std::chrono::milliseconds(30));
    auto waited = IngestionQueue::Clock::now() - start;

    EXPECT_FALSE(record.has_value());
    EXPECT_GE(waited, std::chrono::milliseconds(30));
}

TEST_F(IngestionQueueTest, PopWakesOnPush) {
    IngestionQueue queue(4);

    std::thread producer([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.try_push(make_record(9));
    });

    auto record = queue.pop_until(IngestionQueue::Clock::now() + std::chrono::seconds(5));
    producer.join();

    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(seq_of(*record), 9);
}

TEST_F(IngestionQueueTest, CloseWakesConsumerAndRejectsPushes) {
    IngestionQueue queue(4);

    std::thread closer([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.close();
    });

    auto start = IngestionQueue::Clock::now();
    auto record = queue.pop_until(start + std::chrono::seconds(5));
    closer.join();

    EXPECT_FALSE(record.has_value());
    EXPECT_LT(IngestionQueue::Clock::now() - start, std::chrono::seconds(5));
    EXPECT_TRUE(queue.closed());
    EXPECT_EQ(queue.try_push(make_record(1)), OfferResult::Rejected);
}

TEST_F(IngestionQueueTest, ConcurrentProducersNeverExceedCapacity) {
    constexpr size_t kCapacity = 64;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 500;

    IngestionQueue queue(kCapacity);
    std::atomic<int> accepted{0};
    std::atomic<int> rejected{0};

    std::vector<std::thread> producers;
    for (int t = 0; t < kThreads; ++t) {
        producers.emplace_back([&, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                auto result = queue.try_push(make_record(t * kPerThread + i));
                if (result == OfferResult::Accepted) {
                    accepted++;
                } else {
                    rejected++;
                }
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }

    EXPECT_EQ(accepted + rejected, kThreads * kPerThread);
    EXPECT_EQ(static_cast<size_t>(accepted.load()), kCapacity);
    EXPECT_EQ(queue.size(), kCapacity);
}

TEST_F(IngestionQueueTest, OfferResultToString) {
    EXPECT_STREQ(to_string(OfferResult::Accepted), "accepted");
    EXPECT_STREQ(to_string(OfferResult::Rejected), "rejected");
}

}  // namespace logship::test
