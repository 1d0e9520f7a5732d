// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/delivery_engine.hpp"

#include <gtest/gtest.h>

#include <deque>
#include <stdexcept>
#include <string>

namespace logship::test {

using std::chrono::milliseconds;

namespace {

/// Sink that follows a script of send outcomes, then accepts everything
class ScriptedSink : public LogSink {
public:
    enum class Outcome { Ok, Fail, Throw, ThrowNonStd };

    bool send(const LogRecord& record) override {
        sent.push_back(std::get<int64_t>(record.fields().at("seq")));
        if (script.empty()) {
            return true;
        }
        Outcome outcome = script.front();
        script.pop_front();
        if (outcome == Outcome::Throw) {
            throw std::runtime_error("backend exploded");
        }
        if (outcome == Outcome::ThrowNonStd) {
            throw 42;
        }
        return outcome == Outcome::Ok;
    }

    bool flush() override {
        flushes++;
        if (flush_throws > 0) {
            flush_throws--;
            throw std::string("flush exploded");
        }
        if (flush_failures > 0) {
            flush_failures--;
            return false;
        }
        return true;
    }

    std::string name() const override { return "scripted"; }

    std::deque<Outcome> script;
    std::vector<int64_t> sent;
    int flush_failures = 0;
    int flush_throws = 0;
    int flushes = 0;
};

std::vector<LogRecord> make_batch(int64_t count) {
    std::vector<LogRecord> batch;
    for (int64_t i = 1; i <= count; ++i) {
        batch.emplace_back("ERROR", "delivery_test", FieldMap{{"seq", i}});
    }
    return batch;
}

}  // namespace

class DeliveryEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<ScriptedSink>();
    }

    /// Engine that records each backoff instead of sleeping
    DeliveryEngine make_engine(const RetryPolicy& policy = {}) {
        return DeliveryEngine(sink_, policy, [this](milliseconds delay) {
            sleeps_.push_back(delay);
            return true;
        });
    }

    std::shared_ptr<ScriptedSink> sink_;
    std::vector<milliseconds> sleeps_;
};

TEST_F(DeliveryEngineTest, DeliversInOrderWithOneFlush) {
    auto engine = make_engine();
    auto batch = make_batch(4);

    EXPECT_TRUE(engine.deliver(batch));
    EXPECT_EQ(sink_->sent, (std::vector<int64_t>{1, 2, 3, 4}));
    EXPECT_EQ(sink_->flushes, 1);
    EXPECT_TRUE(sleeps_.empty());

    EXPECT_EQ(engine.stats().batches_delivered, 1u);
    EXPECT_EQ(engine.stats().records_delivered, 4u);
    EXPECT_EQ(engine.stats().failed_passes, 0u);
}

TEST_F(DeliveryEngineTest, EmptyBatchIsNoop) {
    auto engine = make_engine();
    EXPECT_TRUE(engine.deliver({}));
    EXPECT_TRUE(sink_->sent.empty());
    EXPECT_EQ(sink_->flushes, 0);
}

// Failures on the 2nd and 3rd sends of the first two passes: each pass
// restarts from the first record and the backoff doubles.
TEST_F(DeliveryEngineTest, FailedPassResendsWholeBatch) {
    using O = ScriptedSink::Outcome;
    sink_->script = {O::Ok, O::Fail,          // pass 1: fails at record 2
                     O::Ok, O::Ok, O::Fail};  // pass 2: fails at record 3

    auto engine = make_engine(RetryPolicy{milliseconds(100), milliseconds(10000)});
    auto batch = make_batch(3);

    EXPECT_TRUE(engine.deliver(batch));
    EXPECT_EQ(sink_->sent, (std::vector<int64_t>{1, 2, 1, 2, 3, 1, 2, 3}));
    EXPECT_EQ(sleeps_, (std::vector<milliseconds>{milliseconds(100), milliseconds(200)}));

    EXPECT_EQ(engine.stats().failed_passes, 2u);
    EXPECT_EQ(engine.stats().records_delivered, 3u);
    EXPECT_EQ(engine.stats().records_sent, 6u);
}

TEST_F(DeliveryEngineTest, FlushFailureRetriesBatch) {
    sink_->flush_failures = 1;
    auto engine = make_engine();
    auto batch = make_batch(2);

    EXPECT_TRUE(engine.deliver(batch));
    EXPECT_EQ(sink_->sent, (std::vector<int64_t>{1, 2, 1, 2}));
    EXPECT_EQ(sink_->flushes, 2);
    EXPECT_EQ(sleeps_.size(), 1u);
    EXPECT_EQ(engine.stats().failed_flushes, 1u);
    EXPECT_EQ(engine.stats().failed_passes, 1u);
}

TEST_F(DeliveryEngineTest, SendFailureIsNotCountedAsFlushFailure) {
    using O = ScriptedSink::Outcome;
    sink_->script = {O::Ok, O::Fail};

    auto engine = make_engine();
    auto batch = make_batch(3);

    EXPECT_TRUE(engine.deliver(batch));
    EXPECT_EQ(engine.stats().failed_passes, 1u);
    EXPECT_EQ(engine.stats().failed_flushes, 0u);
}

TEST_F(DeliveryEngineTest, ThrowingSinkCountsAsFailure) {
    using O = ScriptedSink::Outcome;
    sink_->script = {O::Throw};

    auto engine = make_engine();
    auto batch = make_batch(2);

    EXPECT_TRUE(engine.deliver(batch));
    EXPECT_EQ(sink_->sent, (std::vector<int64_t>{1, 1, 2}));
    EXPECT_EQ(engine.stats().failed_passes, 1u);
}

TEST_F(DeliveryEngineTest, NonStandardThrowCountsAsFailure) {
    using O = ScriptedSink::Outcome;
    sink_->script = {O::Ok, O::ThrowNonStd};

    auto engine = make_engine();
    auto batch = make_batch(2);

    EXPECT_TRUE(engine.deliver(batch));
    EXPECT_EQ(sink_->sent, (std::vector<int64_t>{1, 2, 1, 2}));
    EXPECT_EQ(engine.stats().failed_passes, 1u);
    EXPECT_EQ(engine.stats().batches_delivered, 1u);
}

TEST_F(DeliveryEngineTest, NonStandardThrowFromFlushRetriesBatch) {
    sink_->flush_throws = 1;

    auto engine = make_engine();
    auto batch = make_batch(2);

    EXPECT_TRUE(engine.deliver(batch));
    EXPECT_EQ(sink_->sent, (std::vector<int64_t>{1, 2, 1, 2}));
    EXPECT_EQ(sink_->flushes, 2);
    EXPECT_EQ(engine.stats().failed_flushes, 1u);
}

TEST_F(DeliveryEngineTest, InterruptedSleepAbandonsBatch) {
    using O = ScriptedSink::Outcome;
    sink_->script = {O::Fail, O::Fail, O::Fail};

    int sleeps = 0;
    DeliveryEngine engine(sink_, {}, [&sleeps](milliseconds) {
        return ++sleeps < 2;
    });
    auto batch = make_batch(1);

    EXPECT_FALSE(engine.deliver(batch));
    EXPECT_EQ(sleeps, 2);
    EXPECT_EQ(sink_->sent.size(), 2u);
    EXPECT_EQ(engine.stats().batches_delivered, 0u);
}

TEST_F(DeliveryEngineTest, BackoffDoublesUpToCap) {
    auto engine = make_engine(RetryPolicy{milliseconds(100), milliseconds(1000)});

    EXPECT_EQ(engine.backoff_for(1), milliseconds(100));
    EXPECT_EQ(engine.backoff_for(2), milliseconds(200));
    EXPECT_EQ(engine.backoff_for(3), milliseconds(400));
    EXPECT_EQ(engine.backoff_for(4), milliseconds(800));
    EXPECT_EQ(engine.backoff_for(5), milliseconds(1000));
    EXPECT_EQ(engine.backoff_for(60), milliseconds(1000));
}

TEST_F(DeliveryEngineTest, LongOutageHitsCap) {
    using O = ScriptedSink::Outcome;
    for (int i = 0; i < 8; ++i) {
        sink_->script.push_back(O::Fail);
    }

    auto engine = make_engine(RetryPolicy{milliseconds(10), milliseconds(50)});
    auto batch = make_batch(1);

    EXPECT_TRUE(engine.deliver(batch));
    ASSERT_EQ(sleeps_.size(), 8u);
    EXPECT_EQ(sleeps_[0], milliseconds(10));
    EXPECT_EQ(sleeps_[1], milliseconds(20));
    EXPECT_EQ(sleeps_[2], milliseconds(40));
    for (size_t i = 3; i < sleeps_.size(); ++i) {
        EXPECT_EQ(sleeps_[i], milliseconds(50));
    }
}

}  // namespace logship::test
