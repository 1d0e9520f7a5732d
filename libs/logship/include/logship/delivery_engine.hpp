// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file delivery_engine.hpp
/// @brief Batch delivery with exponential backoff
///
/// DeliveryEngine sends every record of a batch, in order, to a LogSink.
/// The first failed send ends the pass; the engine then waits out the
/// current backoff and resends the whole batch from its first record.
/// Backoff doubles after each failed pass up to max_backoff. There is no
/// retry limit: deliver() returns only when the batch was fully accepted
/// or the sleep function reports that the wait was interrupted.
///
/// Delivery is at-least-once: records accepted before a failure in one
/// pass are sent again in the next.

#include "logship/log_sink.hpp"
#include "logship/record.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace logship {

/// Backoff parameters for failed batches
struct RetryPolicy {
    std::chrono::milliseconds initial_backoff{100};
    std::chrono::milliseconds max_backoff{10000};
};

/// Statistics for the delivery engine
struct DeliveryStats {
    uint64_t batches_delivered = 0;
    uint64_t records_delivered = 0;
    uint64_t records_sent = 0;     ///< Includes resends
    uint64_t failed_passes = 0;
    uint64_t failed_flushes = 0;   ///< Passes where every send succeeded but flush did not
};

class DeliveryEngine {
public:
    /// Waits for the given backoff
    /// @return false if the wait was interrupted and delivery must stop
    using SleepFunction = std::function<bool(std::chrono::milliseconds)>;

    /// @param sink Delivery target
    /// @param policy Backoff parameters
    /// @param sleep Backoff wait; defaults to std::this_thread::sleep_for
    DeliveryEngine(std::shared_ptr<LogSink> sink,
                   const RetryPolicy& policy = {},
                   SleepFunction sleep = nullptr);

    /// Deliver a batch, retrying until every record is accepted
    /// @return true once the whole batch was delivered, false if interrupted
    bool deliver(const std::vector<LogRecord>& batch);

    /// Backoff to wait after @p failed_passes consecutive failures (1-based)
    std::chrono::milliseconds backoff_for(uint32_t failed_passes) const;

    const DeliveryStats& stats() const { return stats_; }
    const RetryPolicy& policy() const { return policy_; }

private:
    /// One pass over the batch
    /// @return true if every send and the trailing flush succeeded
    /// @param failed_index Index of the rejected record, or batch.size() if flush failed
    bool attempt(const std::vector<LogRecord>& batch, size_t& failed_index);

    std::shared_ptr<LogSink> sink_;
    RetryPolicy policy_;
    SleepFunction sleep_;
    DeliveryStats stats_;
};

}  // namespace logship
