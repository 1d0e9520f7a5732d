// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file batch_aggregator.hpp
/// @brief Size- and time-triggered batch accumulation
///
/// Collects records in arrival order. A batch is ready when it reaches
/// batch_size records, or when flush_interval has elapsed since the last
/// flush attempt and the batch is non-empty.
///
/// Not thread-safe: owned by the pipeline's single consumer thread.
///
/// Example:
/// @code
///   BatchAggregator aggregator(128, std::chrono::milliseconds(1000));
///   if (aggregator.add(std::move(record))) {
///       engine.deliver(aggregator.batch());
///       aggregator.reset();
///   }
/// @endcode

#include "logship/record.hpp"

#include <chrono>
#include <cstddef>
#include <vector>

namespace logship {

class BatchAggregator {
public:
    using Clock = std::chrono::steady_clock;

    BatchAggregator(size_t batch_size,
                    std::chrono::milliseconds flush_interval,
                    Clock::time_point now = Clock::now());

    /// Append a record
    /// @return true if the batch reached batch_size
    bool add(LogRecord record);

    /// Check if the batch is at the size threshold
    bool full() const { return batch_.size() >= batch_size_; }

    bool empty() const { return batch_.empty(); }
    size_t size() const { return batch_.size(); }

    /// End of the current accumulation window
    Clock::time_point deadline() const { return window_start_ + flush_interval_; }

    /// Check if the interval elapsed with a non-empty batch
    bool due(Clock::time_point now) const;

    /// Called when the deadline passes. Starts a new window if the batch is
    /// empty so an idle pipeline does not spin.
    /// @return true if the batch should be flushed
    bool on_deadline(Clock::time_point now);

    /// Records accumulated so far, in arrival order
    const std::vector<LogRecord>& batch() const { return batch_; }

    /// Clear the batch and restart the flush timer
    void reset(Clock::time_point now = Clock::now());

    size_t batch_size() const { return batch_size_; }
    std::chrono::milliseconds flush_interval() const { return flush_interval_; }

private:
    size_t batch_size_;
    std::chrono::milliseconds flush_interval_;
    Clock::time_point window_start_;
    std::vector<LogRecord> batch_;
};

}  // namespace logship
