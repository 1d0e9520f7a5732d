// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file ingestion_queue.hpp
/// @brief Bounded multi-producer / single-consumer record queue
///
/// Producers call try_push() from any thread; it never blocks and returns
/// Rejected when the queue is at capacity. The single consumer waits in
/// pop_until() for the next record or a deadline.

#include "logship/record.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace logship {

/// Result of a non-blocking enqueue
enum class OfferResult {
    Accepted,
    Rejected
};

/// Convert OfferResult to string
/// @return "accepted" or "rejected"
const char* to_string(OfferResult result);

class IngestionQueue {
public:
    using Clock = std::chrono::steady_clock;

    /// @param capacity Maximum number of buffered records (at least 1)
    explicit IngestionQueue(size_t capacity);

    IngestionQueue(const IngestionQueue&) = delete;
    IngestionQueue& operator=(const IngestionQueue&) = delete;

    /// Enqueue without blocking
    /// @return Rejected if the queue is full or closed
    OfferResult try_push(LogRecord record);

    /// Wait for the next record until @p deadline
    /// @return nullopt on timeout or when the queue is closed
    std::optional<LogRecord> pop_until(Clock::time_point deadline);

    /// Dequeue without waiting
    std::optional<LogRecord> try_pop();

    /// Close the queue: further pushes are rejected, waiting consumers wake up
    void close();

    bool closed() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::deque<LogRecord> records_;
    bool closed_ = false;
};

}  // namespace logship
