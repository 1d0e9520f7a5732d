// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file pipeline.hpp
/// @brief Log pipeline supervisor: queue, batching thread and counters
///
/// spawn_pipeline() creates the IngestionQueue and starts exactly one
/// background thread that drains it into a BatchAggregator and hands full
/// or timed-out batches to a DeliveryEngine.
///
/// Data flow:
///   LogHandle::offer() → IngestionQueue → BatchAggregator → DeliveryEngine → LogSink
///
/// The background thread runs for the lifetime of the process. Records
/// still buffered when the process exits are lost. While a batch is being
/// retried the queue is not drained, so a sustained backend outage fills
/// the queue and new records are dropped.
///
/// Example:
/// @code
///   auto pipeline = logship::spawn_pipeline(std::make_shared<StreamSink>());
///   pipeline.handle.offer(LogRecord("ERROR", "billing", {{"message", std::string("charge failed")}}));
/// @endcode

#include "logship/delivery_engine.hpp"
#include "logship/ingestion_queue.hpp"
#include "logship/log_sink.hpp"
#include "logship/record.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <thread>

namespace logship {

/// Pipeline configuration. Values below the floors are clamped.
struct PipelineConfig {
    static constexpr size_t kMinQueueCapacity = 16;
    static constexpr size_t kMinBatchSize = 1;
    static constexpr std::chrono::milliseconds kMinFlushInterval{10};

    /// Records buffered before new ones are dropped
    size_t queue_capacity = 1024;

    /// Records per batch
    size_t batch_size = 128;

    /// Flush a non-empty batch at least this often
    std::chrono::milliseconds flush_interval{1000};

    /// Backoff for failed batches
    RetryPolicy retry;

    /// Copy with every value raised to its floor
    PipelineConfig clamped() const;
};

/// Snapshot of pipeline counters. Values only ever increase.
struct PipelineCounters {
    uint64_t events_observed = 0;
    uint64_t events_enqueued = 0;
    uint64_t events_dropped = 0;
    uint64_t records_delivered = 0;
    uint64_t batches_delivered = 0;
    uint64_t delivery_retries = 0;
};

namespace detail {
struct PipelineState;
}  // namespace detail

struct Pipeline;

/// Producer-side handle. Cheap to copy, safe to use from any thread.
class LogHandle {
public:
    LogHandle() = default;

    /// Enqueue a record without blocking.
    /// A Rejected record is dropped and counted; it is never retried.
    /// Records offered from the pipeline's own thread are rejected.
    OfferResult offer(LogRecord record) const;

    /// Current counter values
    PipelineCounters counters() const;

    /// Records waiting in the queue
    size_t queue_depth() const;

    /// Effective (clamped) configuration
    const PipelineConfig& config() const;

    bool valid() const { return state_ != nullptr; }

private:
    friend Pipeline spawn_pipeline(std::shared_ptr<LogSink>, const PipelineConfig&);

    explicit LogHandle(std::shared_ptr<detail::PipelineState> state);

    std::shared_ptr<detail::PipelineState> state_;
};

/// Owner of the background thread.
///
/// Destroying the handle detaches the thread, which keeps running until
/// process exit. stop() is for hosts that tear down explicitly: it wakes
/// the thread, abandons any buffered or in-flight records and joins.
class BackgroundTask {
public:
    BackgroundTask() = default;
    ~BackgroundTask();

    BackgroundTask(BackgroundTask&& other) noexcept = default;
    BackgroundTask& operator=(BackgroundTask&& other) noexcept;

    BackgroundTask(const BackgroundTask&) = delete;
    BackgroundTask& operator=(const BackgroundTask&) = delete;

    /// Stop the loop without draining and join the thread
    void stop();

    /// Check if the loop thread is still attached and running
    bool running() const;

private:
    friend Pipeline spawn_pipeline(std::shared_ptr<LogSink>, const PipelineConfig&);

    BackgroundTask(std::shared_ptr<detail::PipelineState> state, std::thread thread);

    std::shared_ptr<detail::PipelineState> state_;
    std::thread thread_;
};

/// Result of spawn_pipeline()
struct Pipeline {
    LogHandle handle;
    BackgroundTask task;
};

/// Create the queue and start the background delivery thread
/// @param sink Delivery target, shared with the background thread
/// @param config Pipeline configuration (clamped to floors)
Pipeline spawn_pipeline(std::shared_ptr<LogSink> sink, const PipelineConfig& config = {});

}  // namespace logship
