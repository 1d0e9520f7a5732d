// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/pipeline.hpp"
#include "logship/batch_aggregator.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>

namespace logship {

PipelineConfig PipelineConfig::clamped() const {
    PipelineConfig out = *this;
    out.queue_capacity = std::max(queue_capacity, kMinQueueCapacity);
    out.batch_size = std::max(batch_size, kMinBatchSize);
    out.flush_interval = std::max(flush_interval, kMinFlushInterval);
    out.retry.initial_backoff = std::max(retry.initial_backoff, std::chrono::milliseconds(1));
    out.retry.max_backoff = std::max(retry.max_backoff, out.retry.initial_backoff);
    return out;
}

namespace detail {

/// State shared between producer handles and the background thread
struct PipelineState {
    PipelineState(const PipelineConfig& cfg, std::shared_ptr<LogSink> log_sink)
        : config(cfg)
        , queue(cfg.queue_capacity)
        , sink(std::move(log_sink)) {
    }

    const PipelineConfig config;
    IngestionQueue queue;
    std::shared_ptr<LogSink> sink;

    std::atomic<uint64_t> events_observed{0};
    std::atomic<uint64_t> events_enqueued{0};
    std::atomic<uint64_t> events_dropped{0};
    std::atomic<uint64_t> records_delivered{0};
    std::atomic<uint64_t> batches_delivered{0};
    std::atomic<uint64_t> delivery_retries{0};

    std::atomic<std::thread::id> consumer_id{};
    std::atomic<bool> running{false};
    std::atomic<bool> stop_requested{false};
    std::mutex stop_mutex;
    std::condition_variable stop_cv;

    /// Wait out a backoff delay
    /// @return false if stop was requested during the wait
    bool wait_backoff(std::chrono::milliseconds delay) {
        std::unique_lock<std::mutex> lock(stop_mutex);
        return !stop_cv.wait_for(lock, delay, [this] { return stop_requested.load(); });
    }

    void request_stop() {
        {
            std::lock_guard<std::mutex> lock(stop_mutex);
            stop_requested = true;
        }
        stop_cv.notify_all();
        queue.close();
    }
};

namespace {

void run_loop(std::shared_ptr<PipelineState> state) {
    using Clock = std::chrono::steady_clock;

    state->consumer_id = std::this_thread::get_id();
    const PipelineConfig& config = state->config;

    BatchAggregator aggregator(config.batch_size, config.flush_interval);
    DeliveryEngine engine(state->sink, config.retry,
                          [&state](std::chrono::milliseconds delay) {
                              state->delivery_retries.fetch_add(1, std::memory_order_relaxed);
                              return state->wait_backoff(delay);
                          });

    auto flush = [&]() {
        VLOG(1) << "Flushing log batch of " << aggregator.size() << " records";
        bool delivered = engine.deliver(aggregator.batch());
        if (delivered) {
            state->records_delivered.fetch_add(aggregator.size(), std::memory_order_relaxed);
            state->batches_delivered.fetch_add(1, std::memory_order_relaxed);
        }
        aggregator.reset(Clock::now());
        return delivered;
    };

    while (!state->stop_requested) {
        auto record = state->queue.pop_until(aggregator.deadline());
        if (state->stop_requested) {
            break;
        }

        if (record) {
            // Take what is already queued without another wait
            bool full = aggregator.add(std::move(*record));
            while (!full) {
                auto next = state->queue.try_pop();
                if (!next) break;
                full = aggregator.add(std::move(*next));
            }
            if (full) {
                if (!flush()) break;
                continue;
            }
        }

        if (aggregator.on_deadline(Clock::now())) {
            if (!flush()) break;
        }
    }

    size_t abandoned = aggregator.size() + state->queue.size();
    if (abandoned > 0) {
        LOG(WARNING) << "Log pipeline stopped with " << abandoned << " undelivered records";
    }
    state->running = false;
}

}  // namespace
}  // namespace detail

// =============================================================================
// LogHandle
// =============================================================================

LogHandle::LogHandle(std::shared_ptr<detail::PipelineState> state)
    : state_(std::move(state)) {
}

OfferResult LogHandle::offer(LogRecord record) const {
    if (!state_) {
        return OfferResult::Rejected;
    }

    state_->events_observed.fetch_add(1, std::memory_order_relaxed);

    if (std::this_thread::get_id() == state_->consumer_id.load()) {
        state_->events_dropped.fetch_add(1, std::memory_order_relaxed);
        LOG_FIRST_N(WARNING, 1) << "Record offered from the log pipeline thread, dropping";
        return OfferResult::Rejected;
    }

    OfferResult result = state_->queue.try_push(std::move(record));
    if (result == OfferResult::Accepted) {
        state_->events_enqueued.fetch_add(1, std::memory_order_relaxed);
    } else if (state_->queue.closed()) {
        state_->events_dropped.fetch_add(1, std::memory_order_relaxed);
        LOG_FIRST_N(WARNING, 1) << "Log pipeline stopped, dropping record";
    } else {
        state_->events_dropped.fetch_add(1, std::memory_order_relaxed);
        LOG_EVERY_N(WARNING, 1000) << "Log queue full (capacity " << state_->queue.capacity()
                                   << "), dropping record (" << google::COUNTER
                                   << " drops reported)";
    }
    return result;
}

PipelineCounters LogHandle::counters() const {
    PipelineCounters counters;
    if (!state_) {
        return counters;
    }
    counters.events_observed = state_->events_observed.load();
    counters.events_enqueued = state_->events_enqueued.load();
    counters.events_dropped = state_->events_dropped.load();
    counters.records_delivered = state_->records_delivered.load();
    counters.batches_delivered = state_->batches_delivered.load();
    counters.delivery_retries = state_->delivery_retries.load();
    return counters;
}

size_t LogHandle::queue_depth() const {
    return state_ ? state_->queue.size() : 0;
}

const PipelineConfig& LogHandle::config() const {
    static const PipelineConfig kDefault = PipelineConfig{}.clamped();
    return state_ ? state_->config : kDefault;
}

// =============================================================================
// BackgroundTask
// =============================================================================

BackgroundTask::BackgroundTask(std::shared_ptr<detail::PipelineState> state, std::thread thread)
    : state_(std::move(state))
    , thread_(std::move(thread)) {
}

BackgroundTask::~BackgroundTask() {
    if (thread_.joinable()) {
        thread_.detach();
    }
}

BackgroundTask& BackgroundTask::operator=(BackgroundTask&& other) noexcept {
    if (this != &other) {
        if (thread_.joinable()) {
            thread_.detach();
        }
        state_ = std::move(other.state_);
        thread_ = std::move(other.thread_);
    }
    return *this;
}

void BackgroundTask::stop() {
    if (!state_) {
        return;
    }

    state_->request_stop();
    if (thread_.joinable()) {
        thread_.join();
    }

    LOG(INFO) << "Log pipeline stopped. Stats: observed=" << state_->events_observed.load()
              << " enqueued=" << state_->events_enqueued.load()
              << " dropped=" << state_->events_dropped.load()
              << " delivered=" << state_->records_delivered.load()
              << " batches=" << state_->batches_delivered.load()
              << " retries=" << state_->delivery_retries.load();
}

bool BackgroundTask::running() const {
    return state_ && state_->running;
}

// =============================================================================
// spawn_pipeline
// =============================================================================

Pipeline spawn_pipeline(std::shared_ptr<LogSink> sink, const PipelineConfig& config) {
    if (!sink) {
        LOG(ERROR) << "Cannot start log pipeline without a sink";
        return {};
    }

    PipelineConfig effective = config.clamped();
    std::string sink_name = sink->name();

    auto state = std::make_shared<detail::PipelineState>(effective, std::move(sink));
    state->running = true;
    std::thread thread(detail::run_loop, state);

    LOG(INFO) << "Log pipeline started"
              << " (sink=" << sink_name
              << ", queue_capacity=" << effective.queue_capacity
              << ", batch_size=" << effective.batch_size
              << ", flush_interval=" << effective.flush_interval.count() << "ms"
              << ", backoff=" << effective.retry.initial_backoff.count()
              << "-" << effective.retry.max_backoff.count() << "ms)";

    Pipeline pipeline;
    pipeline.handle = LogHandle(state);
    pipeline.task = BackgroundTask(state, std::move(thread));
    return pipeline;
}

}  // namespace logship
