// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/batch_aggregator.hpp"

#include <algorithm>

namespace logship {

BatchAggregator::BatchAggregator(size_t batch_size,
                                 std::chrono::milliseconds flush_interval,
                                 Clock::time_point now)
    : batch_size_(std::max<size_t>(batch_size, 1))
    , flush_interval_(flush_interval)
    , window_start_(now) {
    batch_.reserve(batch_size_);
}

bool BatchAggregator::add(LogRecord record) {
    batch_.push_back(std::move(record));
    return full();
}

bool BatchAggregator::due(Clock::time_point now) const {
    return !batch_.empty() && now >= deadline();
}

bool BatchAggregator::on_deadline(Clock::time_point now) {
    if (due(now)) {
        return true;
    }
    if (batch_.empty() && now >= deadline()) {
        window_start_ = now;
    }
    return false;
}

void BatchAggregator::reset(Clock::time_point now) {
    batch_.clear();
    window_start_ = now;
}

}  // namespace logship
