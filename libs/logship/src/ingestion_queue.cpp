// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/ingestion_queue.hpp"

#include <algorithm>

namespace logship {

const char* to_string(OfferResult result) {
    switch (result) {
        case OfferResult::Accepted: return "accepted";
        case OfferResult::Rejected: return "rejected";
    }
    return "unknown";
}

IngestionQueue::IngestionQueue(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {
}

OfferResult IngestionQueue::try_push(LogRecord record) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || records_.size() >= capacity_) {
            return OfferResult::Rejected;
        }
        records_.push_back(std::move(record));
    }
    not_empty_.notify_one();
    return OfferResult::Accepted;
}

std::optional<LogRecord> IngestionQueue::pop_until(Clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait_until(lock, deadline, [this] {
        return closed_ || !records_.empty();
    });

    if (closed_ || records_.empty()) {
        return std::nullopt;
    }

    LogRecord record = std::move(records_.front());
    records_.pop_front();
    return record;
}

std::optional<LogRecord> IngestionQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.empty()) {
        return std::nullopt;
    }
    LogRecord record = std::move(records_.front());
    records_.pop_front();
    return record;
}

void IngestionQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
}

bool IngestionQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t IngestionQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

}  // namespace logship
