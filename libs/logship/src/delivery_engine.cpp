// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/delivery_engine.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <exception>
#include <thread>

namespace logship {

DeliveryEngine::DeliveryEngine(std::shared_ptr<LogSink> sink,
                               const RetryPolicy& policy,
                               SleepFunction sleep)
    : sink_(std::move(sink))
    , policy_(policy)
    , sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds delay) {
            std::this_thread::sleep_for(delay);
            return true;
        };
    }
}

std::chrono::milliseconds DeliveryEngine::backoff_for(uint32_t failed_passes) const {
    auto backoff = policy_.initial_backoff;
    for (uint32_t i = 1; i < failed_passes && backoff < policy_.max_backoff; ++i) {
        backoff *= 2;
    }
    return std::min(backoff, policy_.max_backoff);
}

bool DeliveryEngine::deliver(const std::vector<LogRecord>& batch) {
    if (batch.empty()) {
        return true;
    }

    uint32_t failed_passes = 0;
    while (true) {
        size_t failed_index = 0;
        if (attempt(batch, failed_index)) {
            stats_.batches_delivered++;
            stats_.records_delivered += batch.size();
            if (failed_passes > 0) {
                LOG(INFO) << "Log batch of " << batch.size() << " records delivered to "
                          << sink_->name() << " after " << failed_passes << " retries";
            }
            return true;
        }

        failed_passes++;
        stats_.failed_passes++;

        auto delay = backoff_for(failed_passes);
        if (failed_index < batch.size()) {
            LOG(WARNING) << "Log sink " << sink_->name() << " failed at record "
                         << failed_index + 1 << "/" << batch.size()
                         << ", retrying batch in " << delay.count() << "ms"
                         << " (attempt " << failed_passes + 1 << ")";
        } else {
            LOG(WARNING) << "Log sink " << sink_->name() << " flush failed after "
                         << batch.size() << " records, retrying batch in "
                         << delay.count() << "ms (attempt " << failed_passes + 1 << ")";
        }

        if (!sleep_(delay)) {
            LOG(WARNING) << "Delivery interrupted, abandoning batch of " << batch.size()
                         << " records";
            return false;
        }
    }
}

bool DeliveryEngine::attempt(const std::vector<LogRecord>& batch, size_t& failed_index) {
    for (size_t i = 0; i < batch.size(); ++i) {
        bool ok = false;
        try {
            ok = sink_->send(batch[i]);
        } catch (const std::exception& e) {
            LOG_EVERY_N(WARNING, 100) << "Log sink " << sink_->name()
                                      << " threw during send: " << e.what();
        } catch (...) {
            LOG_EVERY_N(WARNING, 100) << "Log sink " << sink_->name()
                                      << " threw a non-standard exception during send";
        }
        if (!ok) {
            failed_index = i;
            return false;
        }
        stats_.records_sent++;
    }

    bool flushed = false;
    try {
        flushed = sink_->flush();
    } catch (const std::exception& e) {
        LOG_EVERY_N(WARNING, 100) << "Log sink " << sink_->name()
                                  << " threw during flush: " << e.what();
    } catch (...) {
        LOG_EVERY_N(WARNING, 100) << "Log sink " << sink_->name()
                                  << " threw a non-standard exception during flush";
    }
    if (!flushed) {
        stats_.failed_flushes++;
        failed_index = batch.size();
        return false;
    }
    return true;
}

}  // namespace logship
