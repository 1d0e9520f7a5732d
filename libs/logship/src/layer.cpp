// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/layer.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cctype>

namespace logship {

const char* to_string(Level level) {
    switch (level) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<Level> level_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace") return Level::Trace;
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    return std::nullopt;
}

LogRecord to_record(const Event& event, const std::optional<std::string>& service_name) {
    return LogRecord(to_string(event.level),
                     event.target,
                     event.fields,
                     event.location,
                     std::nullopt,
                     service_name);
}

LogLayer::LogLayer(LogHandle handle, const LayerConfig& config)
    : handle_(std::move(handle))
    , config_(config) {
}

std::optional<OfferResult> LogLayer::on_event(const Event& event) {
    events_seen_++;

    if (!enabled(event.level)) {
        events_filtered_++;
        return std::nullopt;
    }

    LogRecord record = to_record(event, config_.service_name);

    if (config_.echo) {
        LOG(INFO) << "[" << record.level() << "] " << record.target() << ": "
                  << record.message().value_or("") << " "
                  << record_to_json(record)["fields"].dump();
    }

    OfferResult result = handle_.offer(std::move(record));
    if (result == OfferResult::Rejected) {
        events_rejected_++;
    }
    return result;
}

LayerStats LogLayer::stats() const {
    LayerStats stats;
    stats.events_seen = events_seen_.load();
    stats.events_filtered = events_filtered_.load();
    stats.events_rejected = events_rejected_.load();
    return stats;
}

}  // namespace logship
