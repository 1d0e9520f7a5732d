// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file layer.hpp
/// @brief Event-to-record translation at the instrumentation boundary
///
/// LogLayer receives raw instrumentation events (level, target, location,
/// key/value fields), drops those below the configured level, turns the
/// rest into LogRecords and offers them to a pipeline handle.
///
/// Example:
/// @code
///   logship::LogLayer layer(pipeline.handle);
///   LOGSHIP_EVENT(layer, logship::Level::Error, "payments",
///                 {"message", std::string("card declined")},
///                 {"order_id", int64_t{4711}});
/// @endcode

#include "logship/ingestion_queue.hpp"
#include "logship/pipeline.hpp"
#include "logship/record.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace logship {

/// Event severity, ordered from least to most severe
enum class Level {
    Trace,
    Debug,
    Info,
    Warn,
    Error
};

/// Convert Level to string
/// @return "TRACE", "DEBUG", "INFO", "WARN" or "ERROR"
const char* to_string(Level level);

/// Parse Level from string
/// @param name Level name (case-insensitive, "warning" accepted for Warn)
/// @return Level if valid, nullopt if unknown
std::optional<Level> level_from_string(const std::string& name);

/// One raw instrumentation event
struct Event {
    Level level = Level::Error;
    std::string target;
    SourceLocation location;
    FieldMap fields;
};

/// Translate an event into a record.
/// The "message" field is moved into the record's message slot.
LogRecord to_record(const Event& event,
                    const std::optional<std::string>& service_name = std::nullopt);

/// Configuration for the layer
struct LayerConfig {
    /// Events below this level are ignored
    Level min_level = Level::Error;

    /// Logical service name stamped on every record (shared-table setups)
    std::optional<std::string> service_name;

    /// Also write each accepted record to the local glog output
    bool echo = false;
};

/// Statistics for the layer
struct LayerStats {
    uint64_t events_seen = 0;
    uint64_t events_filtered = 0;
    uint64_t events_rejected = 0;
};

class LogLayer {
public:
    explicit LogLayer(LogHandle handle, const LayerConfig& config = {});

    LogLayer(const LogLayer&) = delete;
    LogLayer& operator=(const LogLayer&) = delete;

    /// Check if events at @p level are forwarded
    bool enabled(Level level) const { return level >= config_.min_level; }

    /// Translate and enqueue an event. Never blocks, never fails.
    /// @return nullopt if filtered by level, otherwise the enqueue result
    std::optional<OfferResult> on_event(const Event& event);

    LayerStats stats() const;
    const LogHandle& handle() const { return handle_; }

private:
    LogHandle handle_;
    LayerConfig config_;

    std::atomic<uint64_t> events_seen_{0};
    std::atomic<uint64_t> events_filtered_{0};
    std::atomic<uint64_t> events_rejected_{0};
};

}  // namespace logship

/// Emit an event through a LogLayer, capturing the call site.
/// Fields are given as {name, FieldValue} pairs.
///
/// A macro because the file and line must be those of the caller, and C++17
/// has no std::source_location. Fields are only built when the level passes
/// the layer's filter.
#define LOGSHIP_EVENT(layer, lvl, tgt, ...)                                  \
    do {                                                                     \
        if ((layer).enabled(lvl)) {                                          \
            ::logship::Event logship_event_;                                 \
            logship_event_.level = (lvl);                                    \
            logship_event_.target = (tgt);                                   \
            logship_event_.location.file = __FILE__;                         \
            logship_event_.location.line = static_cast<uint32_t>(__LINE__);  \
            logship_event_.fields = ::logship::FieldMap{__VA_ARGS__};        \
            (layer).on_event(logship_event_);                                \
        }                                                                    \
    } while (0)
