// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file log_sink.hpp
/// @brief Abstract interface for log sinks (MQTT, stdout, databases, etc.)
///
/// LogSink decouples record delivery from queueing and batching, allowing
/// different backends to be plugged into the pipeline.

#include "logship/record.hpp"

#include <string>

namespace logship {

/// Abstract interface for log sinks.
///
/// The delivery engine may send the same record more than once (a failed
/// batch is retried from its first record), so implementations must
/// tolerate duplicates. Implementations apply their own I/O timeouts; a
/// send() that never returns stalls the whole pipeline.
class LogSink {
public:
    virtual ~LogSink() = default;

    /// Deliver one record
    /// @return true if the backend accepted the record
    virtual bool send(const LogRecord& record) = 0;

    /// Flush anything the sink buffers internally.
    /// Called after every fully sent batch.
    /// @return true on success
    virtual bool flush() { return true; }

    /// Get sink name for logging
    virtual std::string name() const = 0;
};

}  // namespace logship
