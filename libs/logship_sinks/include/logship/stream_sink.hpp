// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file stream_sink.hpp
/// @brief Sink writing one JSON document per line to an output stream

#include "logship/log_sink.hpp"

#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

namespace logship {

class StreamSink : public LogSink {
public:
    /// @param out Destination stream, must outlive the sink (default std::cout)
    /// @param service_name Overrides the record's service name when set
    explicit StreamSink(std::ostream* out = nullptr,
                        std::optional<std::string> service_name = std::nullopt);

    bool send(const LogRecord& record) override;
    bool flush() override;
    std::string name() const override { return "stdout"; }

private:
    std::ostream* out_;
    std::optional<std::string> service_name_;
    std::mutex mutex_;
};

}  // namespace logship
