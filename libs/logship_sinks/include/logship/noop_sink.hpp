// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file noop_sink.hpp
/// @brief Sink that accepts and discards every record
///
/// Used to measure pipeline overhead without any I/O.

#include "logship/log_sink.hpp"

#include <atomic>
#include <cstdint>

namespace logship {

class NoopSink : public LogSink {
public:
    bool send(const LogRecord&) override {
        records_++;
        return true;
    }

    std::string name() const override { return "noop"; }

    /// Records accepted so far
    uint64_t records() const { return records_; }

private:
    std::atomic<uint64_t> records_{0};
};

}  // namespace logship
