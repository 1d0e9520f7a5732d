// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/stream_sink.hpp"

#include <iostream>

namespace logship {

StreamSink::StreamSink(std::ostream* out, std::optional<std::string> service_name)
    : out_(out ? out : &std::cout)
    , service_name_(std::move(service_name)) {
}

bool StreamSink::send(const LogRecord& record) {
    std::string line = record_to_json(record, service_name_).dump();

    std::lock_guard<std::mutex> lock(mutex_);
    *out_ << line << '\n';
    return static_cast<bool>(*out_);
}

bool StreamSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_->flush();
    return static_cast<bool>(*out_);
}

}  // namespace logship
