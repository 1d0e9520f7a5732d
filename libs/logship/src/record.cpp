// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/record.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace logship {

FieldType field_type(const FieldValue& value) {
    switch (value.index()) {
        case 0: return FieldType::String;
        case 1: return FieldType::Integer;
        case 2: return FieldType::Float;
        case 3: return FieldType::Bool;
        default: return FieldType::Structured;
    }
}

const char* to_string(FieldType type) {
    switch (type) {
        case FieldType::String: return "string";
        case FieldType::Integer: return "integer";
        case FieldType::Float: return "float";
        case FieldType::Bool: return "bool";
        case FieldType::Structured: return "structured";
    }
    return "unknown";
}

nlohmann::json field_to_json(const FieldValue& value) {
    switch (field_type(value)) {
        case FieldType::String: return std::get<std::string>(value);
        case FieldType::Integer: return std::get<int64_t>(value);
        case FieldType::Float: return std::get<double>(value);
        case FieldType::Bool: return std::get<bool>(value);
        case FieldType::Structured: return std::get<nlohmann::json>(value);
    }
    return nullptr;
}

std::string field_to_text(const FieldValue& value) {
    if (const auto* str = std::get_if<std::string>(&value)) {
        return *str;
    }
    return field_to_json(value).dump();
}

std::string format_timestamp(Timestamp ts) {
    auto since_epoch = ts.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - seconds);
    if (micros.count() < 0) {
        seconds -= std::chrono::seconds(1);
        micros += std::chrono::seconds(1);
    }

    std::time_t tt = static_cast<std::time_t>(seconds.count());
    std::tm tm_utc{};
    gmtime_r(&tt, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros.count() << 'Z';
    return oss.str();
}

LogRecord::LogRecord(std::string level,
                     std::string target,
                     FieldMap fields,
                     SourceLocation location,
                     std::optional<std::string> message,
                     std::optional<std::string> service_name,
                     Timestamp timestamp)
    : timestamp_(timestamp)
    , level_(std::move(level))
    , target_(std::move(target))
    , location_(std::move(location))
    , message_(std::move(message))
    , fields_(std::move(fields))
    , service_name_(std::move(service_name)) {
    auto it = fields_.find(kMessageField);
    if (it != fields_.end()) {
        if (!message_) {
            message_ = field_to_text(it->second);
        }
        fields_.erase(it);
    }
}

namespace {

template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

}  // namespace

nlohmann::json record_to_json(const LogRecord& record,
                              const std::optional<std::string>& service_override) {
    nlohmann::json fields = nlohmann::json::object();
    for (const auto& [key, value] : record.fields()) {
        fields[key] = field_to_json(value);
    }

    const auto& loc = record.location();

    nlohmann::json j;
    j["timestamp"] = format_timestamp(record.timestamp());
    j["level"] = record.level();
    j["target"] = record.target();
    j["module_path"] = optional_to_json(loc.module_path);
    j["file"] = optional_to_json(loc.file);
    j["line"] = optional_to_json(loc.line);
    j["message"] = optional_to_json(record.message());
    j["fields"] = std::move(fields);
    j["service_name"] = optional_to_json(service_override ? service_override : record.service_name());
    return j;
}

}  // namespace logship
