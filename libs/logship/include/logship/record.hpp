// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file record.hpp
/// @brief Normalized log record flowing through the pipeline
///
/// A LogRecord is an immutable snapshot of one observed event. It is created
/// once at the ingestion boundary, moved into the IngestionQueue, and read by
/// const reference from then on (batch, delivery engine, sinks).

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace logship {

/// Reserved field name routed into the record's message slot
constexpr const char* kMessageField = "message";

/// Dynamically-typed field value (tagged union)
using FieldValue = std::variant<std::string, int64_t, double, bool, nlohmann::json>;

/// Field map keyed by name, ordered for stable serialization
using FieldMap = std::map<std::string, FieldValue>;

/// Discriminator for FieldValue alternatives
enum class FieldType {
    String,
    Integer,
    Float,
    Bool,
    Structured
};

/// Get the type of a field value
FieldType field_type(const FieldValue& value);

/// Convert FieldType to string
/// @return "string", "integer", "float", "bool" or "structured"
const char* to_string(FieldType type);

/// Convert a field value to JSON
nlohmann::json field_to_json(const FieldValue& value);

/// Render a field value as plain text (strings unquoted)
std::string field_to_text(const FieldValue& value);

/// Optional source-location metadata
struct SourceLocation {
    std::optional<std::string> module_path;
    std::optional<std::string> file;
    std::optional<uint32_t> line;
};

using Timestamp = std::chrono::system_clock::time_point;

/// Format a timestamp as RFC 3339 UTC with microsecond precision
/// e.g. "2025-03-01T12:00:00.000123Z"
std::string format_timestamp(Timestamp ts);

/// Immutable normalized log record
///
/// If @p fields contains kMessageField, it is removed from the map and
/// stored as the message (non-string values are rendered as text).
/// An explicit @p message takes precedence over the field.
class LogRecord {
public:
    LogRecord(std::string level,
              std::string target,
              FieldMap fields = {},
              SourceLocation location = {},
              std::optional<std::string> message = std::nullopt,
              std::optional<std::string> service_name = std::nullopt,
              Timestamp timestamp = std::chrono::system_clock::now());

    Timestamp timestamp() const { return timestamp_; }
    const std::string& level() const { return level_; }
    const std::string& target() const { return target_; }
    const SourceLocation& location() const { return location_; }
    const std::optional<std::string>& message() const { return message_; }
    const FieldMap& fields() const { return fields_; }
    const std::optional<std::string>& service_name() const { return service_name_; }

private:
    Timestamp timestamp_;
    std::string level_;
    std::string target_;
    SourceLocation location_;
    std::optional<std::string> message_;
    FieldMap fields_;
    std::optional<std::string> service_name_;
};

/// Serialize a record to JSON
///
/// Keys: timestamp, level, target, module_path, file, line, message,
/// fields, service_name. Absent optionals serialize as null.
/// @param service_override Replaces the record's service name when set
nlohmann::json record_to_json(const LogRecord& record,
                              const std::optional<std::string>& service_override = std::nullopt);

}  // namespace logship
