// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file config.hpp
/// @brief YAML and environment configuration for logship hosts
///
/// Example file:
/// @code
///   pipeline:
///     queue_capacity: 1024
///     batch_size: 128
///     flush_interval_ms: 1000
///     initial_backoff_ms: 100
///     max_backoff_ms: 10000
///   layer:
///     min_level: error
///     service_name: billing
///     echo: false
///   sink:
///     dsn: mqtt://localhost:1883/logs
///     compression: zstd
///     compression_level: 3
/// @endcode

#include "logship/layer.hpp"
#include "logship/pipeline.hpp"

#include <optional>
#include <string>

namespace YAML {
class Node;
}  // namespace YAML

namespace logship {

/// Environment variable names
constexpr const char* kEnvDsn = "LOGSHIP_DSN";
constexpr const char* kEnvServiceName = "LOGSHIP_SERVICE_NAME";
constexpr const char* kEnvMinLevel = "LOGSHIP_MIN_LEVEL";

/// Sink selection
struct SinkSettings {
    std::string dsn = "stdout://";
    std::string compression = "none";
    int compression_level = 3;
};

/// Complete host configuration
struct LogshipConfig {
    PipelineConfig pipeline;
    LayerConfig layer;
    SinkSettings sink;
};

/// Read an environment variable or fall back to a default
std::string env_or(const char* key, const std::string& default_value);

/// Parse configuration from a YAML document. Missing keys keep defaults.
/// @return nullopt if a value has the wrong type or an unknown level name
std::optional<LogshipConfig> config_from_yaml(const YAML::Node& root);

/// Load configuration from a YAML file
/// @return nullopt if the file cannot be read or parsed
std::optional<LogshipConfig> load_config(const std::string& path);

/// Apply LOGSHIP_DSN, LOGSHIP_SERVICE_NAME and LOGSHIP_MIN_LEVEL if set
void apply_env_overrides(LogshipConfig& config);

}  // namespace logship
