// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/config.hpp"

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>

namespace logship {

std::string env_or(const char* key, const std::string& default_value) {
    const char* value = std::getenv(key);
    return value ? std::string(value) : default_value;
}

std::optional<LogshipConfig> config_from_yaml(const YAML::Node& root) {
    LogshipConfig config;

    try {
        if (root["pipeline"]) {
            auto pipeline = root["pipeline"];
            if (pipeline["queue_capacity"]) {
                config.pipeline.queue_capacity = pipeline["queue_capacity"].as<size_t>();
            }
            if (pipeline["batch_size"]) {
                config.pipeline.batch_size = pipeline["batch_size"].as<size_t>();
            }
            if (pipeline["flush_interval_ms"]) {
                config.pipeline.flush_interval =
                    std::chrono::milliseconds(pipeline["flush_interval_ms"].as<int64_t>());
            }
            if (pipeline["initial_backoff_ms"]) {
                config.pipeline.retry.initial_backoff =
                    std::chrono::milliseconds(pipeline["initial_backoff_ms"].as<int64_t>());
            }
            if (pipeline["max_backoff_ms"]) {
                config.pipeline.retry.max_backoff =
                    std::chrono::milliseconds(pipeline["max_backoff_ms"].as<int64_t>());
            }
        }

        if (root["layer"]) {
            auto layer = root["layer"];
            if (layer["min_level"]) {
                auto name = layer["min_level"].as<std::string>();
                auto level = level_from_string(name);
                if (!level) {
                    LOG(ERROR) << "Unknown log level in config: " << name;
                    return std::nullopt;
                }
                config.layer.min_level = *level;
            }
            if (layer["service_name"]) {
                config.layer.service_name = layer["service_name"].as<std::string>();
            }
            if (layer["echo"]) config.layer.echo = layer["echo"].as<bool>();
        }

        if (root["sink"]) {
            auto sink = root["sink"];
            if (sink["dsn"]) config.sink.dsn = sink["dsn"].as<std::string>();
            if (sink["compression"]) config.sink.compression = sink["compression"].as<std::string>();
            if (sink["compression_level"]) {
                config.sink.compression_level = sink["compression_level"].as<int>();
            }
        }
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Invalid logship configuration: " << e.what();
        return std::nullopt;
    }

    return config;
}

std::optional<LogshipConfig> load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to load config file " << path << ": " << e.what();
        return std::nullopt;
    }

    auto config = config_from_yaml(root);
    if (config) {
        LOG(INFO) << "Loaded configuration from " << path;
    }
    return config;
}

void apply_env_overrides(LogshipConfig& config) {
    const char* dsn = std::getenv(kEnvDsn);
    if (dsn && *dsn) {
        config.sink.dsn = dsn;
    }

    const char* service = std::getenv(kEnvServiceName);
    if (service && *service) {
        config.layer.service_name = std::string(service);
    }

    const char* min_level = std::getenv(kEnvMinLevel);
    if (min_level && *min_level) {
        auto level = level_from_string(min_level);
        if (level) {
            config.layer.min_level = *level;
        } else {
            LOG(WARNING) << "Ignoring unknown " << kEnvMinLevel << "=" << min_level;
        }
    }
}

}  // namespace logship
