// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/backend.hpp"
#include "logship/noop_sink.hpp"
#include "logship/stream_sink.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cctype>

namespace logship {

namespace {

std::string to_lower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool parse_port(const std::string& text, int& port) {
    if (text.empty() || text.size() > 5 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    int value = std::stoi(text);
    if (value < 1 || value > 65535) {
        return false;
    }
    port = value;
    return true;
}

}  // namespace

const char* to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::Stdout: return "stdout";
        case BackendKind::Noop: return "noop";
        case BackendKind::Mqtt: return "mqtt";
        case BackendKind::Clickhouse: return "clickhouse";
        case BackendKind::Postgres: return "postgres";
        case BackendKind::Kafka: return "kafka";
        case BackendKind::OpenSearch: return "opensearch";
    }
    return "unknown";
}

std::optional<BackendConfig> parse_dsn(const std::string& dsn) {
    std::string lower = to_lower(dsn);

    BackendConfig config;
    config.dsn = dsn;

    if (starts_with(lower, "stdout://")) {
        config.kind = BackendKind::Stdout;
    } else if (starts_with(lower, "noop://")) {
        config.kind = BackendKind::Noop;
    } else if (starts_with(lower, "mqtt://")) {
        config.kind = BackendKind::Mqtt;
    } else if (starts_with(lower, "clickhouse://")) {
        config.kind = BackendKind::Clickhouse;
    } else if (starts_with(lower, "postgres://") || starts_with(lower, "postgresql://")) {
        config.kind = BackendKind::Postgres;
    } else if (starts_with(lower, "kafka://")) {
        config.kind = BackendKind::Kafka;
    } else if (starts_with(lower, "opensearch://")) {
        config.kind = BackendKind::OpenSearch;
    } else {
        LOG(ERROR) << "Unknown or unsupported DSN scheme: " << dsn;
        return std::nullopt;
    }

    return config;
}

std::optional<MqttLogSinkConfig> parse_mqtt_dsn(const std::string& dsn) {
    const std::string scheme = "mqtt://";
    if (!starts_with(to_lower(dsn), scheme)) {
        return std::nullopt;
    }

    std::string rest = dsn.substr(scheme.size());
    MqttLogSinkConfig config;

    // Split authority and topic path
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos && slash + 1 < rest.size()) {
        config.topic = rest.substr(slash + 1);
    }

    // Credentials
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        std::string userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);

        auto colon = userinfo.find(':');
        config.username = userinfo.substr(0, colon);
        if (colon != std::string::npos) {
            config.password = userinfo.substr(colon + 1);
        }
    }

    // Host and port
    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        if (!parse_port(authority.substr(colon + 1), config.broker_port)) {
            LOG(ERROR) << "Invalid port in MQTT DSN: " << dsn;
            return std::nullopt;
        }
        authority = authority.substr(0, colon);
    }

    if (authority.empty()) {
        LOG(ERROR) << "Missing host in MQTT DSN: " << dsn;
        return std::nullopt;
    }
    config.broker_host = authority;

    return config;
}

std::shared_ptr<LogSink> make_sink(const BackendConfig& config, const SinkOptions& options) {
    switch (config.kind) {
        case BackendKind::Stdout:
            return std::make_shared<StreamSink>(nullptr, options.service_name);

        case BackendKind::Noop:
            return std::make_shared<NoopSink>();

        case BackendKind::Mqtt: {
            auto mqtt_config = parse_mqtt_dsn(config.dsn);
            if (!mqtt_config) {
                return nullptr;
            }
            mqtt_config->client_id = options.client_id;
            mqtt_config->service_name = options.service_name;
            mqtt_config->compression = options.compression;
            mqtt_config->compression_level = options.compression_level;

            auto sink = std::make_shared<MqttLogSink>(*mqtt_config);
            if (!sink->start()) {
                LOG(ERROR) << "Failed to start MQTT log sink for " << config.dsn;
                return nullptr;
            }
            return sink;
        }

        case BackendKind::Clickhouse:
        case BackendKind::Postgres:
        case BackendKind::Kafka:
        case BackendKind::OpenSearch:
            LOG(ERROR) << "Backend kind not built in this package: " << to_string(config.kind)
                       << " (implement LogSink for it and pass it to spawn_pipeline)";
            return nullptr;
    }
    return nullptr;
}

}  // namespace logship
