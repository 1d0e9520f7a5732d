// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/backend.hpp"
#include "logship/noop_sink.hpp"
#include "logship/stream_sink.hpp"

#include <gtest/gtest.h>

namespace logship::test {

// =============================================================================
// parse_dsn
// =============================================================================

TEST(BackendTest, SchemeSelectsKind) {
    struct Case {
        const char* dsn;
        BackendKind kind;
    };
    const Case cases[] = {
        {"stdout://", BackendKind::Stdout},
        {"noop://", BackendKind::Noop},
        {"mqtt://localhost/logs", BackendKind::Mqtt},
        {"clickhouse://default@ch:8123/logs", BackendKind::Clickhouse},
        {"postgres://app@db/logs", BackendKind::Postgres},
        {"postgresql://app@db/logs", BackendKind::Postgres},
        {"kafka://broker:9092/logs", BackendKind::Kafka},
        {"opensearch://search:9200/logs", BackendKind::OpenSearch},
    };

    for (const auto& c : cases) {
        auto config = parse_dsn(c.dsn);
        ASSERT_TRUE(config.has_value()) << c.dsn;
        EXPECT_EQ(config->kind, c.kind) << c.dsn;
        EXPECT_EQ(config->dsn, c.dsn);
    }
}

TEST(BackendTest, SchemeIsCaseInsensitive) {
    auto config = parse_dsn("MQTT://Broker/Logs");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->kind, BackendKind::Mqtt);
    EXPECT_EQ(config->dsn, "MQTT://Broker/Logs");
}

TEST(BackendTest, UnknownSchemeRejected) {
    EXPECT_FALSE(parse_dsn("").has_value());
    EXPECT_FALSE(parse_dsn("localhost:1883").has_value());
    EXPECT_FALSE(parse_dsn("redis://cache").has_value());
}

TEST(BackendTest, KindNames) {
    EXPECT_STREQ(to_string(BackendKind::Stdout), "stdout");
    EXPECT_STREQ(to_string(BackendKind::Postgres), "postgres");
    EXPECT_STREQ(to_string(BackendKind::OpenSearch), "opensearch");
}

// =============================================================================
// parse_mqtt_dsn
// =============================================================================

TEST(BackendTest, MqttDsnDefaults) {
    auto config = parse_mqtt_dsn("mqtt://broker");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->broker_host, "broker");
    EXPECT_EQ(config->broker_port, 1883);
    EXPECT_EQ(config->topic, "logs");
    EXPECT_TRUE(config->username.empty());
}

TEST(BackendTest, MqttDsnFull) {
    auto config = parse_mqtt_dsn("mqtt://svc:s3cr:et@broker.local:8883/logs/billing");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->username, "svc");
    EXPECT_EQ(config->password, "s3cr:et");
    EXPECT_EQ(config->broker_host, "broker.local");
    EXPECT_EQ(config->broker_port, 8883);
    EXPECT_EQ(config->topic, "logs/billing");
}

TEST(BackendTest, MqttDsnTrailingSlashKeepsDefaultTopic) {
    auto config = parse_mqtt_dsn("mqtt://broker:1884/");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->broker_port, 1884);
    EXPECT_EQ(config->topic, "logs");
}

TEST(BackendTest, MqttDsnInvalid) {
    EXPECT_FALSE(parse_mqtt_dsn("stdout://").has_value());
    EXPECT_FALSE(parse_mqtt_dsn("mqtt://").has_value());
    EXPECT_FALSE(parse_mqtt_dsn("mqtt://user@:1883/logs").has_value());
    EXPECT_FALSE(parse_mqtt_dsn("mqtt://broker:0").has_value());
    EXPECT_FALSE(parse_mqtt_dsn("mqtt://broker:70000").has_value());
    EXPECT_FALSE(parse_mqtt_dsn("mqtt://broker:port").has_value());
    EXPECT_FALSE(parse_mqtt_dsn("mqtt://broker:").has_value());
}

// =============================================================================
// make_sink
// =============================================================================

TEST(BackendTest, MakeLocalSinks) {
    auto stdout_sink = make_sink(*parse_dsn("stdout://"));
    ASSERT_NE(stdout_sink, nullptr);
    EXPECT_EQ(stdout_sink->name(), "stdout");
    EXPECT_NE(std::dynamic_pointer_cast<StreamSink>(stdout_sink), nullptr);

    auto noop_sink = make_sink(*parse_dsn("noop://"));
    ASSERT_NE(noop_sink, nullptr);
    EXPECT_NE(std::dynamic_pointer_cast<NoopSink>(noop_sink), nullptr);
}

TEST(BackendTest, RecognizedButNotBuiltBackends) {
    for (const char* dsn : {"clickhouse://ch/logs", "postgres://db/logs",
                            "kafka://broker/logs", "opensearch://search/logs"}) {
        auto config = parse_dsn(dsn);
        ASSERT_TRUE(config.has_value()) << dsn;
        EXPECT_EQ(make_sink(*config), nullptr) << dsn;
    }
}

TEST(BackendTest, MalformedMqttDsnGivesNoSink) {
    BackendConfig config;
    config.kind = BackendKind::Mqtt;
    config.dsn = "mqtt://:1883";
    EXPECT_EQ(make_sink(config), nullptr);
}

}  // namespace logship::test
