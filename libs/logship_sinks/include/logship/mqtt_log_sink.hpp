// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file mqtt_log_sink.hpp
/// @brief MQTT log sink publishing one JSON record per message
///
/// Each record is serialized with record_to_json(), encoded with the
/// configured Codec and published to a single topic. send() fails while
/// the client is not connected, so the delivery engine keeps the batch and
/// retries. mosquitto handles reconnects in its network thread.

#include "logship/log_sink.hpp"
#include "logship/payload_codec.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Forward declaration
struct mosquitto;

namespace logship {

/// Configuration for the MQTT log sink
struct MqttLogSinkConfig {
    std::string broker_host = "localhost";
    int broker_port = 1883;
    std::string client_id = "logship";
    std::string username;
    std::string password;
    int keepalive_sec = 60;
    int qos = 1;
    std::string topic = "logs";

    /// Overrides each record's service name when set
    std::optional<std::string> service_name;

    Codec compression = Codec::None;
    int compression_level = 3;

    /// Bounds for mosquitto's automatic reconnect backoff
    int reconnect_delay_sec = 1;
    int reconnect_delay_max_sec = 30;
};

/// Statistics for the MQTT log sink
struct MqttLogSinkStats {
    uint64_t messages_sent = 0;
    uint64_t messages_failed = 0;
    uint64_t bytes_sent = 0;
    int64_t last_send_timestamp_ns = 0;
    double encoding_ratio = 0.0;   ///< Encoded size over JSON size
};

class MqttLogSink : public LogSink {
public:
    explicit MqttLogSink(const MqttLogSinkConfig& config = {});
    ~MqttLogSink() override;

    MqttLogSink(const MqttLogSink&) = delete;
    MqttLogSink& operator=(const MqttLogSink&) = delete;

    /// Create the client and start connecting
    /// @return false if the client could not be created or the connect call failed
    bool start();

    /// Disconnect and release the client
    void stop();

    bool send(const LogRecord& record) override;
    std::string name() const override { return "mqtt"; }

    /// Check if sink is connected to the broker
    bool healthy() const;

    MqttLogSinkStats stats() const;
    const MqttLogSinkConfig& config() const { return config_; }

private:
    static void on_connect(struct mosquitto* mosq, void* obj, int rc);
    static void on_disconnect(struct mosquitto* mosq, void* obj, int rc);

    void release_client();
    void count_failure();
    void count_sent(size_t bytes);

    MqttLogSinkConfig config_;
    std::unique_ptr<PayloadEncoder> encoder_;
    std::mutex send_mutex_;

    struct mosquitto* mosq_ = nullptr;
    std::atomic<bool> connected_{false};
    std::atomic<bool> running_{false};

    mutable std::mutex stats_mutex_;
    MqttLogSinkStats stats_;
};

}  // namespace logship
