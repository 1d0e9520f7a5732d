// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/mqtt_log_sink.hpp"

#include <glog/logging.h>
#include <mosquitto.h>

#include <chrono>

namespace logship {

namespace {

int64_t now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace

MqttLogSink::MqttLogSink(const MqttLogSinkConfig& config)
    : config_(config) {
}

MqttLogSink::~MqttLogSink() {
    stop();
}

bool MqttLogSink::start() {
    if (running_) {
        return true;
    }

    encoder_ = make_encoder(config_.compression, config_.compression_level);
    if (!encoder_) {
        LOG(ERROR) << "No " << to_string(config_.compression)
                   << " encoder available for topic " << config_.topic;
        return false;
    }

    mosquitto_lib_init();
    mosq_ = mosquitto_new(config_.client_id.c_str(), true, this);
    if (!mosq_) {
        LOG(ERROR) << "mosquitto_new failed for client " << config_.client_id;
        mosquitto_lib_cleanup();
        return false;
    }

    mosquitto_connect_callback_set(mosq_, on_connect);
    mosquitto_disconnect_callback_set(mosq_, on_disconnect);
    mosquitto_reconnect_delay_set(mosq_, config_.reconnect_delay_sec,
                                  config_.reconnect_delay_max_sec, true);
    if (!config_.username.empty()) {
        mosquitto_username_pw_set(mosq_, config_.username.c_str(), config_.password.c_str());
    }

    // The broker may come up later: connect_async plus the loop thread keeps retrying
    int rc = mosquitto_connect_async(mosq_, config_.broker_host.c_str(),
                                     config_.broker_port, config_.keepalive_sec);
    if (rc == MOSQ_ERR_SUCCESS) {
        rc = mosquitto_loop_start(mosq_);
    }
    if (rc != MOSQ_ERR_SUCCESS) {
        LOG(ERROR) << "Cannot reach " << config_.broker_host << ":" << config_.broker_port
                   << ": " << mosquitto_strerror(rc);
        release_client();
        return false;
    }

    running_ = true;
    LOG(INFO) << "MqttLogSink publishing to " << config_.topic << " on "
              << config_.broker_host << ":" << config_.broker_port
              << " (qos=" << config_.qos << ", codec=" << to_string(encoder_->codec()) << ")";
    return true;
}

void MqttLogSink::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        // send() publishes through mosq_ under the same lock
        std::lock_guard<std::mutex> send_lock(send_mutex_);
        connected_ = false;
        mosquitto_disconnect(mosq_);
        mosquitto_loop_stop(mosq_, false);
        release_client();
    }

    auto totals = stats();
    LOG(INFO) << "MqttLogSink on " << config_.topic << " closed after "
              << totals.messages_sent << " records (" << totals.bytes_sent << " bytes, "
              << totals.messages_failed << " failed)";
}

void MqttLogSink::release_client() {
    if (mosq_) {
        mosquitto_destroy(mosq_);
        mosq_ = nullptr;
    }
    mosquitto_lib_cleanup();
}

bool MqttLogSink::send(const LogRecord& record) {
    if (!connected_) {
        LOG_EVERY_N(WARNING, 100) << "Broker unavailable, record for " << config_.topic
                                  << " left to the retry loop";
        count_failure();
        return false;
    }

    std::string json = record_to_json(record, config_.service_name).dump();

    std::lock_guard<std::mutex> send_lock(send_mutex_);
    if (!mosq_ || !running_) {
        count_failure();
        return false;
    }

    std::vector<uint8_t> payload = encoder_->encode(json);
    int rc = mosquitto_publish(mosq_, nullptr, config_.topic.c_str(),
                               static_cast<int>(payload.size()), payload.data(),
                               config_.qos, false);
    if (rc != MOSQ_ERR_SUCCESS) {
        LOG_EVERY_N(WARNING, 100) << "Publish to " << config_.topic << " rejected: "
                                  << mosquitto_strerror(rc);
        count_failure();
        return false;
    }

    count_sent(payload.size());
    VLOG(2) << record.level() << " record from " << record.target() << " -> "
            << config_.topic << " (" << json.size() << " -> " << payload.size() << " bytes)";
    return true;
}

void MqttLogSink::count_failure() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.messages_failed++;
}

void MqttLogSink::count_sent(size_t bytes) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.messages_sent++;
    stats_.bytes_sent += bytes;
    stats_.last_send_timestamp_ns = now_ns();
    stats_.encoding_ratio = encoder_->stats().ratio();
}

bool MqttLogSink::healthy() const {
    return running_ && connected_;
}

MqttLogSinkStats MqttLogSink::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void MqttLogSink::on_connect(struct mosquitto*, void* obj, int rc) {
    auto* self = static_cast<MqttLogSink*>(obj);
    self->connected_ = (rc == 0);
    if (rc == 0) {
        LOG(INFO) << "MqttLogSink connected, topic " << self->config_.topic;
    } else {
        LOG(WARNING) << "Broker refused connection: " << mosquitto_connack_string(rc);
    }
}

void MqttLogSink::on_disconnect(struct mosquitto*, void* obj, int rc) {
    auto* self = static_cast<MqttLogSink*>(obj);
    self->connected_ = false;
    if (rc != 0) {
        LOG(WARNING) << "MqttLogSink lost broker connection: " << mosquitto_strerror(rc);
    }
}

}  // namespace logship
