// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file main.cpp
/// @brief Example host with a user-defined LogSink
///
/// Shows the minimum a host needs to ship its error events to a backend
/// that logship does not provide: implement LogSink, spawn a pipeline with
/// it and route events through a LogLayer.
///
/// The sink here prints a compact one-line form and fails every fifth
/// flush to show the pipeline retrying the batch.

#include "logship/layer.hpp"
#include "logship/log_sink.hpp"
#include "logship/pipeline.hpp"

#include <glog/logging.h>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace {

class ConsoleSink : public logship::LogSink {
public:
    bool send(const logship::LogRecord& record) override {
        std::cout << logship::format_timestamp(record.timestamp()) << " "
                  << record.level() << " [" << record.target() << "] "
                  << record.message().value_or("<no message>");
        for (const auto& [key, value] : record.fields()) {
            std::cout << " " << key << "=" << logship::field_to_text(value);
        }
        std::cout << '\n';
        return true;
    }

    bool flush() override {
        // Simulated transient backend failure
        if (++flushes_ % 5 == 0) {
            LOG(WARNING) << "ConsoleSink: simulated flush failure";
            return false;
        }
        std::cout.flush();
        return true;
    }

    std::string name() const override { return "console"; }

private:
    uint64_t flushes_ = 0;
};

}  // namespace

int main(int argc, char* argv[]) {
    (void)argc;
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    logship::PipelineConfig pipeline_config;
    pipeline_config.batch_size = 4;
    pipeline_config.flush_interval = std::chrono::milliseconds(200);
    pipeline_config.retry.initial_backoff = std::chrono::milliseconds(50);

    auto pipeline = logship::spawn_pipeline(std::make_shared<ConsoleSink>(), pipeline_config);

    logship::LayerConfig layer_config;
    layer_config.min_level = logship::Level::Warn;
    layer_config.service_name = "custom_sink_example";
    logship::LogLayer layer(pipeline.handle, layer_config);

    for (int64_t order = 1; order <= 20; ++order) {
        if (order % 3 == 0) {
            LOGSHIP_EVENT(layer, logship::Level::Error, "payments",
                          {"message", std::string("card declined")},
                          {"order_id", order},
                          {"amount", 19.99});
        } else {
            // Below min_level, filtered by the layer
            LOGSHIP_EVENT(layer, logship::Level::Info, "payments",
                          {"message", std::string("order accepted")},
                          {"order_id", order});
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    // Warnings are forwarded as well
    LOGSHIP_EVENT(layer, logship::Level::Warn, "inventory",
                  {"message", std::string("stock low")},
                  {"sku", std::string("A-113")},
                  {"remaining", int64_t{2}},
                  {"restock", true});

    std::this_thread::sleep_for(std::chrono::milliseconds(1000));

    auto layer_stats = layer.stats();
    LOG(INFO) << "Layer: seen=" << layer_stats.events_seen
              << " filtered=" << layer_stats.events_filtered
              << " rejected=" << layer_stats.events_rejected;

    pipeline.task.stop();
    google::ShutdownGoogleLogging();
    return 0;
}
