// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file main.cpp
/// @brief logship load generator
///
/// Emits error events from several producer threads through a LogLayer and
/// reports producer-side throughput plus the pipeline counters.
///
/// Usage:
///   logship_load --dsn noop:// --events 100000 --threads 4
///   logship_load --config logship.yaml

#include "logship/backend.hpp"
#include "logship/config.hpp"
#include "logship/layer.hpp"
#include "logship/pipeline.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <string>
#include <thread>
#include <vector>

DEFINE_string(config, "", "Path to logship YAML configuration");
DEFINE_string(dsn, "", "Sink DSN, overrides config and LOGSHIP_DSN (e.g. noop://, mqtt://host/logs)");
DEFINE_uint64(events, 100000, "Total events to emit");
DEFINE_uint32(threads, 1, "Producer threads");
DEFINE_uint64(queue_capacity, 0, "Queue capacity (0 = from config)");
DEFINE_uint64(batch_size, 0, "Batch size (0 = from config)");
DEFINE_int64(flush_interval_ms, 0, "Flush interval in ms (0 = from config)");
DEFINE_int32(drain_ms, 2000, "Time to let the pipeline drain before exiting");

namespace {

void log_config(const logship::LogshipConfig& config) {
    LOG(INFO) << "=== logship_load Configuration ===";
    LOG(INFO) << "Sink DSN: " << config.sink.dsn;
    LOG(INFO) << "Payload codec: " << config.sink.compression;
    LOG(INFO) << "Queue capacity: " << config.pipeline.queue_capacity;
    LOG(INFO) << "Batching: " << config.pipeline.batch_size << " records, "
              << config.pipeline.flush_interval.count() << "ms interval";
    LOG(INFO) << "Min level: " << logship::to_string(config.layer.min_level);
    LOG(INFO) << "Service: " << config.layer.service_name.value_or("<none>");
}

/// Run the load against the configured sink
/// @return process exit code
int run_load(const logship::LogshipConfig& config) {
    // Sink construction is the only fatal step
    auto backend = logship::parse_dsn(config.sink.dsn);
    if (!backend) {
        return 1;
    }

    auto codec = logship::codec_from_string(config.sink.compression);
    if (!codec) {
        LOG(ERROR) << "Unknown payload codec: " << config.sink.compression;
        return 1;
    }

    logship::SinkOptions options;
    options.service_name = config.layer.service_name;
    options.compression = *codec;
    options.compression_level = config.sink.compression_level;
    options.client_id = "logship_load";

    auto sink = logship::make_sink(*backend, options);
    if (!sink) {
        LOG(ERROR) << "Failed to create " << logship::to_string(backend->kind) << " sink";
        return 1;
    }

    auto pipeline = logship::spawn_pipeline(sink, config.pipeline);
    const auto& effective = pipeline.handle.config();
    if (effective.queue_capacity != config.pipeline.queue_capacity ||
        effective.batch_size != config.pipeline.batch_size) {
        LOG(INFO) << "Pipeline limits raised to queue_capacity=" << effective.queue_capacity
                  << " batch_size=" << effective.batch_size;
    }
    logship::LogLayer layer(pipeline.handle, config.layer);

    const uint32_t threads = std::max<uint32_t>(FLAGS_threads, 1);
    const uint64_t per_thread = FLAGS_events / threads;

    auto start = std::chrono::steady_clock::now();

    std::vector<std::thread> producers;
    for (uint32_t t = 0; t < threads; ++t) {
        producers.emplace_back([&layer, t, per_thread]() {
            for (uint64_t i = 0; i < per_thread; ++i) {
                LOGSHIP_EVENT(layer, logship::Level::Error, "logship_load",
                              {"message", std::string("load test error")},
                              {"iteration", static_cast<int64_t>(i)},
                              {"producer", static_cast<int64_t>(t)});
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);
    uint64_t emitted = per_thread * threads;

    LOG(INFO) << "Emitted " << emitted << " events in " << std::fixed << std::setprecision(3)
              << elapsed.count() << "s (~" << std::setprecision(0)
              << (elapsed.count() > 0 ? emitted / elapsed.count() : 0.0) << " ev/s)";

    std::this_thread::sleep_for(std::chrono::milliseconds(FLAGS_drain_ms));

    auto counters = pipeline.handle.counters();
    LOG(INFO) << "Counters: observed=" << counters.events_observed
              << " enqueued=" << counters.events_enqueued
              << " dropped=" << counters.events_dropped
              << " delivered=" << counters.records_delivered
              << " batches=" << counters.batches_delivered
              << " retries=" << counters.delivery_retries;

    pipeline.task.stop();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;
    FLAGS_colorlogtostderr = true;

    gflags::SetUsageMessage(
        "logship load generator\n\n"
        "Emits error events through the log pipeline and reports throughput.\n\n"
        "Example:\n"
        "  logship_load --dsn noop:// --events 100000 --threads 4");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    logship::LogshipConfig config;
    if (!FLAGS_config.empty()) {
        auto loaded = logship::load_config(FLAGS_config);
        if (!loaded) {
            return 1;
        }
        config = *loaded;
    }
    logship::apply_env_overrides(config);

    if (!FLAGS_dsn.empty()) config.sink.dsn = FLAGS_dsn;
    if (FLAGS_queue_capacity > 0) config.pipeline.queue_capacity = FLAGS_queue_capacity;
    if (FLAGS_batch_size > 0) config.pipeline.batch_size = FLAGS_batch_size;
    if (FLAGS_flush_interval_ms > 0) {
        config.pipeline.flush_interval = std::chrono::milliseconds(FLAGS_flush_interval_ms);
    }
    log_config(config);

    // Pipeline, layer and sink are released inside run_load, before glog shuts down
    int rc = run_load(config);

    gflags::ShutDownCommandLineFlags();
    google::ShutdownGoogleLogging();
    return rc;
}
