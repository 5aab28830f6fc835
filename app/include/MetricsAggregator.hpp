/*
 * Thread-safe per-model performance metrics aggregator
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef METRICS_AGGREGATOR_HPP
#define METRICS_AGGREGATOR_HPP

#include "MetricsTypes.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct StreamMetadata;

/**
 * Collects running statistics per model and persists them to a JSON file
 *
 * Construction loads any prior state from the file and starts a background
 * thread that saves every interval. close() stops the thread and performs a
 * final save. All access goes through one mutex, so record() may be called
 * from any number of worker threads.
 */
class MetricsAggregator {
public:
    /**
     * @param file_path Metrics file, created with its parent directories on save
     * @param save_interval Period of the background save; zero disables it
     */
    explicit MetricsAggregator(std::string file_path,
                               std::chrono::milliseconds save_interval = std::chrono::seconds(60));
    ~MetricsAggregator();

    MetricsAggregator(const MetricsAggregator&) = delete;
    MetricsAggregator& operator=(const MetricsAggregator&) = delete;

    /**
     * Fold one completed exchange into the model's overall stats and the
     * single bucket matching its prompt size
     */
    void record(const StreamMetadata& meta, int64_t ttft_ms);

    /**
     * Write the full state to disk (temporary file, then rename)
     * @return Error message on failure
     */
    std::optional<std::string> save() const;

    /**
     * Replace the in-memory state with the file's contents
     * @return Error message on failure; state is left unchanged
     */
    std::optional<std::string> load();

    /**
     * Stop the save thread and save once. Idempotent; later calls return
     * the first call's result.
     */
    std::optional<std::string> close();

    std::vector<ModelMetrics> snapshot() const;
    std::optional<ModelMetrics> metrics_for(const std::string& model) const;

    const std::string& file_path() const { return file_path_; }

private:
    void run_save_loop();

    const std::string file_path_;
    const std::chrono::milliseconds save_interval_;

    mutable std::mutex mutex_;
    std::map<std::string, ModelMetrics> metrics_;

    std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    bool stopping_{false};
    std::thread save_thread_;

    std::mutex close_mutex_;
    bool closed_{false};
    std::optional<std::string> close_result_;
};

using MetricsAggregatorPtr = std::shared_ptr<MetricsAggregator>;

#endif // METRICS_AGGREGATOR_HPP
