/*
 * Metrics aggregator implementation
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "MetricsAggregator.hpp"
#include "IChatProvider.hpp"
#include "Logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

MetricsAggregator::MetricsAggregator(std::string file_path, std::chrono::milliseconds save_interval)
    : file_path_(std::move(file_path))
    , save_interval_(save_interval)
{
    if (auto error = load()) {
        if (auto logger = Logger::get_logger("metrics_logger")) {
            logger->debug("No prior metrics loaded: {}", *error);
        }
    }

    if (save_interval_.count() > 0) {
        save_thread_ = std::thread(&MetricsAggregator::run_save_loop, this);
    }
}

MetricsAggregator::~MetricsAggregator()
{
    if (auto error = close()) {
        if (auto logger = Logger::get_logger("metrics_logger")) {
            logger->error("Final metrics save failed: {}", *error);
        }
    }
}

void MetricsAggregator::run_save_loop()
{
    std::unique_lock<std::mutex> lock(timer_mutex_);
    while (!stopping_) {
        if (timer_cv_.wait_for(lock, save_interval_, [this] { return stopping_; })) {
            break;
        }
        lock.unlock();
        if (auto error = save()) {
            if (auto logger = Logger::get_logger("metrics_logger")) {
                logger->warn("Periodic metrics save failed, retrying next interval: {}", *error);
            }
        }
        lock.lock();
    }
}

void MetricsAggregator::record(const StreamMetadata& meta, int64_t ttft_ms)
{
    if (auto logger = Logger::get_logger("metrics_logger")) {
        logger->debug("Record called for model {}", meta.model);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& model_metrics = metrics_[meta.model];
    if (model_metrics.model_name.empty()) {
        model_metrics.model_name = meta.model;
    }
    model_metrics.last_updated_utc = std::chrono::system_clock::now();
    model_metrics.overall_stats.update(meta, ttft_ms);

    const std::string label = bucket_for_input_tokens(meta.prompt_eval_count);
    for (auto& bucket : model_metrics.performance_buckets) {
        if (bucket.dimension == kInputTokensDimension && bucket.bucket == label) {
            bucket.stats.update(meta, ttft_ms);
            return;
        }
    }

    PerformanceBucket bucket;
    bucket.bucket = label;
    bucket.stats.update(meta, ttft_ms);
    model_metrics.performance_buckets.push_back(std::move(bucket));
}

std::optional<std::string> MetricsAggregator::save() const
{
    if (auto logger = Logger::get_logger("metrics_logger")) {
        logger->debug("Saving metrics to {}", file_path_);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Json::Value root(Json::arrayValue);
    for (const auto& [name, model_metrics] : metrics_) {
        root.append(MetricsJson::to_json(model_metrics));
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    const std::string document = Json::writeString(builder, root);

    const fs::path target(file_path_);
    fs::path temp = target;
    temp += ".tmp";

    try {
        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path());
        }
        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out) {
                return "cannot open " + temp.string() + " for writing";
            }
            out << document;
            out.flush();
            if (!out) {
                return "failed writing " + temp.string();
            }
        }
        fs::rename(temp, target);
    } catch (const fs::filesystem_error& ex) {
        return std::string("failed to save metrics: ") + ex.what();
    }
    return std::nullopt;
}

std::optional<std::string> MetricsAggregator::load()
{
    std::ifstream in(file_path_, std::ios::binary);
    if (!in) {
        return "cannot open " + file_path_;
    }

    std::map<std::string, ModelMetrics> loaded;
    try {
        Json::CharReaderBuilder reader_builder;
        Json::Value root;
        std::string errors;
        if (!Json::parseFromStream(reader_builder, in, &root, &errors)) {
            return "malformed metrics file " + file_path_ + ": " + errors;
        }
        if (!root.isArray()) {
            return "metrics file " + file_path_ + " is not a JSON array";
        }

        for (Json::ArrayIndex i = 0; i < root.size(); ++i) {
            auto model_metrics = MetricsJson::model_metrics_from_json(root[i]);
            if (!model_metrics) {
                return "metrics file " + file_path_ + " has an invalid entry at index " + std::to_string(i);
            }
            const std::string name = model_metrics->model_name;
            loaded[name] = std::move(*model_metrics);
        }
    } catch (const Json::Exception& ex) {
        return "malformed metrics file " + file_path_ + ": " + ex.what();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    metrics_ = std::move(loaded);
    return std::nullopt;
}

std::optional<std::string> MetricsAggregator::close()
{
    std::lock_guard<std::mutex> close_lock(close_mutex_);
    if (closed_) {
        return close_result_;
    }
    closed_ = true;

    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        stopping_ = true;
    }
    timer_cv_.notify_all();
    if (save_thread_.joinable()) {
        save_thread_.join();
    }

    close_result_ = save();
    return close_result_;
}

std::vector<ModelMetrics> MetricsAggregator::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ModelMetrics> result;
    result.reserve(metrics_.size());
    for (const auto& [name, model_metrics] : metrics_) {
        result.push_back(model_metrics);
    }
    return result;
}

std::optional<ModelMetrics> MetricsAggregator::metrics_for(const std::string& model) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = metrics_.find(model);
    if (it == metrics_.end()) {
        return std::nullopt;
    }
    return it->second;
}
