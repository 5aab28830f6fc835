/*
 * Performance metrics data model
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef METRICS_TYPES_HPP
#define METRICS_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

struct StreamMetadata;

inline constexpr const char* kInputTokensDimension = "input_tokens";

/**
 * Online mean, variance and range of a scalar stream (Welford's algorithm)
 */
struct RunningStat {
    int64_t count{0};
    double mean{0.0};
    double m2{0.0};                          // Sum of squared deviations from the mean
    double min{0.0};
    double max{0.0};

    void update(double value);

    /**
     * Population variance, zero when empty
     */
    double variance() const;
    double stddev() const;
};

/**
 * The per-request figures tracked for a model or a bucket
 */
struct RunningAggregatedStats {
    int64_t total_requests{0};
    RunningStat ttft_ms;
    RunningStat tokens_per_second;
    RunningStat input_tokens;
    RunningStat output_tokens;
    RunningStat total_duration_ms;

    /**
     * Fold one completed exchange into every substat
     */
    void update(const StreamMetadata& meta, int64_t ttft);

    /**
     * True when total_requests is non-negative and equals every substat count
     */
    bool is_consistent() const;
};

struct PerformanceBucket {
    std::string dimension{kInputTokensDimension};
    std::string bucket;
    RunningAggregatedStats stats;
};

struct ModelMetrics {
    std::string model_name;
    std::chrono::system_clock::time_point last_updated_utc{};
    RunningAggregatedStats overall_stats;
    std::vector<PerformanceBucket> performance_buckets;
};

/**
 * Bucket label for a prompt size: 0-256, 257-1024, 1025-4096, 4097-8192, 8192+
 */
std::string bucket_for_input_tokens(int input_tokens);

/**
 * Output tokens per second, zero when the eval duration is zero
 */
double tokens_per_second(int eval_count, int64_t eval_duration_ns);

namespace MetricsJson {

Json::Value to_json(const RunningStat& stat);
Json::Value to_json(const RunningAggregatedStats& stats);
Json::Value to_json(const ModelMetrics& metrics);

RunningStat running_stat_from_json(const Json::Value& node);
RunningAggregatedStats aggregated_stats_from_json(const Json::Value& node);

/**
 * @return Metrics, or std::nullopt when the node is not a model document
 *         or its counts disagree (substat counts, bucket totals)
 */
std::optional<ModelMetrics> model_metrics_from_json(const Json::Value& node);

/**
 * RFC 3339 UTC timestamp with second precision, e.g. "2024-05-01T12:00:00Z"
 */
std::string format_utc(std::chrono::system_clock::time_point time);
std::optional<std::chrono::system_clock::time_point> parse_utc(const std::string& text);

} // namespace MetricsJson

#endif // METRICS_TYPES_HPP
