/*
 * Performance metrics data model implementation
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "MetricsTypes.hpp"
#include "IChatProvider.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

void RunningStat::update(double value)
{
    ++count;
    if (count == 1) {
        min = value;
        max = value;
    } else {
        if (value < min) {
            min = value;
        }
        if (value > max) {
            max = value;
        }
    }

    const double delta = value - mean;
    mean += delta / static_cast<double>(count);
    const double delta2 = value - mean;
    m2 += delta * delta2;
}

double RunningStat::variance() const
{
    if (count < 1) {
        return 0.0;
    }
    return m2 / static_cast<double>(count);
}

double RunningStat::stddev() const
{
    return std::sqrt(variance());
}

void RunningAggregatedStats::update(const StreamMetadata& meta, int64_t ttft)
{
    ++total_requests;
    ttft_ms.update(static_cast<double>(ttft));
    tokens_per_second.update(::tokens_per_second(meta.eval_count, meta.eval_duration));
    input_tokens.update(static_cast<double>(meta.prompt_eval_count));
    output_tokens.update(static_cast<double>(meta.eval_count));
    total_duration_ms.update(static_cast<double>(meta.total_duration / 1000000));
}

bool RunningAggregatedStats::is_consistent() const
{
    if (total_requests < 0) {
        return false;
    }
    for (const RunningStat* stat : {&ttft_ms, &tokens_per_second, &input_tokens,
                                    &output_tokens, &total_duration_ms}) {
        if (stat->count != total_requests || stat->m2 < 0.0) {
            return false;
        }
    }
    return true;
}

std::string bucket_for_input_tokens(int input_tokens)
{
    if (input_tokens <= 256) {
        return "0-256";
    }
    if (input_tokens <= 1024) {
        return "257-1024";
    }
    if (input_tokens <= 4096) {
        return "1025-4096";
    }
    if (input_tokens <= 8192) {
        return "4097-8192";
    }
    return "8192+";
}

double tokens_per_second(int eval_count, int64_t eval_duration_ns)
{
    if (eval_duration_ns <= 0) {
        return 0.0;
    }
    return static_cast<double>(eval_count) / (static_cast<double>(eval_duration_ns) / 1e9);
}

namespace MetricsJson {

namespace {

double double_field(const Json::Value& node, const char* key)
{
    const Json::Value& value = node[key];
    return value.isNumeric() ? value.asDouble() : 0.0;
}

int64_t int64_field(const Json::Value& node, const char* key)
{
    const Json::Value& value = node[key];
    // Out-of-range numbers read as 0 and fail the consistency checks
    return value.isInt64() ? value.asInt64() : 0;
}

const Json::Value& object_field(const Json::Value& node, const char* key)
{
    static const Json::Value empty(Json::objectValue);
    const Json::Value& value = node[key];
    return value.isObject() ? value : empty;
}

} // namespace

Json::Value to_json(const RunningStat& stat)
{
    Json::Value node(Json::objectValue);
    node["count"] = static_cast<Json::Int64>(stat.count);
    node["mean"] = stat.mean;
    node["m2"] = stat.m2;
    node["min"] = stat.min;
    node["max"] = stat.max;
    node["stddev"] = stat.stddev();
    return node;
}

Json::Value to_json(const RunningAggregatedStats& stats)
{
    Json::Value node(Json::objectValue);
    node["total_requests"] = static_cast<Json::Int64>(stats.total_requests);
    node["ttft_ms"] = to_json(stats.ttft_ms);
    node["tokens_per_second"] = to_json(stats.tokens_per_second);
    node["input_tokens"] = to_json(stats.input_tokens);
    node["output_tokens"] = to_json(stats.output_tokens);
    node["total_duration_ms"] = to_json(stats.total_duration_ms);
    return node;
}

Json::Value to_json(const ModelMetrics& metrics)
{
    Json::Value node(Json::objectValue);
    node["model_name"] = metrics.model_name;
    node["last_updated_utc"] = format_utc(metrics.last_updated_utc);
    node["overall_stats"] = to_json(metrics.overall_stats);

    Json::Value buckets(Json::arrayValue);
    for (const auto& bucket : metrics.performance_buckets) {
        Json::Value entry(Json::objectValue);
        entry["dimension"] = bucket.dimension;
        entry["bucket"] = bucket.bucket;
        entry["stats"] = to_json(bucket.stats);
        buckets.append(entry);
    }
    node["performance_buckets"] = buckets;
    return node;
}

RunningStat running_stat_from_json(const Json::Value& node)
{
    RunningStat stat;
    if (!node.isObject()) {
        return stat;
    }
    stat.count = int64_field(node, "count");
    stat.mean = double_field(node, "mean");
    stat.m2 = double_field(node, "m2");
    stat.min = double_field(node, "min");
    stat.max = double_field(node, "max");
    return stat;
}

RunningAggregatedStats aggregated_stats_from_json(const Json::Value& node)
{
    RunningAggregatedStats stats;
    if (!node.isObject()) {
        return stats;
    }
    stats.total_requests = int64_field(node, "total_requests");
    stats.ttft_ms = running_stat_from_json(node["ttft_ms"]);
    stats.tokens_per_second = running_stat_from_json(node["tokens_per_second"]);
    stats.input_tokens = running_stat_from_json(node["input_tokens"]);
    stats.output_tokens = running_stat_from_json(node["output_tokens"]);
    stats.total_duration_ms = running_stat_from_json(node["total_duration_ms"]);
    return stats;
}

std::optional<ModelMetrics> model_metrics_from_json(const Json::Value& node)
{
    if (!node.isObject() || !node["model_name"].isString()) {
        return std::nullopt;
    }

    ModelMetrics metrics;
    metrics.model_name = node["model_name"].asString();
    if (node["last_updated_utc"].isString()) {
        if (auto parsed = parse_utc(node["last_updated_utc"].asString())) {
            metrics.last_updated_utc = *parsed;
        }
    }
    metrics.overall_stats = aggregated_stats_from_json(object_field(node, "overall_stats"));
    if (!metrics.overall_stats.is_consistent()) {
        return std::nullopt;
    }

    const Json::Value& buckets = node["performance_buckets"];
    if (buckets.isArray()) {
        for (const auto& entry : buckets) {
            if (!entry.isObject() || !entry["bucket"].isString()) {
                continue;
            }
            PerformanceBucket bucket;
            if (entry["dimension"].isString()) {
                bucket.dimension = entry["dimension"].asString();
            }
            bucket.bucket = entry["bucket"].asString();
            bucket.stats = aggregated_stats_from_json(object_field(entry, "stats"));
            if (!bucket.stats.is_consistent()) {
                return std::nullopt;
            }
            metrics.performance_buckets.push_back(std::move(bucket));
        }
    }

    int64_t bucketed = 0;
    for (const auto& bucket : metrics.performance_buckets) {
        if (bucket.stats.total_requests > metrics.overall_stats.total_requests - bucketed) {
            return std::nullopt;
        }
        bucketed += bucket.stats.total_requests;
    }
    if (bucketed != metrics.overall_stats.total_requests) {
        return std::nullopt;
    }
    return metrics;
}

std::string format_utc(std::chrono::system_clock::time_point time)
{
    const std::time_t raw = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&raw, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

std::optional<std::chrono::system_clock::time_point> parse_utc(const std::string& text)
{
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

} // namespace MetricsJson
