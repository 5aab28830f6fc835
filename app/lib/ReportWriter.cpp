/*
 * Report writer implementation
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "ReportWriter.hpp"

#include <filesystem>
#include <fstream>

#include <spdlog/fmt/fmt.h>

namespace ReportWriter {

Json::Value summary_to_json(const DispatchReport& report)
{
    Json::Value root(Json::objectValue);
    for (const auto& [name, entry] : report.summary()) {
        Json::Value node(Json::objectValue);
        node["success_count"] = entry.success_count;
        node["percent_success"] = entry.percent_success;
        node["total_runs"] = entry.total_runs;
        root[name] = node;
    }
    return root;
}

Json::Value responses_to_json(const DispatchReport& report)
{
    Json::Value root(Json::objectValue);
    for (const auto& name : report.job_names) {
        Json::Value list(Json::arrayValue);
        auto it = report.responses.find(name);
        if (it != report.responses.end()) {
            for (const auto& payload : it->second) {
                list.append(payload);
            }
        }
        root[name] = list;
    }
    return root;
}

std::string format_summary(const DispatchReport& report)
{
    std::string out = "\n--- FINAL REPORT ---\n";
    out += fmt::format("Based on {} interaction(s) per model.\n\n", report.iterations);
    for (const auto& [name, entry] : report.summary()) {
        out += fmt::format("{}: {} ({:.2f}% success)\n", name, entry.success_count, entry.percent_success);
    }
    if (report.cancelled) {
        out += "Run was cancelled before all batches completed.\n";
    }
    out += "--------------------\n";
    return out;
}

std::optional<std::string> write_json_file(const std::string& path, const Json::Value& value)
{
    try {
        const auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    } catch (const std::filesystem::filesystem_error& ex) {
        return std::string("cannot create directory for ") + path + ": " + ex.what();
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return "cannot open " + path + " for writing";
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    out << Json::writeString(builder, value) << '\n';
    if (!out) {
        return "failed writing " + path;
    }
    return std::nullopt;
}

} // namespace ReportWriter
