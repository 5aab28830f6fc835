/*
 * End-of-run report and response archive output
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef REPORT_WRITER_HPP
#define REPORT_WRITER_HPP

#include "BatchDispatcher.hpp"

#include <optional>
#include <string>

namespace ReportWriter {

/**
 * {job: {"success_count", "percent_success", "total_runs"}}
 */
Json::Value summary_to_json(const DispatchReport& report);

/**
 * {job: [payload, ...]} in collection order
 */
Json::Value responses_to_json(const DispatchReport& report);

/**
 * Human-readable summary, one line per job
 */
std::string format_summary(const DispatchReport& report);

/**
 * Write pretty-printed JSON, creating parent directories
 * @return Error message on failure
 */
std::optional<std::string> write_json_file(const std::string& path, const Json::Value& value);

} // namespace ReportWriter

#endif // REPORT_WRITER_HPP
