/*
 * Unit tests for the report writer
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include "ProviderUtils.hpp"
#include "ReportWriter.hpp"
#include "TestHelpers.hpp"

using Catch::Approx;

namespace {

DispatchReport sample_report()
{
    DispatchReport report;
    report.iterations = 3;
    report.job_names = {"llama3.2:1b", "qwen3:1.7b"};
    report.success_counts = {{"llama3.2:1b", 2}, {"qwen3:1.7b", 0}};

    Json::Value ok(Json::objectValue);
    ok["model"] = "llama3.2:1b";
    report.responses["llama3.2:1b"] = {ok, ok, BatchDispatcher::make_error_payload("status 500: boom")};
    return report;
}

} // namespace

// =============================================================================
// Report formatting Tests
// =============================================================================

TEST_CASE("ReportWriter summarizes success against the configured iterations") {
    auto summary = ReportWriter::summary_to_json(sample_report());

    REQUIRE(summary["llama3.2:1b"]["success_count"].asInt() == 2);
    REQUIRE(summary["llama3.2:1b"]["total_runs"].asInt() == 3);
    REQUIRE(summary["llama3.2:1b"]["percent_success"].asDouble() == Approx(66.6667).epsilon(0.001));
    REQUIRE(summary["qwen3:1.7b"]["success_count"].asInt() == 0);
    REQUIRE(summary["qwen3:1.7b"]["percent_success"].asDouble() == Approx(0.0));
}

TEST_CASE("ReportWriter lists responses per job including empty jobs") {
    auto responses = ReportWriter::responses_to_json(sample_report());

    REQUIRE(responses["llama3.2:1b"].size() == 3);
    REQUIRE(responses["llama3.2:1b"][2]["error"].asString() == "status 500: boom");
    REQUIRE(responses["qwen3:1.7b"].isArray());
    REQUIRE(responses["qwen3:1.7b"].empty());
}

TEST_CASE("ReportWriter formats a readable summary") {
    auto report = sample_report();
    auto text = ReportWriter::format_summary(report);

    REQUIRE(text.find("--- FINAL REPORT ---") != std::string::npos);
    REQUIRE(text.find("llama3.2:1b: 2 (66.67% success)") != std::string::npos);
    REQUIRE(text.find("qwen3:1.7b: 0 (0.00% success)") != std::string::npos);
    REQUIRE(text.find("cancelled") == std::string::npos);

    report.cancelled = true;
    REQUIRE(ReportWriter::format_summary(report).find("cancelled") != std::string::npos);
}

// =============================================================================
// File output Tests
// =============================================================================

TEST_CASE("ReportWriter writes JSON into new directories") {
    TempDir dir;
    const auto path = dir.path() / "nested" / "reports" / "report.json";

    auto error = ReportWriter::write_json_file(path.string(), ReportWriter::summary_to_json(sample_report()));

    REQUIRE_FALSE(error.has_value());
    auto parsed = ProviderUtils::parse_json(read_file(path));
    REQUIRE(parsed.has_value());
    REQUIRE((*parsed)["llama3.2:1b"]["success_count"].asInt() == 2);
}

TEST_CASE("ReportWriter reports unwritable paths") {
    TempDir dir;
    const auto blocker = dir.path() / "file";
    write_file(blocker, "x");

    auto error = ReportWriter::write_json_file((blocker / "report.json").string(), Json::Value(Json::objectValue));

    REQUIRE(error.has_value());
}
