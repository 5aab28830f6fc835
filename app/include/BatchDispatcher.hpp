/*
 * Batched fan-out of jobs across a fixed pool of hosts
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef BATCH_DISPATCHER_HPP
#define BATCH_DISPATCHER_HPP

#include "AppConfig.hpp"
#include "CancellationToken.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

/**
 * One unit of work, identified by name (e.g., the model to exercise)
 */
struct DispatchJob {
    std::string name;
    int iteration{0};
    int batch{0};
    long timeout_ms{0};                      // Per-job network deadline, 0 for none
};

/**
 * What the executor observed for one job
 */
struct JobExecution {
    bool transport_ok{true};
    int status_code{0};
    std::string body;
    std::string error;                       // Set when transport_ok is false

    static JobExecution response(int status_code, std::string body)
    {
        JobExecution execution;
        execution.status_code = status_code;
        execution.body = std::move(body);
        return execution;
    }

    static JobExecution transport_error(std::string message)
    {
        JobExecution execution;
        execution.transport_ok = false;
        execution.error = std::move(message);
        return execution;
    }
};

/**
 * Outcome of one job. The payload is always valid JSON: the backend's
 * response or an {"error": "..."} object.
 */
struct JobResult {
    std::string job_name;
    bool success{false};
    Json::Value payload;
    std::string host;
    int worker_id{0};
    int iteration{0};
    int batch{0};
};

struct JobSummary {
    int success_count{0};
    double percent_success{0.0};
    int total_runs{0};
};

/**
 * Everything collected over a dispatch run
 */
struct DispatchReport {
    int iterations{0};
    bool cancelled{false};
    std::vector<std::string> job_names;                          // First-seen order
    std::map<std::string, int> success_counts;
    std::map<std::string, int> runs_per_iteration;                // Occurrences in the job list
    std::map<std::string, std::vector<Json::Value>> responses;   // Collection order
    std::vector<JobResult> results;
    std::vector<std::size_t> batch_sizes;

    /**
     * Per-job success count and percentage of planned runs. A job listed
     * k times runs k times per iteration; missing entries count once.
     */
    std::map<std::string, JobSummary> summary() const;
};

using JobExecutor = std::function<JobExecution(const DispatchJob& job,
                                               const Host& host,
                                               int worker_id,
                                               const CancellationToken& cancel)>;
using SuccessClassifier = std::function<bool(const std::string& payload)>;
using ResetHook = std::function<void(const CancellationToken& cancel)>;

struct DispatchOptions {
    int iterations{1};
    long job_timeout_ms{0};
};

/**
 * Runs jobs in batches of at most one job per host
 *
 * Each batch starts one worker thread per host; worker w serves host w.
 * The dispatcher collects exactly one result per job, joins the workers
 * and runs the reset hook before the next batch begins. A reset also runs
 * once before the first batch. Failures are recorded, never thrown.
 */
class BatchDispatcher {
public:
    BatchDispatcher(std::vector<Host> hosts,
                    JobExecutor executor,
                    SuccessClassifier classifier,
                    ResetHook reset = nullptr,
                    DispatchOptions options = {});

    /**
     * Execute every job options.iterations times
     * @param job_names Job identities, dispatched in order
     * @param cancel Run token; cancelling it aborts in-flight jobs and
     *        skips the batches not yet started
     */
    DispatchReport run(const std::vector<std::string>& job_names, const CancellationToken& cancel) const;

    /**
     * Turn an execution into a result payload and success flag
     */
    static JobResult classify(const DispatchJob& job,
                              const JobExecution& execution,
                              const SuccessClassifier& classifier);

    static Json::Value make_error_payload(const std::string& message);

private:
    void run_batch(const std::vector<DispatchJob>& batch,
                   const CancellationToken& cancel,
                   DispatchReport& report) const;
    void run_reset(const CancellationToken& cancel) const;

    std::vector<Host> hosts_;
    JobExecutor executor_;
    SuccessClassifier classifier_;
    ResetHook reset_;
    DispatchOptions options_;
};

#endif // BATCH_DISPATCHER_HPP
