/*
 * Batch dispatcher implementation
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "BatchDispatcher.hpp"
#include "Logger.hpp"
#include "ProviderUtils.hpp"
#include "WorkQueue.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

std::map<std::string, JobSummary> DispatchReport::summary() const
{
    std::map<std::string, JobSummary> result;
    for (const auto& name : job_names) {
        JobSummary entry;
        auto it = success_counts.find(name);
        entry.success_count = it != success_counts.end() ? it->second : 0;
        auto runs = runs_per_iteration.find(name);
        entry.total_runs = iterations * (runs != runs_per_iteration.end() ? runs->second : 1);
        if (entry.total_runs > 0) {
            entry.percent_success = static_cast<double>(entry.success_count) /
                                    static_cast<double>(entry.total_runs) * 100.0;
        }
        result[name] = entry;
    }
    return result;
}

BatchDispatcher::BatchDispatcher(std::vector<Host> hosts,
                                 JobExecutor executor,
                                 SuccessClassifier classifier,
                                 ResetHook reset,
                                 DispatchOptions options)
    : hosts_(std::move(hosts))
    , executor_(std::move(executor))
    , classifier_(std::move(classifier))
    , reset_(std::move(reset))
    , options_(options)
{
    if (hosts_.empty()) {
        throw std::invalid_argument("BatchDispatcher requires at least one host");
    }
    if (!executor_) {
        throw std::invalid_argument("BatchDispatcher requires a job executor");
    }
}

Json::Value BatchDispatcher::make_error_payload(const std::string& message)
{
    Json::Value payload(Json::objectValue);
    payload["error"] = message;
    return payload;
}

JobResult BatchDispatcher::classify(const DispatchJob& job,
                                    const JobExecution& execution,
                                    const SuccessClassifier& classifier)
{
    JobResult result;
    result.job_name = job.name;
    result.iteration = job.iteration;
    result.batch = job.batch;

    if (!execution.transport_ok) {
        result.payload = make_error_payload("request error: " + execution.error);
        return result;
    }

    auto parsed = ProviderUtils::parse_json(execution.body);
    if (execution.status_code < 200 || execution.status_code >= 300) {
        // Keep the backend's own error document when it sent one.
        if (parsed) {
            result.payload = *parsed;
        } else {
            result.payload = make_error_payload("status " + std::to_string(execution.status_code) + ": " +
                                                ProviderUtils::trim(execution.body));
        }
        return result;
    }

    if (!parsed) {
        result.payload = make_error_payload("unparsable response body: " + ProviderUtils::trim(execution.body));
        return result;
    }

    result.payload = *parsed;
    result.success = classifier ? classifier(execution.body) : true;
    return result;
}

void BatchDispatcher::run_reset(const CancellationToken& cancel) const
{
    if (!reset_) {
        return;
    }
    try {
        reset_(cancel);
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("dispatch_logger")) {
            logger->error("Reset between batches failed: {}", ex.what());
        }
    }
}

void BatchDispatcher::run_batch(const std::vector<DispatchJob>& batch,
                                const CancellationToken& cancel,
                                DispatchReport& report) const
{
    auto logger = Logger::get_logger("dispatch_logger");
    const int iteration = batch.front().iteration;
    const int batch_index = batch.front().batch;

    WorkQueue<DispatchJob> jobs;
    WorkQueue<JobResult> results;

    std::vector<std::thread> workers;
    workers.reserve(hosts_.size());
    for (std::size_t w = 0; w < hosts_.size(); ++w) {
        workers.emplace_back([this, w, &jobs, &results, &cancel]() {
            const Host& host = hosts_[w];
            const int worker_id = static_cast<int>(w);
            auto worker_logger = Logger::get_logger("dispatch_logger");
            if (worker_logger) {
                worker_logger->debug("[Worker {} | Host {}] Waiting for jobs", worker_id, host.identifier());
            }

            DispatchJob job;
            while (jobs.pop(job)) {
                if (worker_logger) {
                    worker_logger->info("[Worker {} | Host {}] Starting job {}", worker_id, host.identifier(), job.name);
                }

                JobResult result;
                const CancellationToken job_cancel = cancel.child();
                try {
                    result = classify(job, executor_(job, host, worker_id, job_cancel), classifier_);
                } catch (const std::exception& ex) {
                    result = classify(job, JobExecution::transport_error(ex.what()), classifier_);
                } catch (...) {
                    result = classify(job, JobExecution::transport_error("unknown executor failure"), classifier_);
                }
                result.host = host.identifier();
                result.worker_id = worker_id;

                if (worker_logger) {
                    worker_logger->info("[Worker {} | Host {}] Finished job {} (success: {})",
                                        worker_id, host.identifier(), job.name, result.success);
                }
                results.push(std::move(result));
            }

            if (worker_logger) {
                worker_logger->debug("[Worker {} | Host {}] No more jobs, shutting down", worker_id, host.identifier());
            }
        });
    }

    for (const auto& job : batch) {
        jobs.push(job);
    }
    jobs.close();

    for (std::size_t k = 0; k < batch.size(); ++k) {
        JobResult result;
        if (!results.pop(result)) {
            break;
        }
        if (result.success) {
            ++report.success_counts[result.job_name];
        }
        report.responses[result.job_name].push_back(result.payload);

        if (logger) {
            logger->info("[Iter {}, Batch {}] Collected result {}/{} (job: {}, host: {}, success: {})",
                         iteration + 1, batch_index + 1, k + 1, batch.size(),
                         result.job_name, result.host, result.success);
        }
        report.results.push_back(std::move(result));
    }

    for (auto& worker : workers) {
        worker.join();
    }
    report.batch_sizes.push_back(batch.size());
}

DispatchReport BatchDispatcher::run(const std::vector<std::string>& job_names, const CancellationToken& cancel) const
{
    auto logger = Logger::get_logger("dispatch_logger");

    DispatchReport report;
    report.iterations = options_.iterations > 0 ? options_.iterations : 0;
    for (const auto& name : job_names) {
        ++report.runs_per_iteration[name];
        if (report.success_counts.emplace(name, 0).second) {
            report.job_names.push_back(name);
            report.responses[name];
        }
    }

    const std::size_t batch_capacity = hosts_.size();
    const std::size_t total_batches = (job_names.size() + batch_capacity - 1) / batch_capacity;

    if (logger) {
        logger->info("Dispatching {} job(s) across {} host(s), {} iteration(s), {} batch(es) per iteration",
                     job_names.size(), batch_capacity, report.iterations, total_batches);
    }

    run_reset(cancel);

    for (int i = 0; i < report.iterations; ++i) {
        if (logger) {
            logger->info("--- Starting iteration {}/{} ---", i + 1, report.iterations);
        }

        for (std::size_t start = 0; start < job_names.size(); start += batch_capacity) {
            if (cancel.is_cancelled()) {
                report.cancelled = true;
                if (logger) {
                    logger->warn("Run cancelled, skipping remaining batches");
                }
                return report;
            }

            const std::size_t end = std::min(start + batch_capacity, job_names.size());
            const int batch_index = static_cast<int>(start / batch_capacity);
            std::vector<DispatchJob> batch;
            batch.reserve(end - start);
            for (std::size_t j = start; j < end; ++j) {
                batch.push_back({job_names[j], i, batch_index, options_.job_timeout_ms});
            }

            if (logger) {
                logger->info("[Iter {}] Processing batch {}/{} (jobs {}-{})",
                             i + 1, batch_index + 1, total_batches, start + 1, end);
            }
            run_batch(batch, cancel, report);
            run_reset(cancel);
        }
    }

    report.cancelled = cancel.is_cancelled();
    return report;
}
