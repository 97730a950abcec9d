#include "dispatcher.hpp"
#include <core/log.hpp>
#include <core/thread_pool.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace {

struct Job {
    std::string label;
    HostIdentity host;
};

TaskResult failed_result(const Job& job, const std::string& error) {
    TaskResult failed;
    failed.host_label = job.label;
    failed.hostname = job.host.hostname();
    failed.exit_code = NO_EXIT_STATUS;
    failed.error = error.empty() ? "operation failed" : error;
    return failed;
}

TaskResult run_guarded(const ParallelDispatcher::Operation& operation, const Job& job) {
    try {
        return operation(job.label, job.host);
    } catch (const std::exception& e) {
        log_error(fmt::format("Error processing result of {}: {}", job.label, e.what()));
        return failed_result(job, e.what());
    } catch (...) {
        log_error(fmt::format("Error processing result of {}: unknown error", job.label));
        return failed_result(job, "unknown error");
    }
}

} // namespace

ParallelDispatcher::ParallelDispatcher(Inventory inventory, int default_concurrency)
    : inventory_(std::move(inventory)),
      default_concurrency_(std::max(1, default_concurrency)) {}

std::vector<TaskResult> ParallelDispatcher::run_over_hosts(const std::vector<std::string>& labels,
                                                           const Operation& operation,
                                                           int concurrency,
                                                           const ResultCallback& on_result) const {
    std::vector<Job> jobs;
    for (const auto& label : labels) {
        auto it = inventory_.find(label);
        if (it == inventory_.end()) {
            log_debug(fmt::format("dispatcher: skipping unknown host label '{}'", label));
            continue;
        }
        jobs.push_back(Job{label, it->second});
    }

    std::vector<TaskResult> results;
    if (jobs.empty()) return results;
    results.reserve(jobs.size());

    int limit = concurrency > 0 ? concurrency : default_concurrency_;
    size_t workers = std::min(static_cast<size_t>(limit), jobs.size());

    std::mutex done_mutex;
    std::condition_variable done_cv;
    std::deque<TaskResult> done;

    {
        WorkerPool pool(workers);
        for (const auto& job : jobs) {
            pool.submit([&operation, &done_mutex, &done_cv, &done, job] {
                TaskResult r = run_guarded(operation, job);
                {
                    std::lock_guard<std::mutex> lock(done_mutex);
                    done.push_back(std::move(r));
                }
                done_cv.notify_one();
            });
        }

        // First-done-first-collected
        for (size_t completed = 1; completed <= jobs.size(); ++completed) {
            TaskResult r;
            {
                std::unique_lock<std::mutex> lock(done_mutex);
                done_cv.wait(lock, [&] { return !done.empty(); });
                r = std::move(done.front());
                done.pop_front();
            }

            if (on_result) {
                try {
                    on_result(r, completed, jobs.size());
                } catch (const std::exception& e) {
                    log_error(fmt::format("Result callback failed for {}: {}", r.host_label, e.what()));
                } catch (...) {
                    log_error(fmt::format("Result callback failed for {}: unknown error", r.host_label));
                }
            }
            results.push_back(std::move(r));
        }
    }

    return results;
}
