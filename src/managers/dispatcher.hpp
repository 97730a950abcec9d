#pragma once

#include <functional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/constants.hpp>

// Fans one operation out over a set of inventory labels with at most
// `concurrency` running at once. Results come back in completion order;
// correlate by TaskResult::host_label, not position.
class ParallelDispatcher {
public:
    using Operation = std::function<TaskResult(const std::string& label, const HostIdentity& host)>;

    explicit ParallelDispatcher(Inventory inventory,
                                int default_concurrency = DEFAULT_MAX_CONCURRENT);

    // One result per label present in the inventory; unknown labels are
    // skipped. An operation that throws yields a failed result for that host
    // only. on_result runs on the calling thread once per completed unit with
    // (result, completed, total); if it throws the error is logged and ignored.
    // concurrency <= 0 uses the default.
    std::vector<TaskResult> run_over_hosts(const std::vector<std::string>& labels,
                                           const Operation& operation,
                                           int concurrency = 0,
                                           const ResultCallback& on_result = nullptr) const;

    const Inventory& inventory() const { return inventory_; }
    int default_concurrency() const { return default_concurrency_; }

private:
    Inventory inventory_;
    int default_concurrency_;
};
