#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct LedgerSummary {
    size_t total = 0;
    size_t succeeded = 0;
    size_t failed = 0;
};

// Append-only history of every TaskResult produced by the facade, in the
// order batches completed. Thread-safe.
class ResultLedger {
public:
    void append(const std::vector<TaskResult>& results);
    void append(const TaskResult& result);

    std::vector<TaskResult> snapshot() const;
    size_t size() const;
    LedgerSummary summary() const;
    void clear();

    // Write the ledger as YAML (summary + one map per result).
    Result<void> save(const fs::path& path) const;

private:
    mutable std::mutex mutex_;
    std::vector<TaskResult> results_;
};
