#include "result_ledger.hpp"
#include <core/utils.hpp>
#include <core/log.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

static LedgerSummary summarize(const std::vector<TaskResult>& results) {
    LedgerSummary s;
    s.total = results.size();
    for (const auto& r : results) {
        if (r.success()) s.succeeded++;
    }
    s.failed = s.total - s.succeeded;
    return s;
}

void ResultLedger::append(const std::vector<TaskResult>& results) {
    std::lock_guard<std::mutex> lock(mutex_);
    results_.insert(results_.end(), results.begin(), results.end());
}

void ResultLedger::append(const TaskResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    results_.push_back(result);
}

std::vector<TaskResult> ResultLedger::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_;
}

size_t ResultLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.size();
}

LedgerSummary ResultLedger::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return summarize(results_);
}

void ResultLedger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    results_.clear();
}

Result<void> ResultLedger::save(const fs::path& path) const {
    auto results = snapshot();
    LedgerSummary s = summarize(results);

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "generated_at" << YAML::Value << now_iso();

    out << YAML::Key << "summary" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "total" << YAML::Value << s.total;
    out << YAML::Key << "succeeded" << YAML::Value << s.succeeded;
    out << YAML::Key << "failed" << YAML::Value << s.failed;
    out << YAML::EndMap;

    out << YAML::Key << "results" << YAML::Value << YAML::BeginSeq;
    for (const auto& r : results) {
        out << YAML::BeginMap;
        out << YAML::Key << "host" << YAML::Value << r.host_label;
        out << YAML::Key << "hostname" << YAML::Value << r.hostname;
        out << YAML::Key << "command" << YAML::Value << r.command;
        out << YAML::Key << "success" << YAML::Value << r.success();
        out << YAML::Key << "exit_code" << YAML::Value << r.exit_code;
        out << YAML::Key << "elapsed" << YAML::Value << r.elapsed_secs();
        out << YAML::Key << "stdout" << YAML::Value << r.stdout_data;
        out << YAML::Key << "stderr" << YAML::Value << r.stderr_data;
        out << YAML::Key << "error" << YAML::Value << r.error;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);

    std::ofstream fout(path);
    if (!fout) {
        return Result<void>::Err(fmt::format("Cannot write {}", path.string()));
    }
    fout << out.c_str() << "\n";
    log_info(fmt::format("Saved {} result(s) to {}", s.total, path.string()));
    return Result<void>::Ok();
}
