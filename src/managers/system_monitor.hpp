#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>

struct HostMetrics {
    std::string host_label;
    std::string cpu = "N/A";
    std::string memory = "N/A";
    std::string disk = "N/A";
    std::string load = "N/A";
    bool ok = false;
    std::string error;      // set when ok == false
};

// Periodically runs a resource probe across hosts and hands each round of
// parsed metrics to a callback. The probe goes through the supplied runner,
// so whatever the runner records (e.g. the ledger) sees every sample.
class SystemMonitor {
public:
    using Runner = std::function<std::vector<TaskResult>(
        const std::vector<std::string>& labels, const std::string& command)>;
    using SnapshotCallback = std::function<void(const std::vector<HostMetrics>&)>;

    SystemMonitor(Runner runner, std::chrono::milliseconds interval,
                  SnapshotCallback on_snapshot = nullptr);
    ~SystemMonitor();

    SystemMonitor(const SystemMonitor&) = delete;
    SystemMonitor& operator=(const SystemMonitor&) = delete;

    // Shell snippet printing a header line then CPU/Memory/Disk/Load lines.
    static const std::string& probe_command();

    // Field i comes from stdout line i+1, after the first ": ".
    static HostMetrics parse_metrics(const TaskResult& result);

    // One round; does not invoke the callback.
    std::vector<HostMetrics> poll_once(const std::vector<std::string>& labels);

    // Blocking: poll every interval until duration elapses or stop() is called.
    void run_for(const std::vector<std::string>& labels, std::chrono::milliseconds duration);

    // Background polling until stop(). Returns false if already running.
    bool start(const std::vector<std::string>& labels);
    void stop();

    bool running() const { return running_; }
    size_t rounds() const { return rounds_; }

private:
    void poll_loop(std::vector<std::string> labels,
                   std::chrono::steady_clock::time_point deadline);

    Runner runner_;
    std::chrono::milliseconds interval_;
    SnapshotCallback on_snapshot_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> rounds_{0};
    std::thread thread_;
};
