#include "system_monitor.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace {

const std::string METRICS_UNAVAILABLE = "N/A";
constexpr auto SLEEP_SLICE = std::chrono::milliseconds(100);

std::string field_after_colon(const std::vector<std::string>& lines, size_t index) {
    if (index >= lines.size()) return METRICS_UNAVAILABLE;
    const std::string& line = lines[index];
    auto pos = line.find(": ");
    if (pos == std::string::npos) return METRICS_UNAVAILABLE;
    return trimmed(line.substr(pos + 2));
}

} // namespace

SystemMonitor::SystemMonitor(Runner runner, std::chrono::milliseconds interval,
                             SnapshotCallback on_snapshot)
    : runner_(std::move(runner)),
      interval_(std::max(interval, std::chrono::milliseconds(1))),
      on_snapshot_(std::move(on_snapshot)) {}

SystemMonitor::~SystemMonitor() {
    stop();
}

const std::string& SystemMonitor::probe_command() {
    static const std::string cmd =
        "echo \"=== SYSTEM INFO ===\"\n"
        "echo \"CPU: $(top -bn1 | grep 'Cpu(s)' | awk '{print $2}' | sed 's/%us,//')\"\n"
        "echo \"Memory: $(free -h | grep '^Mem:' | awk '{print $3 \"/\" $2}')\"\n"
        "echo \"Disk: $(df -h / | tail -1 | awk '{print $5}')\"\n"
        "echo \"Load: $(uptime | awk -F'load average:' '{print $2}')\"\n";
    return cmd;
}

HostMetrics SystemMonitor::parse_metrics(const TaskResult& result) {
    HostMetrics m;
    m.host_label = result.host_label;
    if (!result.success()) {
        m.error = !result.error.empty()
            ? result.error
            : fmt::format("exit code {}", result.exit_code);
        return m;
    }

    auto lines = split_lines(trimmed(result.stdout_data));
    m.cpu = field_after_colon(lines, 1);
    m.memory = field_after_colon(lines, 2);
    m.disk = field_after_colon(lines, 3);
    m.load = field_after_colon(lines, 4);
    m.ok = true;
    return m;
}

std::vector<HostMetrics> SystemMonitor::poll_once(const std::vector<std::string>& labels) {
    std::vector<HostMetrics> metrics;
    for (const auto& r : runner_(labels, probe_command())) {
        metrics.push_back(parse_metrics(r));
    }
    std::sort(metrics.begin(), metrics.end(),
              [](const HostMetrics& a, const HostMetrics& b) { return a.host_label < b.host_label; });
    return metrics;
}

void SystemMonitor::run_for(const std::vector<std::string>& labels,
                            std::chrono::milliseconds duration) {
    if (running_.exchange(true)) {
        log_warn("monitor: already running");
        return;
    }
    poll_loop(labels, std::chrono::steady_clock::now() + duration);
    running_ = false;
}

bool SystemMonitor::start(const std::vector<std::string>& labels) {
    if (running_.exchange(true)) return false;
    if (thread_.joinable()) thread_.join();
    thread_ = std::thread(&SystemMonitor::poll_loop, this, labels,
                          std::chrono::steady_clock::time_point::max());
    log_info(fmt::format("monitor: started on {} host(s)", labels.size()));
    return true;
}

void SystemMonitor::stop() {
    bool was_running = running_.exchange(false);
    if (thread_.joinable()) thread_.join();
    if (was_running) log_info("monitor: stopped");
}

// ── Poll loop ───────────────────────────────────────────────

void SystemMonitor::poll_loop(std::vector<std::string> labels,
                              std::chrono::steady_clock::time_point deadline) {
    using clock = std::chrono::steady_clock;

    while (running_ && clock::now() < deadline) {
        auto snapshot = poll_once(labels);
        rounds_++;

        if (on_snapshot_) {
            try {
                on_snapshot_(snapshot);
            } catch (const std::exception& e) {
                log_warn(fmt::format("monitor: snapshot callback failed: {}", e.what()));
            }
        }

        // Sleep in short slices so stop() is prompt
        auto wake = clock::now() + interval_;
        while (running_) {
            auto now = clock::now();
            if (now >= wake || now >= deadline) break;
            auto remaining = std::min(wake, deadline) - now;
            std::this_thread::sleep_for(
                std::min<clock::duration>(remaining, SLEEP_SLICE));
        }
    }
}
