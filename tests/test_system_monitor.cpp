#include <gtest/gtest.h>
#include <managers/system_monitor.hpp>
#include <atomic>
#include <chrono>
#include <thread>

namespace {

TaskResult probe_output(const std::string& label, const std::string& stdout_data, int exit_code = 0) {
    TaskResult r;
    r.host_label = label;
    r.exit_code = exit_code;
    r.stdout_data = stdout_data;
    return r;
}

const char* FULL_PROBE =
    "=== SYSTEM INFO ===\n"
    "CPU: 3.2\n"
    "Memory: 1.1Gi/7.7Gi\n"
    "Disk: 42%\n"
    "Load:  0.08, 0.03, 0.01\n";

} // namespace

TEST(SystemMonitor, ParsesEveryField) {
    auto m = SystemMonitor::parse_metrics(probe_output("web1", FULL_PROBE));
    EXPECT_TRUE(m.ok);
    EXPECT_EQ(m.host_label, "web1");
    EXPECT_EQ(m.cpu, "3.2");
    EXPECT_EQ(m.memory, "1.1Gi/7.7Gi");
    EXPECT_EQ(m.disk, "42%");
    EXPECT_EQ(m.load, "0.08, 0.03, 0.01");
}

TEST(SystemMonitor, MissingLinesAreNotAvailable) {
    auto m = SystemMonitor::parse_metrics(probe_output("web1", "=== SYSTEM INFO ===\nCPU: 7\n"));
    EXPECT_TRUE(m.ok);
    EXPECT_EQ(m.cpu, "7");
    EXPECT_EQ(m.memory, "N/A");
    EXPECT_EQ(m.disk, "N/A");
    EXPECT_EQ(m.load, "N/A");
}

TEST(SystemMonitor, LineWithoutSeparatorIsNotAvailable) {
    auto m = SystemMonitor::parse_metrics(probe_output("web1", "header\nCPU 7\nMemory: 1G\n"));
    EXPECT_EQ(m.cpu, "N/A");
    EXPECT_EQ(m.memory, "1G");
}

TEST(SystemMonitor, FailedResultIsMarkedNotOk) {
    auto m = SystemMonitor::parse_metrics(probe_output("web1", "", 1));
    EXPECT_FALSE(m.ok);
    EXPECT_EQ(m.error, "exit code 1");

    TaskResult unreachable = probe_output("db1", "", NO_EXIT_STATUS);
    unreachable.error = "Connection refused";
    auto n = SystemMonitor::parse_metrics(unreachable);
    EXPECT_FALSE(n.ok);
    EXPECT_EQ(n.error, "Connection refused");
}

TEST(SystemMonitor, ProbeRunsThroughRunner) {
    std::string seen_command;
    SystemMonitor monitor(
        [&](const std::vector<std::string>& labels, const std::string& command) {
            seen_command = command;
            std::vector<TaskResult> out;
            for (const auto& l : labels) out.push_back(probe_output(l, FULL_PROBE));
            return out;
        },
        std::chrono::milliseconds(10));

    auto metrics = monitor.poll_once({"web2", "web1"});
    ASSERT_EQ(metrics.size(), 2u);
    EXPECT_EQ(metrics[0].host_label, "web1");
    EXPECT_EQ(seen_command, SystemMonitor::probe_command());
    EXPECT_NE(seen_command.find("df -h /"), std::string::npos);
}

TEST(SystemMonitor, RunForPollsUntilDurationElapses) {
    std::atomic<int> snapshots{0};
    SystemMonitor monitor(
        [](const std::vector<std::string>& labels, const std::string&) {
            std::vector<TaskResult> out;
            for (const auto& l : labels) out.push_back(probe_output(l, FULL_PROBE));
            return out;
        },
        std::chrono::milliseconds(50),
        [&](const std::vector<HostMetrics>& m) {
            EXPECT_EQ(m.size(), 1u);
            snapshots++;
        });

    auto start = std::chrono::steady_clock::now();
    monitor.run_for({"web1"}, std::chrono::milliseconds(220));
    auto took = std::chrono::steady_clock::now() - start;

    EXPECT_GE(snapshots.load(), 3);
    EXPECT_LE(snapshots.load(), 6);
    EXPECT_EQ(monitor.rounds(), static_cast<size_t>(snapshots.load()));
    EXPECT_LT(took, std::chrono::seconds(2));
    EXPECT_FALSE(monitor.running());
}

TEST(SystemMonitor, StopEndsBackgroundPollingPromptly) {
    std::atomic<int> rounds{0};
    SystemMonitor monitor(
        [&](const std::vector<std::string>&, const std::string&) {
            rounds++;
            return std::vector<TaskResult>{};
        },
        std::chrono::seconds(30));

    ASSERT_TRUE(monitor.start({"web1"}));
    EXPECT_FALSE(monitor.start({"web1"}));

    // Give the first round a chance, then stop mid-sleep
    for (int i = 0; i < 100 && rounds == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    auto start = std::chrono::steady_clock::now();
    monitor.stop();
    auto took = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(rounds.load(), 1);
    EXPECT_FALSE(monitor.running());
    EXPECT_LT(took, std::chrono::seconds(1));
}

TEST(SystemMonitor, ThrowingCallbackDoesNotStopPolling) {
    SystemMonitor monitor(
        [](const std::vector<std::string>&, const std::string&) {
            return std::vector<TaskResult>{};
        },
        std::chrono::milliseconds(20),
        [](const std::vector<HostMetrics>&) { throw std::runtime_error("render failed"); });

    monitor.run_for({}, std::chrono::milliseconds(100));
    EXPECT_GE(monitor.rounds(), 2u);
}
