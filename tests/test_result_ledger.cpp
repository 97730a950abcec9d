#include <gtest/gtest.h>
#include <managers/result_ledger.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

namespace {

TaskResult result(const std::string& label, int exit_code, const std::string& error = "") {
    TaskResult r;
    r.host_label = label;
    r.hostname = label + ".example";
    r.command = "uptime";
    r.exit_code = exit_code;
    r.error = error;
    r.stdout_data = "up 3 days\n";
    r.elapsed = std::chrono::milliseconds(1500);
    return r;
}

} // namespace

TEST(ResultLedger, PreservesAppendOrderAcrossBatches) {
    ResultLedger ledger;
    ledger.append(std::vector<TaskResult>{result("a", 0), result("b", 1)});
    ledger.append(result("c", 0));

    auto snap = ledger.snapshot();
    ASSERT_EQ(snap.size(), 3u);
    EXPECT_EQ(snap[0].host_label, "a");
    EXPECT_EQ(snap[1].host_label, "b");
    EXPECT_EQ(snap[2].host_label, "c");
}

TEST(ResultLedger, SummaryCountsSuccessAndFailure) {
    ResultLedger ledger;
    ledger.append(std::vector<TaskResult>{
        result("a", 0), result("b", 2), result("c", NO_EXIT_STATUS, "Connection refused"),
        result("d", 0)});

    auto s = ledger.summary();
    EXPECT_EQ(s.total, 4u);
    EXPECT_EQ(s.succeeded, 2u);
    EXPECT_EQ(s.failed, 2u);

    ledger.clear();
    EXPECT_EQ(ledger.size(), 0u);
}

TEST(ResultLedger, ConcurrentAppendsKeepEveryResult) {
    ResultLedger ledger;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&ledger, t] {
            for (int i = 0; i < 50; ++i) ledger.append(result("h" + std::to_string(t), 0));
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(ledger.size(), 200u);
}

TEST(ResultLedger, SaveWritesYamlReport) {
    ResultLedger ledger;
    ledger.append(std::vector<TaskResult>{result("web1", 0), result("db1", NO_EXIT_STATUS, "timeout")});

    auto path = fs::temp_directory_path() / "sshfleet_ledger_test" / "report.yaml";
    auto saved = ledger.save(path);
    ASSERT_TRUE(saved.is_ok()) << saved.error;

    YAML::Node root = YAML::LoadFile(path.string());
    EXPECT_FALSE(root["generated_at"].as<std::string>("").empty());
    EXPECT_EQ(root["summary"]["total"].as<int>(), 2);
    EXPECT_EQ(root["summary"]["succeeded"].as<int>(), 1);
    EXPECT_EQ(root["summary"]["failed"].as<int>(), 1);

    ASSERT_EQ(root["results"].size(), 2u);
    EXPECT_EQ(root["results"][0]["host"].as<std::string>(), "web1");
    EXPECT_TRUE(root["results"][0]["success"].as<bool>());
    EXPECT_EQ(root["results"][0]["stdout"].as<std::string>(), "up 3 days\n");
    EXPECT_DOUBLE_EQ(root["results"][0]["elapsed"].as<double>(), 1.5);
    EXPECT_EQ(root["results"][1]["exit_code"].as<int>(), NO_EXIT_STATUS);
    EXPECT_EQ(root["results"][1]["error"].as<std::string>(), "timeout");

    fs::remove_all(path.parent_path());
}
