#pragma once

#include <string>
#include <vector>
#include <memory>
#include <map>
#include <mutex>
#include <optional>
#include <filesystem>
#include <core/config.hpp>
#include <ssh/transport.hpp>
#include "transport_pool.hpp"
#include "task_executor.hpp"
#include "dispatcher.hpp"
#include "tunnel_forwarder.hpp"
#include "system_monitor.hpp"
#include "result_ledger.hpp"

namespace fs = std::filesystem;

// Headless fleet facade: owns the pool, executor, ledger, tunnels and monitor.
// Frontends render its results; it never prints.
class FleetService {
public:
    // Uses the libssh2 connector.
    explicit FleetService(Config config = Config{});
    FleetService(Config config, std::unique_ptr<TransportConnector> connector);
    ~FleetService();

    FleetService(const FleetService&) = delete;
    FleetService& operator=(const FleetService&) = delete;

    // ── Inventory ─────────────────────────────────────────────

    // Replaces any existing entry with the same label.
    void add_host(const std::string& label, HostIdentity host);

    // Merge the `hosts:` of a YAML inventory file. Returns hosts added.
    Result<size_t> load_inventory(const fs::path& path);

    Inventory hosts() const;
    std::vector<std::string> labels() const;
    std::vector<std::string> labels_with_tag(const std::string& tag) const;

    // ── Commands ──────────────────────────────────────────────

    // Run command on every known label, concurrency <= 0 uses
    // settings().max_concurrent. Results are appended to the ledger.
    std::vector<TaskResult> run_parallel(const std::vector<std::string>& labels,
                                         const std::string& command,
                                         const ResultCallback& on_result = nullptr,
                                         int concurrency = 0);

    // Single host. Unknown label is an error; remote failures are not.
    Result<TaskResult> execute(const std::string& label, const std::string& command);

    bool transfer(const std::string& label, const fs::path& local,
                  const std::string& remote, TransferDirection direction,
                  TransferProgress progress = nullptr);

    // ── Monitoring ────────────────────────────────────────────

    // Blocks for duration_secs (or until stop_monitor()). interval_secs <= 0
    // uses settings().monitor_interval.
    void monitor(const std::vector<std::string>& labels, int interval_secs = 0,
                 int duration_secs = DEFAULT_MONITOR_DURATION_SECS,
                 SystemMonitor::SnapshotCallback on_snapshot = nullptr);
    void stop_monitor();

    // ── Tunnels ───────────────────────────────────────────────

    // localhost:local_port → remote_host:remote_port through the host's
    // pooled session. The returned binding is already listening.
    Result<std::shared_ptr<TunnelBinding>> open_tunnel(const std::string& label, int local_port,
                                                       const std::string& remote_host,
                                                       int remote_port);
    bool stop_tunnel(const std::string& key);
    std::map<std::string, std::shared_ptr<TunnelBinding>> tunnels() const;

    // ── State ─────────────────────────────────────────────────

    ResultLedger& ledger() { return ledger_; }
    const ResultLedger& ledger() const { return ledger_; }
    TransportPool& pool() { return pool_; }
    const Config& config() const { return config_; }

    // Stop the monitor and every tunnel, then close all pooled sessions.
    void shutdown();

private:
    std::optional<HostIdentity> find_host(const std::string& label) const;

    Config config_;
    std::unique_ptr<TransportConnector> connector_;
    TransportPool pool_;
    TaskExecutor executor_;
    ResultLedger ledger_;

    mutable std::mutex hosts_mutex_;
    Inventory hosts_;

    mutable std::mutex tunnels_mutex_;
    std::map<std::string, std::shared_ptr<TunnelBinding>> tunnels_;

    std::mutex monitor_mutex_;
    std::shared_ptr<SystemMonitor> monitor_;
};
