#include "fleet_service.hpp"
#include <ssh/session.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

FleetService::FleetService(Config config)
    : FleetService(std::move(config), std::make_unique<SshConnector>()) {}

FleetService::FleetService(Config config, std::unique_ptr<TransportConnector> connector)
    : config_(std::move(config)),
      connector_(std::move(connector)),
      pool_(*connector_),
      executor_(pool_, config_.settings().command_timeout),
      hosts_(config_.hosts()) {}

FleetService::~FleetService() {
    shutdown();
}

// ── Inventory ─────────────────────────────────────────────────

void FleetService::add_host(const std::string& label, HostIdentity host) {
    std::lock_guard<std::mutex> lock(hosts_mutex_);
    hosts_[label] = std::move(host);
}

Result<size_t> FleetService::load_inventory(const fs::path& path) {
    auto inv = ::load_inventory(path);
    if (inv.is_err()) {
        log_error(fmt::format("Inventory load failed: {}", inv.error));
        return Result<size_t>::Err(inv.error);
    }

    std::lock_guard<std::mutex> lock(hosts_mutex_);
    for (auto& [label, host] : inv.value) {
        hosts_[label] = host;
    }
    log_info(fmt::format("Loaded {} host(s) from {}", inv.value.size(), path.string()));
    return Result<size_t>::Ok(inv.value.size());
}

Inventory FleetService::hosts() const {
    std::lock_guard<std::mutex> lock(hosts_mutex_);
    return hosts_;
}

std::vector<std::string> FleetService::labels() const {
    std::lock_guard<std::mutex> lock(hosts_mutex_);
    std::vector<std::string> out;
    for (const auto& [label, host] : hosts_) out.push_back(label);
    return out;
}

std::vector<std::string> FleetService::labels_with_tag(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(hosts_mutex_);
    std::vector<std::string> out;
    for (const auto& [label, host] : hosts_) {
        const auto& tags = host.tags();
        if (std::find(tags.begin(), tags.end(), tag) != tags.end()) {
            out.push_back(label);
        }
    }
    return out;
}

std::optional<HostIdentity> FleetService::find_host(const std::string& label) const {
    std::lock_guard<std::mutex> lock(hosts_mutex_);
    auto it = hosts_.find(label);
    if (it == hosts_.end()) return std::nullopt;
    return it->second;
}

// ── Commands ──────────────────────────────────────────────────

std::vector<TaskResult> FleetService::run_parallel(const std::vector<std::string>& labels,
                                                   const std::string& command,
                                                   const ResultCallback& on_result,
                                                   int concurrency) {
    ParallelDispatcher dispatcher(hosts(), config_.settings().max_concurrent);
    auto results = dispatcher.run_over_hosts(
        labels,
        [this, &command](const std::string& label, const HostIdentity& host) {
            return executor_.execute(label, host, command);
        },
        concurrency, on_result);

    ledger_.append(results);
    return results;
}

Result<TaskResult> FleetService::execute(const std::string& label, const std::string& command) {
    auto host = find_host(label);
    if (!host) {
        return Result<TaskResult>::Err(fmt::format("Unknown host: {}", label));
    }
    TaskResult result = executor_.execute(label, *host, command);
    ledger_.append(result);
    return Result<TaskResult>::Ok(result);
}

bool FleetService::transfer(const std::string& label, const fs::path& local,
                            const std::string& remote, TransferDirection direction,
                            TransferProgress progress) {
    auto host = find_host(label);
    if (!host) {
        log_error(fmt::format("Transfer failed: unknown host {}", label));
        return false;
    }
    return executor_.transfer(*host, local, remote, direction, std::move(progress));
}

// ── Monitoring ────────────────────────────────────────────────

void FleetService::monitor(const std::vector<std::string>& labels, int interval_secs,
                           int duration_secs, SystemMonitor::SnapshotCallback on_snapshot) {
    if (interval_secs <= 0) interval_secs = config_.settings().monitor_interval;

    auto mon = std::make_shared<SystemMonitor>(
        [this](const std::vector<std::string>& l, const std::string& cmd) {
            return run_parallel(l, cmd);
        },
        std::chrono::seconds(interval_secs), std::move(on_snapshot));

    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        if (monitor_) {
            log_warn("monitor: another monitor is already running");
            return;
        }
        monitor_ = mon;
    }

    log_info(fmt::format("monitor: {} host(s) every {}s for {}s",
                         labels.size(), interval_secs, duration_secs));
    mon->run_for(labels, std::chrono::seconds(duration_secs));

    std::lock_guard<std::mutex> lock(monitor_mutex_);
    monitor_.reset();
}

void FleetService::stop_monitor() {
    std::shared_ptr<SystemMonitor> mon;
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        mon = monitor_;
    }
    if (mon) mon->stop();
}

// ── Tunnels ───────────────────────────────────────────────────

Result<std::shared_ptr<TunnelBinding>> FleetService::open_tunnel(const std::string& label,
                                                                 int local_port,
                                                                 const std::string& remote_host,
                                                                 int remote_port) {
    using R = Result<std::shared_ptr<TunnelBinding>>;

    auto host = find_host(label);
    if (!host) return R::Err(fmt::format("Unknown host: {}", label));

    TunnelSpec spec{local_port, remote_host, remote_port};
    auto binding = std::make_shared<TunnelBinding>(pool_, *host, spec,
                                                   config_.settings().max_tunnel_connections);
    auto started = binding->start();
    if (started.is_err()) return R::Err(started.error);

    // Keyed by the bound port so ephemeral bindings stay distinct
    std::string key = fmt::format("{}:{}:{}:{}", label, binding->local_port(),
                                  remote_host, remote_port);
    std::shared_ptr<TunnelBinding> replaced;
    {
        std::lock_guard<std::mutex> lock(tunnels_mutex_);
        auto& slot = tunnels_[key];
        replaced = std::move(slot);
        slot = binding;
    }
    if (replaced) replaced->stop();
    return R::Ok(binding);
}

bool FleetService::stop_tunnel(const std::string& key) {
    std::shared_ptr<TunnelBinding> binding;
    {
        std::lock_guard<std::mutex> lock(tunnels_mutex_);
        auto it = tunnels_.find(key);
        if (it == tunnels_.end()) return false;
        binding = it->second;
        tunnels_.erase(it);
    }
    binding->stop();
    log_info(fmt::format("Tunnel {} stopped", key));
    return true;
}

std::map<std::string, std::shared_ptr<TunnelBinding>> FleetService::tunnels() const {
    std::lock_guard<std::mutex> lock(tunnels_mutex_);
    return tunnels_;
}

// ── Teardown ──────────────────────────────────────────────────

void FleetService::shutdown() {
    stop_monitor();

    std::map<std::string, std::shared_ptr<TunnelBinding>> bindings;
    {
        std::lock_guard<std::mutex> lock(tunnels_mutex_);
        bindings.swap(tunnels_);
    }
    for (auto& [key, binding] : bindings) binding->stop();

    pool_.release_all();
}
