#include "task_executor.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <chrono>

TaskExecutor::TaskExecutor(TransportPool& pool, int command_timeout_secs)
    : pool_(pool), command_timeout_secs_(command_timeout_secs) {}

TaskResult TaskExecutor::execute(const std::string& label, const HostIdentity& host,
                                 const std::string& command) {
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    };

    TaskResult result;
    result.host_label = label;
    result.hostname = host.hostname();
    result.command = command;

    try {
        auto session = pool_.acquire(host);
        SSHResult r = session->transport().exec(command, command_timeout_secs_);

        result.stdout_data = std::move(r.stdout_data);
        result.stderr_data = std::move(r.stderr_data);
        result.exit_code = r.exit_code;
        result.elapsed = elapsed();

        log_info(fmt::format("Command executed on {} (exit {}): {}",
                             host.hostname(), result.exit_code, command));
    } catch (const std::exception& e) {
        result.stdout_data.clear();
        result.stderr_data.clear();
        result.exit_code = NO_EXIT_STATUS;
        result.elapsed = elapsed();
        result.error = e.what();
        if (result.error.empty()) result.error = "unknown error";

        log_error(fmt::format("Error executing command on {}: {}", host.hostname(), result.error));
    }
    return result;
}

bool TaskExecutor::transfer(const HostIdentity& host, const fs::path& local,
                            const std::string& remote, TransferDirection direction,
                            TransferProgress progress) {
    bool upload = direction == TransferDirection::UPLOAD;
    try {
        auto session = pool_.acquire(host);
        auto sftp = session->transport().open_file_subsystem();

        if (upload) {
            // Stat first so a missing local file fails before touching the remote
            std::error_code ec;
            uint64_t size = fs::file_size(local, ec);
            if (ec) throw TransferError(fmt::format("Cannot stat {}: {}", local.string(), ec.message()));
            log_debug(fmt::format("Uploading {} ({} bytes) to {}:{}", local.string(), size,
                                  host.hostname(), remote));
            sftp->put(local, remote, progress);
        } else {
            sftp->get(remote, local);
        }
        sftp->close();

        if (upload) {
            log_info(fmt::format("File transferred: {} -> {}:{}", local.string(), host.hostname(), remote));
        } else {
            log_info(fmt::format("File transferred: {}:{} -> {}", host.hostname(), remote, local.string()));
        }
        return true;
    } catch (const std::exception& e) {
        log_error(fmt::format("Error transferring file {} {} {}:{}: {}",
                              local.string(), upload ? "->" : "<-",
                              host.hostname(), remote, e.what()));
        return false;
    }
}
