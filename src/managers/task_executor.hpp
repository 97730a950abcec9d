#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>
#include "transport_pool.hpp"

namespace fs = std::filesystem;

// Runs one unit of work against one host through the pool. Never throws:
// every failure is folded into the returned TaskResult / bool.
class TaskExecutor {
public:
    // command_timeout_secs == 0 lets commands run until the channel closes.
    explicit TaskExecutor(TransportPool& pool, int command_timeout_secs = 0);

    // exit_code is the remote status when the command ran; NO_EXIT_STATUS
    // with a populated error when it never did. Elapsed time includes
    // session acquisition.
    TaskResult execute(const std::string& label, const HostIdentity& host,
                       const std::string& command);

    // Upload reports byte progress; download writes local once complete.
    bool transfer(const HostIdentity& host, const fs::path& local,
                  const std::string& remote, TransferDirection direction,
                  TransferProgress progress = nullptr);

    int command_timeout() const { return command_timeout_secs_; }

private:
    TransportPool& pool_;
    int command_timeout_secs_;
};
