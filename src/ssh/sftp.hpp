#pragma once

#include <memory>
#include "transport.hpp"

struct SshSession;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

class SshFileSubsystem : public FileSubsystem {
public:
    SshFileSubsystem(std::shared_ptr<SshSession> session, LIBSSH2_SFTP* sftp);
    ~SshFileSubsystem() override;

    SshFileSubsystem(const SshFileSubsystem&) = delete;
    SshFileSubsystem& operator=(const SshFileSubsystem&) = delete;

    void put(const fs::path& local, const std::string& remote,
             const TransferProgress& progress) override;
    void get(const std::string& remote, const fs::path& local) override;
    void close() override;

private:
    std::shared_ptr<SshSession> session_;
    LIBSSH2_SFTP* sftp_;
};
