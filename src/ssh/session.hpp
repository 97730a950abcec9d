#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include "transport.hpp"

struct SshSession;

// libssh2-backed transport: one TCP connection, one authenticated SSH
// session, channels opened on demand.
class SshTransport : public Transport {
public:
    // Connect, handshake and authenticate within host.timeout_secs().
    // Throws ConnectionError.
    static std::unique_ptr<SshTransport> establish(const HostIdentity& host);

    ~SshTransport() override;

    bool is_active() const override;
    SSHResult exec(const std::string& command, int timeout_secs) override;
    std::unique_ptr<ByteChannel> open_direct_channel(
        const std::string& dest_host, int dest_port,
        const std::string& src_host, int src_port) override;
    std::unique_ptr<FileSubsystem> open_file_subsystem() override;
    void close() override;

    const std::string& target() const { return target_; }

private:
    explicit SshTransport(std::shared_ptr<SshSession> session);

    std::shared_ptr<SshSession> session_;
    std::string target_;
};

class SshConnector : public TransportConnector {
public:
    std::unique_ptr<Transport> connect(const HostIdentity& host) override;
};
