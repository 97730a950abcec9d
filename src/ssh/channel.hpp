#pragma once

#include <atomic>
#include <memory>
#include "transport.hpp"

struct SshSession;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// direct-tcpip channel. read() and write_all() may run on two different
// threads at once; each libssh2 call takes the session I/O mutex.
class SshDirectChannel : public ByteChannel {
public:
    SshDirectChannel(std::shared_ptr<SshSession> session, LIBSSH2_CHANNEL* channel);
    ~SshDirectChannel() override;

    SshDirectChannel(const SshDirectChannel&) = delete;
    SshDirectChannel& operator=(const SshDirectChannel&) = delete;

    size_t read(char* buf, size_t len) override;
    void write_all(const char* data, size_t len) override;
    void close() override;

private:
    std::shared_ptr<SshSession> session_;
    LIBSSH2_CHANNEL* channel_;
    std::atomic<bool> closed_{false};
};
