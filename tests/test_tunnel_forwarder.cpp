#include <gtest/gtest.h>
#include <managers/tunnel_forwarder.hpp>
#include <core/host.hpp>
#include "fakes/fake_transport.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <functional>
#include <thread>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/resource.h>
#include <unistd.h>

namespace {

HostIdentity bastion() {
    return make_host_identity("bastion", "ops", std::string("pw"), std::nullopt, 22, 5).value;
}

// Blocking loopback client
socket_t connect_local(int port) {
    std::string err;
    socket_t fd = platform::connect_tcp("127.0.0.1", port, 2000, err);
    if (fd == SSHFLEET_INVALID_SOCKET) return fd;
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
    return fd;
}

std::string recv_exact(socket_t fd, size_t n) {
    std::string out;
    char buf[256];
    while (out.size() < n) {
        if (!platform::poll_socket(fd, POLLIN, 2000)) break;
        ssize_t r = recv(fd, buf, std::min(sizeof(buf), n - out.size()), 0);
        if (r <= 0) break;
        out.append(buf, static_cast<size_t>(r));
    }
    return out;
}

// True when the peer closed (recv returns 0) within the timeout
bool peer_closed(socket_t fd, int timeout_ms = 2000) {
    char c;
    if (!platform::poll_socket(fd, POLLIN, timeout_ms)) return false;
    return recv(fd, &c, 1, 0) <= 0;
}

bool wait_until(const std::function<bool()>& pred, int timeout_ms = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

// Bytes of address space currently mapped by this process
size_t address_space_bytes() {
    std::ifstream statm("/proc/self/statm");
    size_t pages = 0;
    statm >> pages;
    return pages * static_cast<size_t>(sysconf(_SC_PAGESIZE));
}

// Listener that never accepts; connects to it complete through the backlog.
socket_t backlog_only_listener() {
    std::string err;
    return platform::listen_loopback(0, 8, err);
}

// Runs in a death-test child: with the address space capped, relay threads
// cannot be created for the next client.
void relay_start_failure_drops_only_that_client() {
    fakes::FakeConnector connector;
    TransportPool pool(connector);
    socket_t backend = backlog_only_listener();
    TunnelBinding tunnel(pool, bastion(), TunnelSpec{0, "127.0.0.1", platform::local_port(backend)});
    if (tunnel.start().is_err()) _exit(2);

    struct rlimit cap{};
    getrlimit(RLIMIT_AS, &cap);
    cap.rlim_cur = address_space_bytes() + 1024 * 1024;
    if (setrlimit(RLIMIT_AS, &cap) != 0) _exit(3);

    socket_t client = connect_local(tunnel.local_port());
    if (client == SSHFLEET_INVALID_SOCKET) _exit(4);
    bool dropped = peer_closed(client, 3000);
    bool listening = tunnel.state() == TunnelState::LISTENING;
    _exit(dropped && listening ? 0 : 1);
}

// Runs in a death-test child: with no descriptors left, accept() keeps
// failing while the client sits in the backlog.
void accept_failure_backs_off() {
    fakes::FakeConnector connector;
    TransportPool pool(connector);
    socket_t backend = backlog_only_listener();
    TunnelBinding tunnel(pool, bastion(), TunnelSpec{0, "127.0.0.1", platform::local_port(backend)});
    if (tunnel.start().is_err()) _exit(2);

    socket_t client = socket(AF_INET, SOCK_STREAM, 0);
    if (client < 0) _exit(3);
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(tunnel.local_port()));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    int lowest_free = dup(0);
    if (lowest_free < 0) _exit(4);
    close(lowest_free);
    struct rlimit files{};
    getrlimit(RLIMIT_NOFILE, &files);
    files.rlim_cur = static_cast<rlim_t>(lowest_free);
    if (setrlimit(RLIMIT_NOFILE, &files) != 0) _exit(5);

    if (connect(client, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) _exit(6);

    std::clock_t before = std::clock();
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    std::clock_t cpu = std::clock() - before;

    bool idle = cpu < CLOCKS_PER_SEC / 5;
    bool listening = tunnel.state() == TunnelState::LISTENING;
    _exit(idle && listening ? 0 : 1);
}

} // namespace

class TunnelForwarderTest : public ::testing::Test {
protected:
    fakes::FakeConnector connector;
    fakes::EchoServer echo;
    std::unique_ptr<TransportPool> pool;

    void SetUp() override {
        pool = std::make_unique<TransportPool>(connector);
    }

    void TearDown() override {
        pool.reset();
    }

    TunnelSpec echo_spec() const {
        return TunnelSpec{0, "127.0.0.1", echo.port()};
    }
};

TEST_F(TunnelForwarderTest, RelaysBytesBothWays) {
    TunnelBinding tunnel(*pool, bastion(), echo_spec());
    ASSERT_TRUE(tunnel.start().is_ok());
    EXPECT_EQ(tunnel.state(), TunnelState::LISTENING);
    ASSERT_GT(tunnel.local_port(), 0);

    socket_t client = connect_local(tunnel.local_port());
    ASSERT_NE(client, SSHFLEET_INVALID_SOCKET);
    ASSERT_TRUE(platform::send_all(client, "PING", 4));
    EXPECT_EQ(recv_exact(client, 4), "PING");
    EXPECT_TRUE(wait_until([&] { return tunnel.state() == TunnelState::RELAYING; }));

    platform::close_socket(client);
}

TEST_F(TunnelForwarderTest, ClientCloseTearsDownRelayAndChannel) {
    TunnelBinding tunnel(*pool, bastion(), echo_spec());
    ASSERT_TRUE(tunnel.start().is_ok());

    socket_t client = connect_local(tunnel.local_port());
    ASSERT_TRUE(platform::send_all(client, "PING", 4));
    ASSERT_EQ(recv_exact(client, 4), "PING");
    EXPECT_TRUE(wait_until([&] { return tunnel.active_connections() == 1; }));

    platform::close_socket(client);

    EXPECT_TRUE(wait_until([&] { return tunnel.active_connections() == 0; }));
    EXPECT_EQ(connector.stats.channels_opened, 1);
    EXPECT_EQ(connector.stats.channels_closed, 1);
    EXPECT_EQ(tunnel.state(), TunnelState::LISTENING);
}

TEST_F(TunnelForwarderTest, ServesManyConnections) {
    TunnelBinding tunnel(*pool, bastion(), echo_spec());
    ASSERT_TRUE(tunnel.start().is_ok());

    std::vector<socket_t> clients;
    for (int i = 0; i < 3; ++i) {
        socket_t c = connect_local(tunnel.local_port());
        ASSERT_NE(c, SSHFLEET_INVALID_SOCKET);
        std::string msg = "msg" + std::to_string(i);
        ASSERT_TRUE(platform::send_all(c, msg.data(), msg.size()));
        EXPECT_EQ(recv_exact(c, msg.size()), msg);
        clients.push_back(c);
    }
    EXPECT_TRUE(wait_until([&] { return tunnel.active_connections() == 3; }));
    EXPECT_EQ(tunnel.accepted_connections(), 3u);

    for (auto c : clients) platform::close_socket(c);
    EXPECT_TRUE(wait_until([&] { return tunnel.active_connections() == 0; }));

    // Sequential reuse after the first batch closed
    socket_t again = connect_local(tunnel.local_port());
    ASSERT_TRUE(platform::send_all(again, "again", 5));
    EXPECT_EQ(recv_exact(again, 5), "again");
    platform::close_socket(again);
    // Every connection shares the one pooled session
    EXPECT_EQ(connector.stats.connects, 1);
}

TEST_F(TunnelForwarderTest, ConnectFailureStopsBindingUpFront) {
    connector.set_unreachable("bastion");
    TunnelBinding tunnel(*pool, bastion(), echo_spec());

    auto started = tunnel.start();
    EXPECT_TRUE(started.is_err());
    EXPECT_EQ(tunnel.state(), TunnelState::STOPPED);
    EXPECT_EQ(tunnel.local_port(), -1);
}

TEST_F(TunnelForwarderTest, ChannelOpenFailureKeepsListening) {
    TunnelBinding tunnel(*pool, bastion(), echo_spec());
    ASSERT_TRUE(tunnel.start().is_ok());

    connector.failing_channel_opens = 1;
    socket_t refused = connect_local(tunnel.local_port());
    ASSERT_NE(refused, SSHFLEET_INVALID_SOCKET);
    EXPECT_TRUE(peer_closed(refused));
    platform::close_socket(refused);

    socket_t client = connect_local(tunnel.local_port());
    ASSERT_TRUE(platform::send_all(client, "PING", 4));
    EXPECT_EQ(recv_exact(client, 4), "PING");
    platform::close_socket(client);

    EXPECT_NE(tunnel.state(), TunnelState::STOPPED);
}

TEST_F(TunnelForwarderTest, ConnectionCapRefusesExtraClients) {
    TunnelBinding tunnel(*pool, bastion(), echo_spec(), 1);
    ASSERT_TRUE(tunnel.start().is_ok());

    socket_t first = connect_local(tunnel.local_port());
    ASSERT_TRUE(platform::send_all(first, "one", 3));
    ASSERT_EQ(recv_exact(first, 3), "one");

    socket_t second = connect_local(tunnel.local_port());
    ASSERT_NE(second, SSHFLEET_INVALID_SOCKET);
    EXPECT_TRUE(peer_closed(second));
    platform::close_socket(second);

    EXPECT_EQ(tunnel.active_connections(), 1u);
    platform::close_socket(first);
}

TEST_F(TunnelForwarderTest, StopClosesLiveRelays) {
    TunnelBinding tunnel(*pool, bastion(), echo_spec());
    ASSERT_TRUE(tunnel.start().is_ok());
    int port = tunnel.local_port();

    socket_t client = connect_local(port);
    ASSERT_TRUE(platform::send_all(client, "PING", 4));
    ASSERT_EQ(recv_exact(client, 4), "PING");

    tunnel.stop();
    EXPECT_EQ(tunnel.state(), TunnelState::STOPPED);
    EXPECT_EQ(tunnel.active_connections(), 0u);
    EXPECT_EQ(connector.stats.channels_closed, 1);
    EXPECT_TRUE(peer_closed(client));
    platform::close_socket(client);

    EXPECT_FALSE(fakes::is_port_open(port));
    tunnel.stop();
}

TEST_F(TunnelForwarderTest, StartTwiceIsAnError) {
    TunnelBinding tunnel(*pool, bastion(), echo_spec());
    ASSERT_TRUE(tunnel.start().is_ok());
    EXPECT_TRUE(tunnel.start().is_err());
}

TEST_F(TunnelForwarderTest, DeadTransportStopsAccepting) {
    TunnelBinding tunnel(*pool, bastion(), echo_spec());
    ASSERT_TRUE(tunnel.start().is_ok());

    connector.kill("bastion");
    socket_t client = connect_local(tunnel.local_port());
    ASSERT_NE(client, SSHFLEET_INVALID_SOCKET);
    EXPECT_TRUE(peer_closed(client));
    platform::close_socket(client);

    EXPECT_TRUE(wait_until([&] { return tunnel.state() == TunnelState::STOPPED; }));
}

TEST(TunnelSpec, KeyAndStateNames) {
    TunnelSpec spec{9000, "127.0.0.1", 8080};
    EXPECT_EQ(spec.key(), "9000:127.0.0.1:8080");
    EXPECT_STREQ(tunnel_state_name(TunnelState::RELAYING), "relaying");
}

TEST(TunnelResourceExhaustion, RelayThreadFailureDropsOnlyThatClient) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_EXIT(relay_start_failure_drops_only_that_client(), ::testing::ExitedWithCode(0), "");
}

TEST(TunnelResourceExhaustion, AcceptFailureDoesNotSpin) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_EXIT(accept_failure_backs_off(), ::testing::ExitedWithCode(0), "");
}
