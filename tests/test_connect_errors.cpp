#include <gtest/gtest.h>
#include <ssh/runner.hpp>
#include <chrono>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

// Listening socket on 127.0.0.1 with a kernel-chosen port. Connections
// complete in the backlog but nothing is ever sent back.
class SilentListener {
public:
    SilentListener() {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        listen(fd_, 4);

        socklen_t len = sizeof(addr);
        getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }
    ~SilentListener() { close_fd(); }

    void close_fd() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

    int port() const { return port_; }

private:
    int fd_ = -1;
    int port_ = 0;
};

static ConnectionRequest local_request(int port, int timeout) {
    ConnectionRequest request;
    request.host = "127.0.0.1";
    request.port = port;
    request.user = "admin";
    request.password = "secret";
    request.timeout = timeout;
    return request;
}

TEST(ConnectErrors, RefusedIsConnectionError) {
    SilentListener listener;
    int port = listener.port();
    listener.close_fd();

    auto outcome = run_remote(local_request(port, 5), "true");
    ASSERT_TRUE(outcome.is_err());
    EXPECT_EQ(outcome.error.kind, SSHErrorKind::CONNECTION);
}

TEST(ConnectErrors, UnresolvableHost) {
    ConnectionRequest request = local_request(22, 5);
    request.host = "no-such-host.invalid";

    auto outcome = run_remote(request, "true");
    ASSERT_TRUE(outcome.is_err());
    EXPECT_EQ(outcome.error.kind, SSHErrorKind::CONNECTION);
}

TEST(ConnectErrors, SilentServerTimesOut) {
    SilentListener listener;
    auto start = std::chrono::steady_clock::now();

    auto outcome = run_remote(local_request(listener.port(), 1), "true");
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(outcome.is_err());
    EXPECT_EQ(outcome.error.kind, SSHErrorKind::CONNECTION);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(ConnectErrors, ResolveNumericHost) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    auto resolved = platform::resolve_host("127.0.0.1", 22, deadline);
    ASSERT_TRUE(resolved.is_ok()) << resolved.error;
    ASSERT_NE(resolved.value.get(), nullptr);
    EXPECT_EQ(resolved.value->ai_family, AF_INET);
}

TEST(ConnectErrors, ResolveRespectsDeadline) {
    auto expired = std::chrono::steady_clock::now() - std::chrono::seconds(1);
    auto start = std::chrono::steady_clock::now();

    auto resolved = platform::resolve_host("router.example.invalid", 22, expired);
    ASSERT_TRUE(resolved.is_err());
    EXPECT_NE(resolved.error.find("Timed out"), std::string::npos);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));

    auto connected = platform::connect_tcp("router.example.invalid", 22, expired);
    ASSERT_TRUE(connected.is_err());
    EXPECT_NE(connected.error.find("Timed out"), std::string::npos);
}

TEST(ConnectErrors, InvalidRequestNeverConnects) {
    ConnectionRequest request = local_request(22, 5);
    request.user.clear();

    auto outcome = run_remote(request, "true");
    ASSERT_TRUE(outcome.is_err());
    EXPECT_NE(outcome.error.message.find("user"), std::string::npos);
}
