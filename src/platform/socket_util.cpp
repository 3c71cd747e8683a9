#include "socket_util.hpp"

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <sys/types.h>
#  include <netdb.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#  include <cerrno>
#endif
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <thread>

namespace platform {

void init_networking() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
        initialized = true;
    }
#endif
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret;
    do {
        ret = poll(&pfd, 1, timeout_ms);
    } while (ret < 0 && errno == EINTR);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

int last_socket_error() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

std::string socket_error_string(int err) {
#ifdef _WIN32
    char buf[256] = {0};
    FormatMessageA(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                   nullptr, static_cast<DWORD>(err), 0, buf, sizeof(buf), nullptr);
    std::string msg(buf);
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) msg.pop_back();
    return msg;
#else
    return std::strerror(err);
#endif
}

static int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

static bool connect_in_progress(int err) {
#ifdef _WIN32
    return err == WSAEWOULDBLOCK || err == WSAEINPROGRESS;
#else
    return err == EINPROGRESS;
#endif
}

namespace {

// getaddrinfo state shared with the lookup thread. Whoever drops the last
// reference frees the address list, so an abandoned lookup cleans up after
// itself.
struct Lookup {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    int rc = 0;
    struct addrinfo* res = nullptr;

    ~Lookup() {
        if (res) freeaddrinfo(res);
    }
};

} // namespace

Result<AddrInfoList> resolve_host(const std::string& host, int port,
                                  std::chrono::steady_clock::time_point deadline) {
    init_networking();

    if (remaining_ms(deadline) == 0) {
        return Result<AddrInfoList>::Err("Timed out resolving host " + host);
    }

    auto lookup = std::make_shared<Lookup>();
    std::string port_str = std::to_string(port);

    // getaddrinfo has no timeout of its own
    std::thread([lookup, host, port_str]() {
        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_protocol = IPPROTO_TCP;

        struct addrinfo* res = nullptr;
        int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);

        std::lock_guard<std::mutex> lock(lookup->mutex);
        lookup->rc = rc;
        lookup->res = res;
        lookup->done = true;
        lookup->cv.notify_all();
    }).detach();

    std::unique_lock<std::mutex> lock(lookup->mutex);
    if (!lookup->cv.wait_until(lock, deadline, [&] { return lookup->done; })) {
        return Result<AddrInfoList>::Err("Timed out resolving host " + host);
    }
    if (lookup->rc != 0) {
        return Result<AddrInfoList>::Err("Failed to resolve host " + host + ": " +
                                         gai_strerror(lookup->rc));
    }

    AddrInfoList list(lookup->res, freeaddrinfo);
    lookup->res = nullptr;
    return Result<AddrInfoList>::Ok(list);
}

Result<socket_t> connect_tcp(const std::string& host, int port,
                             std::chrono::steady_clock::time_point deadline) {
    auto resolved = resolve_host(host, port, deadline);
    if (resolved.is_err()) return Result<socket_t>::Err(resolved.error);

    std::string last_error = "no usable address for " + host;
    for (struct addrinfo* ai = resolved.value.get(); ai != nullptr; ai = ai->ai_next) {
        if (remaining_ms(deadline) == 0) {
            last_error = "Connection to " + host + " timed out";
            break;
        }

        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == SSHRELAY_INVALID_SOCKET) {
            last_error = "Failed to create socket: " + socket_error_string(last_socket_error());
            continue;
        }
        set_nonblocking(sock);

        int ret = connect(sock, ai->ai_addr, static_cast<int>(ai->ai_addrlen));
        if (ret == 0) return Result<socket_t>::Ok(sock);

        int err = last_socket_error();
        if (!connect_in_progress(err)) {
            last_error = "Failed to connect to " + host + ": " + socket_error_string(err);
            close_socket(sock);
            continue;
        }

        // Wait for non-blocking connect to complete
        int revents = poll_socket(sock, POLLOUT, remaining_ms(deadline));
        if (revents == 0) {
            close_socket(sock);
            last_error = "Connection to " + host + " timed out";
            continue;
        }

        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
        if (sock_err != 0) {
            close_socket(sock);
            last_error = "Failed to connect to " + host + ": " + socket_error_string(sock_err);
            continue;
        }

        return Result<socket_t>::Ok(sock);
    }

    return Result<socket_t>::Err(last_error);
}

} // namespace platform
