#include "tcp_socket.hpp"
#include <cerrno>
#include <cstring>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <system_error>
#include <utility>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace rmirror::adapters::ftp {

namespace {

auto errno_message(int err) -> std::string {
    return std::error_code(err, std::generic_category()).message();
}

auto set_timeouts(int fd, std::chrono::seconds timeout) -> bool {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count());
    return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0
        && ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

// connect с таймаутом: O_NONBLOCK на время соединения
auto connect_with_timeout(int fd, const sockaddr* addr, socklen_t len,
                          std::chrono::seconds timeout) -> int
{
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
        return errno;
    }

    int err = 0;
    if (::connect(fd, addr, len) != 0) {
        if (errno != EINPROGRESS) {
            return errno;
        }
        pollfd pfd{fd, POLLOUT, 0};
        const int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count() * 1000));
        if (rc == 0) {
            return ETIMEDOUT;
        }
        if (rc < 0) {
            return errno;
        }
        socklen_t err_len = sizeof(err);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &err_len) != 0) {
            return errno;
        }
        if (err != 0) {
            return err;
        }
    }

    if (::fcntl(fd, F_SETFL, flags) == -1) {
        return errno;
    }
    return 0;
}

} // namespace

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

auto TcpSocket::connect_to(const std::string& host, std::uint16_t port,
                           std::chrono::seconds timeout) -> infra::Result<TcpSocket>
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    const auto port_str = std::to_string(port);
    const int gai_rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &results);
    if (gai_rc != 0 || results == nullptr) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ConnectionFailed,
            fmt::format("Cannot resolve {}:{}: {}", host, port,
                        gai_rc != 0 ? ::gai_strerror(gai_rc) : "no results")));
    }

    int last_err = 0;
    int connected_fd = -1;
    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_err = errno;
            continue;
        }
        last_err = connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen, timeout);
        if (last_err == 0 && set_timeouts(fd, timeout)) {
            connected_fd = fd;
            break;
        }
        if (last_err == 0) last_err = errno;
        ::close(fd);
    }
    ::freeaddrinfo(results);

    if (connected_fd == -1) {
        const auto code = last_err == ETIMEDOUT ? infra::ErrorCode::NetworkTimeout
                                                : infra::ErrorCode::ConnectionFailed;
        return std::unexpected(infra::make_error(code,
            fmt::format("Cannot connect to {}:{}: {}", host, port, errno_message(last_err))));
    }

    spdlog::debug("Connected to {}:{}", host, port);
    return TcpSocket{connected_fd};
}

auto TcpSocket::send_all(std::string_view data) -> infra::VoidResult {
    std::size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            const auto code = (err == EAGAIN || err == EWOULDBLOCK) ? infra::ErrorCode::NetworkTimeout
                                                                    : infra::ErrorCode::ConnectionFailed;
            return std::unexpected(infra::make_error(code, fmt::format("Send failed: {}", errno_message(err))));
        }
        sent += static_cast<std::size_t>(n);
    }
    return {};
}

auto TcpSocket::receive(char* buffer, std::size_t buffer_size) -> infra::Result<std::size_t> {
    while (true) {
        const ssize_t n = ::recv(fd_, buffer, buffer_size, 0);
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno == EINTR) continue;

        const int err = errno;
        if (err == EAGAIN || err == EWOULDBLOCK) {
            return std::unexpected(infra::make_error(infra::ErrorCode::NetworkTimeout, "Receive timed out"));
        }
        return std::unexpected(infra::make_error(infra::ErrorCode::ConnectionFailed,
            fmt::format("Receive failed: {}", errno_message(err))));
    }
}

auto TcpSocket::peer_address() const -> std::string {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getpeername(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return {};
    }

    char host[NI_MAXHOST] = {};
    if (::getnameinfo(reinterpret_cast<sockaddr*>(&addr), len, host, sizeof(host),
                      nullptr, 0, NI_NUMERICHOST) != 0) {
        return {};
    }
    return host;
}

void TcpSocket::close() noexcept {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace rmirror::adapters::ftp
