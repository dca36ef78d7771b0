#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include "infra/error_handler/error.hpp"

namespace rmirror::adapters::ftp {

/// TCP-сокет с таймаутами на connect/send/recv. Владеет дескриптором.
class TcpSocket {
public:
    TcpSocket() = default;
    ~TcpSocket();

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;
    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;

    /// getaddrinfo + неблокирующий connect с ожиданием через poll.
    [[nodiscard]] static auto connect_to(const std::string& host, std::uint16_t port,
                                         std::chrono::seconds timeout) -> infra::Result<TcpSocket>;

    [[nodiscard]] auto send_all(std::string_view data) -> infra::VoidResult;

    /// Читает до buffer_size байт. 0 — собеседник закрыл соединение.
    [[nodiscard]] auto receive(char* buffer, std::size_t buffer_size) -> infra::Result<std::size_t>;

    /// Числовой адрес собеседника (для подключения канала данных).
    [[nodiscard]] auto peer_address() const -> std::string;

    [[nodiscard]] auto is_open() const -> bool { return fd_ != -1; }
    void close() noexcept;

private:
    explicit TcpSocket(int fd) : fd_(fd) {}

    int fd_ = -1;
};

} // namespace rmirror::adapters::ftp
