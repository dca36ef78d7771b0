#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "adapters/remote/remote_client.hpp"
#include "infra/config/config.hpp"
#include "tcp_socket.hpp"

namespace rmirror::adapters::ftp {

struct FtpOptions {
    std::string host;
    std::uint16_t port = 21;
    std::string username = "anonymous";
    std::string password = "anonymous@";
    std::chrono::seconds timeout{30};
    std::size_t buffer_size = 8192;
    int connect_attempts = 3;

    [[nodiscard]] static auto from_config(const infra::Config& config) -> FtpOptions;
};

/// Клиент FTP поверх POSIX-сокетов: пассивный режим (EPSV, затем PASV), бинарный тип.
class FtpClient final : public remote::RemoteClient {
public:
    explicit FtpClient(FtpOptions options);
    ~FtpClient() override;

    FtpClient(const FtpClient&) = delete;
    FtpClient& operator=(const FtpClient&) = delete;

    [[nodiscard]] auto connect() -> infra::VoidResult override;
    [[nodiscard]] auto change_directory(std::string_view path) -> infra::VoidResult override;
    [[nodiscard]] auto list_directory(std::string_view path)
        -> infra::Result<std::vector<remote::RemoteEntry>> override;
    [[nodiscard]] auto retrieve(std::string_view path,
                                std::uint64_t resume_offset,
                                const remote::ChunkSink& on_chunk) -> infra::VoidResult override;
    void close() noexcept override;

private:
    struct Reply {
        int code = 0;
        std::string text;

        [[nodiscard]] auto is_preliminary() const -> bool { return code >= 100 && code < 200; }
        [[nodiscard]] auto is_positive() const -> bool { return code >= 200 && code < 400; }
    };

    auto connect_once_() -> infra::VoidResult;
    auto read_line_() -> infra::Result<std::string>;
    auto read_reply_() -> infra::Result<Reply>;
    auto command_(std::string_view command) -> infra::Result<Reply>;
    auto expect_(std::string_view command, int expected_class) -> infra::Result<Reply>;
    auto open_data_channel_() -> infra::Result<TcpSocket>;
    auto finish_transfer_() -> infra::VoidResult;

    FtpOptions options_;
    TcpSocket control_;
    std::string read_buffer_;
};

/// Фабрика клиентов для TransferEngine: новый клиент на каждую попытку.
[[nodiscard]] auto make_client_factory(const infra::Config& config) -> remote::ClientFactory;

} // namespace rmirror::adapters::ftp
