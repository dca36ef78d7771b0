#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "infra/error_handler/error.hpp"

namespace rmirror::adapters::remote {

enum class EntryKind { File, Directory };

struct RemoteEntry {
    std::string name;
    EntryKind kind = EntryKind::File;
    std::uint64_t size_bytes = 0;   // 0 для каталогов и нечисловых размеров
};

/// Приёмник данных RETR. Ошибка из приёмника прерывает передачу и возвращается из retrieve().
using ChunkSink = std::function<infra::VoidResult(std::string_view chunk)>;

/// Сессия с удалённым сервером: одно соединение на одну попытку передачи.
class RemoteClient {
public:
    virtual ~RemoteClient() = default;

    [[nodiscard]] virtual auto connect() -> infra::VoidResult = 0;
    [[nodiscard]] virtual auto change_directory(std::string_view path) -> infra::VoidResult = 0;
    [[nodiscard]] virtual auto list_directory(std::string_view path)
        -> infra::Result<std::vector<RemoteEntry>> = 0;

    /// Передаёт файл начиная с resume_offset (REST при offset > 0).
    [[nodiscard]] virtual auto retrieve(std::string_view path,
                                        std::uint64_t resume_offset,
                                        const ChunkSink& on_chunk) -> infra::VoidResult = 0;

    /// Вежливое закрытие (QUIT); безопасно вызывать повторно.
    virtual void close() noexcept = 0;
};

/// Создаёт новый, ещё не подключённый клиент.
using ClientFactory = std::function<std::unique_ptr<RemoteClient>()>;

/// Владеет подключённым клиентом и закрывает его при выходе из области видимости.
class ScopedConnection {
public:
    explicit ScopedConnection(std::unique_ptr<RemoteClient> client)
        : client_(std::move(client)) {}
    ~ScopedConnection() {
        if (client_) client_->close();
    }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;
    ScopedConnection(ScopedConnection&&) noexcept = default;
    ScopedConnection& operator=(ScopedConnection&&) noexcept = delete;

    RemoteClient* operator->() const { return client_.get(); }
    RemoteClient& operator*() const { return *client_; }

private:
    std::unique_ptr<RemoteClient> client_;
};

/// Создаёт клиент и подключается.
[[nodiscard]] inline auto open_connection(const ClientFactory& factory)
    -> infra::Result<ScopedConnection>
{
    auto client = factory();
    if (!client) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ConnectionFailed,
                                                 "Client factory returned no client"));
    }
    if (auto res = client->connect(); !res) {
        client->close();
        return std::unexpected(std::move(res.error()));
    }
    return ScopedConnection{std::move(client)};
}

} // namespace rmirror::adapters::remote
