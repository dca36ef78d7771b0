#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <fmt/core.h>
#include "adapters/remote/remote_client.hpp"

namespace rmirror::testing {

/// Сервер в памяти: каталоги, содержимое файлов и сценарии сбоев.
class FakeServer : public std::enable_shared_from_this<FakeServer> {
public:
    void add_file(const std::string& dir, const std::string& name, std::string content) {
        std::lock_guard lock(mutex_);
        listings_[dir].push_back(adapters::remote::RemoteEntry{
            .name = name,
            .kind = adapters::remote::EntryKind::File,
            .size_bytes = content.size(),
        });
        contents_[dir + "/" + name] = std::move(content);
    }

    void add_directory(const std::string& dir, const std::string& name) {
        std::lock_guard lock(mutex_);
        listings_[dir].push_back(adapters::remote::RemoteEntry{
            .name = name,
            .kind = adapters::remote::EntryKind::Directory,
        });
        listings_.try_emplace(dir + "/" + name);
    }

    /// Меняет содержимое, размер в листинге обновляется.
    void replace_file(const std::string& dir, const std::string& name, std::string content) {
        std::lock_guard lock(mutex_);
        for (auto& entry : listings_[dir]) {
            if (entry.name == name) entry.size_bytes = content.size();
        }
        contents_[dir + "/" + name] = std::move(content);
    }

    /// Листинг показывает размер 0, как для нечислового поля размера.
    void hide_size(const std::string& dir, const std::string& name) {
        std::lock_guard lock(mutex_);
        for (auto& entry : listings_[dir]) {
            if (entry.name == name) entry.size_bytes = 0;
        }
    }

    /// Передачи path бросают исключение вместо возврата ошибки.
    void throw_on_retrieve(const std::string& path) {
        std::lock_guard lock(mutex_);
        throwing_.push_back(path);
    }

    /// Следующие n подключений завершатся ConnectionFailed.
    void fail_next_connects(int n) { failing_connects_ = n; }

    /// Следующие n передач path отдадут bytes байт и оборвутся NetworkTimeout.
    void cut_transfer(const std::string& path, std::uint64_t bytes, int times = 1) {
        std::lock_guard lock(mutex_);
        cuts_[path] = {bytes, times};
    }

    /// Все передачи path завершаются ошибкой без данных.
    void break_file(const std::string& path) {
        std::lock_guard lock(mutex_);
        broken_.push_back(path);
    }

    void repair_file(const std::string& path) {
        std::lock_guard lock(mutex_);
        std::erase(broken_, path);
    }

    /// Все передачи path отдают лишний хвост (размер не совпадёт с листингом).
    void pad_file(const std::string& path, std::string tail) {
        std::lock_guard lock(mutex_);
        padding_[path] = std::move(tail);
    }

    void set_retrieve_delay(std::chrono::milliseconds delay) { retrieve_delay_ = delay; }
    void set_chunk_size(std::size_t size) { chunk_size_ = size; }

    [[nodiscard]] auto factory() -> adapters::remote::ClientFactory;

    [[nodiscard]] auto connections() const -> int { return connections_.load(); }
    [[nodiscard]] auto retrieve_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return retrieves_.size();
    }
    [[nodiscard]] auto retrieves() const -> std::vector<std::pair<std::string, std::uint64_t>> {
        std::lock_guard lock(mutex_);
        return retrieves_;
    }
    [[nodiscard]] auto peak_concurrent_retrieves() const -> int { return peak_active_.load(); }

private:
    friend class FakeClient;

    auto connect_() -> infra::VoidResult {
        connections_.fetch_add(1);
        if (failing_connects_.load() > 0) {
            failing_connects_.fetch_sub(1);
            return std::unexpected(infra::make_error(infra::ErrorCode::ConnectionFailed, "Connection refused"));
        }
        return {};
    }

    auto list_(std::string_view path) -> infra::Result<std::vector<adapters::remote::RemoteEntry>> {
        std::lock_guard lock(mutex_);
        const auto it = listings_.find(std::string(path));
        if (it == listings_.end()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::RemoteRejected,
                fmt::format("550 {}: No such file or directory", path)));
        }
        return it->second;
    }

    auto retrieve_(std::string_view path, std::uint64_t offset,
                   const adapters::remote::ChunkSink& sink) -> infra::VoidResult
    {
        std::string data;
        std::uint64_t cut_at = UINT64_MAX;
        {
            std::lock_guard lock(mutex_);
            const std::string key(path);
            retrieves_.emplace_back(key, offset);
            if (std::ranges::find(throwing_, key) != throwing_.end()) {
                throw std::runtime_error(fmt::format("Client crashed on {}", path));
            }
            if (std::ranges::find(broken_, key) != broken_.end()) {
                return std::unexpected(infra::make_error(infra::ErrorCode::NetworkTimeout,
                    fmt::format("Data connection timed out for {}", path)));
            }
            const auto it = contents_.find(key);
            if (it == contents_.end()) {
                return std::unexpected(infra::make_error(infra::ErrorCode::RemoteRejected,
                    fmt::format("550 {}: No such file", path)));
            }
            data = it->second;
            if (const auto pad = padding_.find(key); pad != padding_.end()) {
                data += pad->second;
            }
            if (auto cut = cuts_.find(key); cut != cuts_.end() && cut->second.second > 0) {
                cut_at = cut->second.first;
                --cut->second.second;
            }
        }
        if (offset > data.size()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::RemoteRejected,
                fmt::format("554 Invalid REST offset {}", offset)));
        }

        const int now = active_.fetch_add(1) + 1;
        int peak = peak_active_.load();
        while (now > peak && !peak_active_.compare_exchange_weak(peak, now)) {
        }
        if (retrieve_delay_.count() > 0) {
            std::this_thread::sleep_for(retrieve_delay_);
        }

        infra::VoidResult result;
        std::uint64_t pos = offset;
        while (pos < data.size()) {
            if (pos >= cut_at) {
                result = std::unexpected(infra::make_error(infra::ErrorCode::NetworkTimeout,
                    fmt::format("Connection reset during {}", path)));
                break;
            }
            auto n = std::min<std::uint64_t>(chunk_size_, data.size() - pos);
            if (cut_at != UINT64_MAX) n = std::min<std::uint64_t>(n, cut_at - pos);
            if (auto sent = sink(std::string_view(data).substr(pos, n)); !sent) {
                result = std::move(sent);
                break;
            }
            pos += n;
        }
        active_.fetch_sub(1);
        return result;
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<adapters::remote::RemoteEntry>> listings_;
    std::map<std::string, std::string> contents_;
    std::map<std::string, std::pair<std::uint64_t, int>> cuts_;
    std::map<std::string, std::string> padding_;
    std::vector<std::string> broken_;
    std::vector<std::string> throwing_;
    std::vector<std::pair<std::string, std::uint64_t>> retrieves_;

    std::atomic<int> failing_connects_{0};
    std::atomic<int> connections_{0};
    std::atomic<int> active_{0};
    std::atomic<int> peak_active_{0};
    std::chrono::milliseconds retrieve_delay_{0};
    std::size_t chunk_size_ = 4;
};

class FakeClient final : public adapters::remote::RemoteClient {
public:
    explicit FakeClient(std::shared_ptr<FakeServer> server) : server_(std::move(server)) {}

    auto connect() -> infra::VoidResult override {
        auto res = server_->connect_();
        connected_ = res.has_value();
        return res;
    }

    auto change_directory(std::string_view path) -> infra::VoidResult override {
        if (auto listing = server_->list_(path); !listing) {
            return std::unexpected(std::move(listing.error()));
        }
        return {};
    }

    auto list_directory(std::string_view path)
        -> infra::Result<std::vector<adapters::remote::RemoteEntry>> override {
        if (!connected_) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ProtocolError, "Not connected"));
        }
        return server_->list_(path);
    }

    auto retrieve(std::string_view path, std::uint64_t resume_offset,
                  const adapters::remote::ChunkSink& on_chunk) -> infra::VoidResult override {
        if (!connected_) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ProtocolError, "Not connected"));
        }
        return server_->retrieve_(path, resume_offset, on_chunk);
    }

    void close() noexcept override { connected_ = false; }

private:
    std::shared_ptr<FakeServer> server_;
    bool connected_ = false;
};

inline auto FakeServer::factory() -> adapters::remote::ClientFactory {
    auto self = shared_from_this();
    return [self]() -> std::unique_ptr<adapters::remote::RemoteClient> {
        return std::make_unique<FakeClient>(self);
    };
}

} // namespace rmirror::testing
