#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace rmirror::core {

struct SessionStatsSnapshot {
    std::uint64_t files_transferred = 0;
    std::uint64_t files_failed = 0;
    std::uint64_t files_skipped = 0;
    std::uint64_t bytes_transferred = 0;
    std::vector<std::string> failed_ids;
};

/// Счётчики текущего запуска; в отличие от журнала не сохраняются.
struct SessionStats {
    std::atomic<std::uint64_t> files_transferred{0};
    std::atomic<std::uint64_t> files_failed{0};
    std::atomic<std::uint64_t> files_skipped{0};
    std::atomic<std::uint64_t> bytes_transferred{0};

    SessionStats() = default;

    // atomic и mutex не копируются
    SessionStats(const SessionStats&) = delete;
    SessionStats& operator=(const SessionStats&) = delete;

    void record_transferred(std::uint64_t bytes) {
        files_transferred.fetch_add(1, std::memory_order_relaxed);
        bytes_transferred.fetch_add(bytes, std::memory_order_relaxed);
    }

    void record_skipped(std::uint64_t count = 1) {
        files_skipped.fetch_add(count, std::memory_order_relaxed);
    }

    void record_failed(const std::string& remote_id) {
        files_failed.fetch_add(1, std::memory_order_relaxed);
        std::lock_guard lock(failed_mutex_);
        failed_ids_.push_back(remote_id);
    }

    [[nodiscard]] auto snapshot() const -> SessionStatsSnapshot {
        SessionStatsSnapshot snap{
            .files_transferred = files_transferred.load(),
            .files_failed = files_failed.load(),
            .files_skipped = files_skipped.load(),
            .bytes_transferred = bytes_transferred.load(),
        };
        std::lock_guard lock(failed_mutex_);
        snap.failed_ids = failed_ids_;
        return snap;
    }

private:
    mutable std::mutex failed_mutex_;
    std::vector<std::string> failed_ids_;
};

} // namespace rmirror::core
