#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <memory>
#include <thread>

namespace rmirror::infra {

/// Однострочный индикатор прогресса пакета (каталога) в терминале.
class ProgressMonitor {
public:
    struct Stats {
        std::uint64_t total_files = 0;
        std::uint64_t processed_files = 0;
        std::uint64_t failed_files = 0;
        std::uint64_t total_bytes = 0;
        std::uint64_t processed_bytes = 0;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(std::string label, bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void set_total(std::uint64_t files, std::uint64_t bytes);
    void add_bytes(std::uint64_t bytes);
    void file_done(bool failed);

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

private:
    void render_() const;
    void start_rendering_thread_();
    void stop_rendering_thread_();

    std::atomic<std::uint64_t> total_files_{0};
    std::atomic<std::uint64_t> total_bytes_{0};
    std::atomic<std::uint64_t> processed_files_{0};
    std::atomic<std::uint64_t> failed_files_{0};
    std::atomic<std::uint64_t> processed_bytes_{0};

    const std::string label_;
    const bool enabled_;
    std::chrono::steady_clock::time_point start_time_;
    std::unique_ptr<std::jthread> render_thread_;
};

} // namespace rmirror::infra
