#include "monitoring.hpp"
#include "../interrupt.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace rmirror::infra {

namespace {

auto format_rate(double bytes_per_sec) -> std::string {
    const char* unit = "B/s";
    double speed = bytes_per_sec;
    if (speed > 1024.0 * 1024 * 1024) { speed /= 1024.0 * 1024 * 1024; unit = "GB/s"; }
    else if (speed > 1024.0 * 1024) { speed /= 1024.0 * 1024; unit = "MB/s"; }
    else if (speed > 1024.0) { speed /= 1024.0; unit = "KB/s"; }
    return fmt::format("{:.1f} {}", speed, unit);
}

auto format_eta(double eta_sec) -> std::string {
    if (!std::isfinite(eta_sec) || eta_sec <= 0) return "--:--";
    int seconds = static_cast<int>(eta_sec);
    const int hours = seconds / 3600;
    const int minutes = (seconds % 3600) / 60;
    seconds = seconds % 60;
    if (hours > 0) {
        return fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
    }
    return fmt::format("{:02d}:{:02d}", minutes, seconds);
}

} // namespace

ProgressMonitor::ProgressMonitor(std::string label, bool enabled, bool quiet)
    : label_(std::move(label))
    , enabled_(enabled && !quiet)
    , start_time_(std::chrono::steady_clock::now())
{
    if (enabled_) {
        start_rendering_thread_();
    }
}

ProgressMonitor::~ProgressMonitor() {
    if (render_thread_) {
        stop_rendering_thread_();
    }
    if (enabled_) {
        render_();
        std::fputs("\n", stdout); // финальный перенос
        std::fflush(stdout);
    }
}

void ProgressMonitor::set_total(std::uint64_t files, std::uint64_t bytes) {
    total_files_.store(files);
    total_bytes_.store(bytes);
}

void ProgressMonitor::add_bytes(std::uint64_t bytes) {
    processed_bytes_.fetch_add(bytes, std::memory_order_relaxed);
}

void ProgressMonitor::file_done(bool failed) {
    processed_files_.fetch_add(1, std::memory_order_relaxed);
    if (failed) {
        failed_files_.fetch_add(1, std::memory_order_relaxed);
    }
}

auto ProgressMonitor::get_stats() const -> Stats {
    return Stats{
        .total_files = total_files_.load(),
        .processed_files = processed_files_.load(),
        .failed_files = failed_files_.load(),
        .total_bytes = total_bytes_.load(),
        .processed_bytes = processed_bytes_.load(),
        .start_time = start_time_
    };
}

void ProgressMonitor::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        while (sleep_for(std::chrono::milliseconds(250), st)) {
            render_();
        }
    });
}

void ProgressMonitor::stop_rendering_thread_() {
    render_thread_->request_stop();
    render_thread_.reset(); // join
}

void ProgressMonitor::render_() const {
    const auto stats = get_stats();
    if (stats.total_files == 0) return;

    // Полоса по байтам, если размер известен, иначе по файлам
    const double fraction = stats.total_bytes > 0
        ? static_cast<double>(stats.processed_bytes) / static_cast<double>(stats.total_bytes)
        : static_cast<double>(stats.processed_files) / static_cast<double>(stats.total_files);
    const int bar_width = 20;
    const int filled = std::min(bar_width, static_cast<int>(fraction * bar_width));

    const auto elapsed_sec = std::chrono::duration<double>(std::chrono::steady_clock::now() - stats.start_time).count();
    const double bytes_per_sec = elapsed_sec > 0 ? static_cast<double>(stats.processed_bytes) / elapsed_sec : 0.0;

    double eta_sec = 0.0;
    if (bytes_per_sec > 0 && stats.total_bytes > stats.processed_bytes) {
        eta_sec = static_cast<double>(stats.total_bytes - stats.processed_bytes) / bytes_per_sec;
    }

    std::string bar;
    for (int i = 0; i < bar_width; ++i) {
        bar += i < filled ? "█" : "░";
    }

    // ANSI: очистить строку
    fmt::print("\r\033[K{} [{}] {} | ETA: {} | {}/{} files",
               label_, bar, format_rate(bytes_per_sec), format_eta(eta_sec),
               stats.processed_files, stats.total_files);
    if (stats.failed_files > 0) {
        fmt::print(" | {} failed", stats.failed_files);
    }
    std::fflush(stdout);
}

} // namespace rmirror::infra
