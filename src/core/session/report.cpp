#include "report.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <string>

namespace rmirror::core {

namespace {

const std::string kRule(60, '=');
constexpr double kGiB = 1024.0 * 1024.0 * 1024.0;

auto gib(std::uint64_t bytes) -> double {
    return static_cast<double>(bytes) / kGiB;
}

} // namespace

void print_ledger_statistics(const LedgerStatistics& stats) {
    fmt::print("\n{}\n", kRule);
    fmt::print("DOWNLOAD PROGRESS STATISTICS\n");
    fmt::print("{}\n", kRule);
    fmt::print("Total Files: {}\n", stats.total_files);
    fmt::print("Completed: {} ({:.1f}%)\n", stats.completed_files, stats.completion_rate * 100.0);
    fmt::print("Failed: {}\n", stats.failed_files);
    fmt::print("In Progress: {}\n", stats.in_progress_files);
    fmt::print("Skipped: {}\n", stats.skipped_files);
    fmt::print("Pending: {}\n", stats.pending_files);

    if (stats.total_bytes > 0) {
        fmt::print("\nData Transfer:\n");
        fmt::print("Total Size: {:.2f} GB\n", gib(stats.total_bytes));
        fmt::print("Downloaded: {:.2f} GB ({:.1f}%)\n", gib(stats.transferred_bytes), stats.transfer_rate * 100.0);
    }

    fmt::print("\nSession Duration: {:.2f} hours\n", stats.session_duration_seconds / 3600.0);
    fmt::print("Processing Rate: {:.2f} files/second\n", stats.files_per_second);
    fmt::print("{}\n\n", kRule);
}

void print_session_summary(const SessionStatsSnapshot& stats) {
    fmt::print("\n{}\n", kRule);
    fmt::print("SESSION STATISTICS\n");
    fmt::print("{}\n", kRule);
    fmt::print("Files Downloaded: {}\n", stats.files_transferred);
    fmt::print("Files Failed: {}\n", stats.files_failed);
    fmt::print("Files Skipped: {}\n", stats.files_skipped);
    fmt::print("Bytes Downloaded: {:.2f} GB\n", gib(stats.bytes_transferred));

    if (!stats.failed_ids.empty()) {
        constexpr std::size_t kShown = 10;
        fmt::print("\nFailed Files ({}):\n", stats.failed_ids.size());
        const auto shown = std::min(kShown, stats.failed_ids.size());
        for (std::size_t i = 0; i < shown; ++i) {
            fmt::print("  - {}\n", stats.failed_ids[i]);
        }
        if (stats.failed_ids.size() > kShown) {
            fmt::print("  ... and {} more\n", stats.failed_ids.size() - kShown);
        }
    }
    fmt::print("{}\n\n", kRule);
}

void print_status(const SessionStatus& status) {
    print_ledger_statistics(status.ledger);

    fmt::print("DISK USAGE\n{}\n", kRule);
    if (status.disk) {
        const auto& disk = *status.disk;
        fmt::print("Total: {:.2f} GB\n", gib(disk.total_bytes));
        fmt::print("Used:  {:.2f} GB ({:.1f}%)\n", gib(disk.used_bytes), disk.percent_used);
        fmt::print("Free:  {:.2f} GB ({:.1f}%)\n", gib(disk.free_bytes), disk.percent_free);
        fmt::print("Sufficient space: {}\n", disk.sufficient ? "yes" : "no");
    } else {
        fmt::print("unavailable\n");
    }

    fmt::print("\nRATE GOVERNOR\n{}\n", kRule);
    fmt::print("Current delay: {:.2f}s (initial {:.2f}s, range {:.2f}..{:.2f}s)\n",
               status.rate.current_delay, status.rate.initial_delay,
               status.rate.min_delay, status.rate.max_delay);
    if (status.rate.max_requests_per_minute) {
        fmt::print("Requests in last minute: {}/{}\n",
                   status.rate.requests_in_window, *status.rate.max_requests_per_minute);
    }
    if (status.rate.seconds_since_last_request) {
        fmt::print("Since last request: {:.1f}s\n", *status.rate.seconds_since_last_request);
    }
    fmt::print("{}\n\n", kRule);
}

} // namespace rmirror::core
