#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rmirror::core {

using TimePoint = std::chrono::system_clock::time_point;

enum class FileStatus { Pending, InProgress, Completed, Failed, Skipped };
enum class DirectoryStatus { Pending, InProgress, Completed, Failed };

[[nodiscard]] auto to_string(FileStatus status) -> std::string_view;
[[nodiscard]] auto to_string(DirectoryStatus status) -> std::string_view;

/// "downloading" из старых снимков читается как InProgress.
[[nodiscard]] auto parse_file_status(std::string_view text) -> std::optional<FileStatus>;
[[nodiscard]] auto parse_directory_status(std::string_view text) -> std::optional<DirectoryStatus>;

[[nodiscard]] inline auto is_terminal(FileStatus status) -> bool {
    return status == FileStatus::Completed || status == FileStatus::Failed || status == FileStatus::Skipped;
}

struct FileRecord {
    std::string remote_id;
    std::string local_path;
    std::optional<std::uint64_t> expected_size;
    std::uint64_t bytes_transferred = 0;
    FileStatus status = FileStatus::Pending;
    std::optional<TimePoint> start_time;
    std::optional<TimePoint> end_time;
    std::optional<std::string> error_message;
    std::uint32_t retry_count = 0;
};

struct DirectoryRecord {
    std::string remote_path;
    std::string local_path;
    std::uint64_t total_files = 0;
    std::uint64_t completed_files = 0;
    std::uint64_t failed_files = 0;
    std::uint64_t skipped_files = 0;
    std::uint64_t total_bytes = 0;
    std::uint64_t transferred_bytes = 0;
    DirectoryStatus status = DirectoryStatus::Pending;
    std::optional<TimePoint> start_time;
    std::optional<TimePoint> end_time;

    [[nodiscard]] auto finished_files() const -> std::uint64_t {
        return completed_files + failed_files + skipped_files;
    }
};

} // namespace rmirror::core
