#include "records.hpp"

namespace rmirror::core {

auto to_string(FileStatus status) -> std::string_view {
    switch (status) {
        case FileStatus::Pending:    return "pending";
        case FileStatus::InProgress: return "in_progress";
        case FileStatus::Completed:  return "completed";
        case FileStatus::Failed:     return "failed";
        case FileStatus::Skipped:    return "skipped";
    }
    return "pending";
}

auto to_string(DirectoryStatus status) -> std::string_view {
    switch (status) {
        case DirectoryStatus::Pending:    return "pending";
        case DirectoryStatus::InProgress: return "in_progress";
        case DirectoryStatus::Completed:  return "completed";
        case DirectoryStatus::Failed:     return "failed";
    }
    return "pending";
}

auto parse_file_status(std::string_view text) -> std::optional<FileStatus> {
    if (text == "pending") return FileStatus::Pending;
    if (text == "in_progress" || text == "downloading") return FileStatus::InProgress;
    if (text == "completed") return FileStatus::Completed;
    if (text == "failed") return FileStatus::Failed;
    if (text == "skipped") return FileStatus::Skipped;
    return std::nullopt;
}

auto parse_directory_status(std::string_view text) -> std::optional<DirectoryStatus> {
    if (text == "pending") return DirectoryStatus::Pending;
    if (text == "in_progress") return DirectoryStatus::InProgress;
    if (text == "completed") return DirectoryStatus::Completed;
    if (text == "failed") return DirectoryStatus::Failed;
    return std::nullopt;
}

} // namespace rmirror::core
