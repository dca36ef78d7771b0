#include "progress_ledger.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>
#include "../../adapters/fs.hpp"

namespace rmirror::core {

namespace {

// Родительский путь удалённого идентификатора без завершающего '/'
auto parent_of(std::string_view remote_id) -> std::string_view {
    while (remote_id.size() > 1 && remote_id.back() == '/') {
        remote_id.remove_suffix(1);
    }
    const auto slash = remote_id.rfind('/');
    if (slash == std::string_view::npos) {
        return {};
    }
    return slash == 0 ? remote_id.substr(0, 1) : remote_id.substr(0, slash);
}

void decrement(std::uint64_t& counter) {
    if (counter > 0) --counter;
}

} // namespace

ProgressLedger::ProgressLedger(std::filesystem::path snapshot_path, std::uint32_t save_interval)
    : snapshot_path_(std::move(snapshot_path))
    , save_interval_(save_interval > 0 ? save_interval : 1)
    , session_start_(std::chrono::system_clock::now())
    , session_clock_start_(std::chrono::steady_clock::now())
{
    if (auto res = load(); !res) {
        (void)infra::log_and_return(std::move(res.error()));
    }
}

auto ProgressLedger::bucket_of(FileStatus status) -> Bucket {
    switch (status) {
        case FileStatus::Completed: return Bucket::Completed;
        case FileStatus::Failed:    return Bucket::Failed;
        case FileStatus::Skipped:   return Bucket::Skipped;
        default:                    return Bucket::None;
    }
}

auto ProgressLedger::transition_allowed(FileStatus from, FileStatus to) -> bool {
    if (from == to) {
        return from != FileStatus::Completed;
    }
    switch (from) {
        case FileStatus::Pending:
            return true;
        case FileStatus::InProgress:
            return to == FileStatus::Completed || to == FileStatus::Failed || to == FileStatus::Skipped;
        case FileStatus::Failed:
            return to == FileStatus::InProgress;
        case FileStatus::Completed:
        case FileStatus::Skipped:
            return false;
    }
    return false;
}

void ProgressLedger::clear_() {
    files_.clear();
    directories_.clear();
    completed_.clear();
    failed_.clear();
    total_files_processed_ = 0;
    updates_since_save_ = 0;
}

auto ProgressLedger::load() -> infra::VoidResult {
    std::lock_guard save_lock(save_mutex_);
    std::lock_guard lock(mutex_);
    clear_();

    std::error_code ec;
    if (!std::filesystem::exists(snapshot_path_, ec)) {
        spdlog::info("No existing progress file found at {}, starting fresh", snapshot_path_.string());
        return {};
    }

    std::ifstream in(snapshot_path_, std::ios::binary);
    if (!in) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError,
            fmt::format("Cannot open progress file {}", snapshot_path_.string())));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    in.close();

    if (auto res = from_json_(buffer.str()); !res) {
        clear_();
        auto aside = snapshot_path_;
        aside += ".corrupt";
        std::filesystem::rename(snapshot_path_, aside, ec);
        if (ec) {
            spdlog::error("Cannot move corrupt progress file aside: {}", ec.message());
        }
        return std::unexpected(infra::make_error(infra::ErrorCode::LedgerCorrupt,
            fmt::format("{}; moved to {}, starting with empty progress", res.error().message, aside.string())));
    }

    spdlog::info("Loaded progress: {} completed, {} failed files", completed_.size(), failed_.size());
    return {};
}

auto ProgressLedger::save(bool force) -> infra::VoidResult {
    std::lock_guard save_lock(save_mutex_);

    std::string snapshot;
    std::uint64_t captured_updates = 0;
    {
        std::lock_guard lock(mutex_);
        if (!force && updates_since_save_ < save_interval_) {
            return {};
        }
        snapshot = to_json_();
        captured_updates = updates_since_save_;
    }

    if (auto res = adapters::fs::write_atomically(snapshot_path_, snapshot); !res) {
        return std::unexpected(infra::make_error(res.error().code,
            fmt::format("Failed to save progress: {}", res.error().message)));
    }

    {
        std::lock_guard lock(mutex_);
        updates_since_save_ -= std::min(captured_updates, updates_since_save_);
    }
    spdlog::debug("Progress saved to {}", snapshot_path_.string());
    return {};
}

void ProgressLedger::add_directory(const std::string& remote_path, const std::string& local_path,
                                   std::uint64_t total_files, std::uint64_t total_bytes)
{
    std::lock_guard lock(mutex_);
    if (directories_.contains(remote_path)) {
        return;
    }

    DirectoryRecord dir;
    dir.remote_path = remote_path;
    dir.local_path = local_path;
    dir.total_files = total_files;
    dir.total_bytes = total_bytes;
    dir.start_time = std::chrono::system_clock::now();
    dir.status = DirectoryStatus::InProgress;

    // Файлы, попавшие в журнал раньше каталога (прошлые запуски, retry-failed)
    std::string_view key = remote_path;
    while (key.size() > 1 && key.back() == '/') key.remove_suffix(1);
    for (const auto& [id, record] : files_) {
        if (parent_of(id) != key) continue;
        switch (bucket_of(record.status)) {
            case Bucket::Completed:
                ++dir.completed_files;
                dir.transferred_bytes += record.bytes_transferred;
                break;
            case Bucket::Failed:  ++dir.failed_files; break;
            case Bucket::Skipped: ++dir.skipped_files; break;
            case Bucket::None:    break;
        }
    }
    dir.total_files = std::max(dir.total_files, dir.finished_files());

    auto [it, inserted] = directories_.emplace(remote_path, std::move(dir));
    refresh_directory_status_(it->second);
    spdlog::debug("Added directory to track: {}", remote_path);
}

void ProgressLedger::add_file(const std::string& remote_id, const std::string& local_path,
                              std::optional<std::uint64_t> expected_size)
{
    std::lock_guard lock(mutex_);
    if (auto it = files_.find(remote_id); it != files_.end()) {
        auto& record = it->second;
        if (!record.expected_size && expected_size) {
            record.expected_size = expected_size;
        }
        if (record.status == FileStatus::Skipped) {
            // Прерванная передача снова в очереди
            const auto old_bytes = record.bytes_transferred;
            record.status = FileStatus::Pending;
            record.start_time = std::chrono::system_clock::now();
            record.end_time.reset();
            move_bucket_(record, FileStatus::Skipped, old_bytes);
        }
        return;
    }

    FileRecord record;
    record.remote_id = remote_id;
    record.local_path = local_path;
    record.expected_size = expected_size;
    record.start_time = std::chrono::system_clock::now();
    files_.emplace(remote_id, std::move(record));
    spdlog::debug("Added file to track: {}", remote_id);
}

auto ProgressLedger::is_completed(const std::string& remote_id) -> bool {
    std::lock_guard lock(mutex_);
    if (completed_.contains(remote_id)) {
        return true;
    }
    if (auto it = files_.find(remote_id); it != files_.end() && it->second.status == FileStatus::Completed) {
        completed_.insert(remote_id);
        return true;
    }
    return false;
}

auto ProgressLedger::is_failed(const std::string& remote_id) const -> bool {
    std::lock_guard lock(mutex_);
    return failed_.contains(remote_id);
}

auto ProgressLedger::update_progress(const std::string& remote_id, std::uint64_t bytes, FileStatus status) -> bool {
    std::lock_guard lock(mutex_);
    auto it = files_.find(remote_id);
    if (it == files_.end()) {
        spdlog::debug("Progress update for untracked file {}", remote_id);
        return false;
    }
    auto& record = it->second;

    if (record.status == FileStatus::Completed) {
        if (status == FileStatus::Completed && bytes == record.bytes_transferred) {
            return true;
        }
        spdlog::warn("Ignoring {} update for completed file {}", to_string(status), remote_id);
        return false;
    }
    if (!transition_allowed(record.status, status)) {
        spdlog::warn("Rejected status change {} -> {} for {}",
                     to_string(record.status), to_string(status), remote_id);
        return false;
    }
    if (status == FileStatus::Completed && record.expected_size && bytes != *record.expected_size) {
        spdlog::warn("Refusing to complete {}: {} bytes, expected {}", remote_id, bytes, *record.expected_size);
        return false;
    }

    const auto old_status = record.status;
    const auto old_bytes = record.bytes_transferred;
    record.bytes_transferred = bytes;
    record.status = status;

    if (status == FileStatus::InProgress && is_terminal(old_status)) {
        record.end_time.reset();
    }

    if (is_terminal(status)) {
        record.end_time = std::chrono::system_clock::now();
        ++total_files_processed_;
        ++updates_since_save_;

        if (status == FileStatus::Completed) {
            completed_.insert(remote_id);
            failed_.erase(remote_id);
            record.error_message.reset();
        } else if (status == FileStatus::Failed) {
            failed_.insert(remote_id);
            ++record.retry_count;
        }
    }

    if (bucket_of(old_status) != Bucket::None || bucket_of(status) != Bucket::None) {
        move_bucket_(record, old_status, old_bytes);
    }
    return true;
}

void ProgressLedger::set_error(const std::string& remote_id, const std::string& message) {
    std::lock_guard lock(mutex_);
    auto it = files_.find(remote_id);
    if (it == files_.end()) {
        return;
    }
    auto& record = it->second;
    if (record.status == FileStatus::Completed) {
        spdlog::warn("Ignoring error for completed file {}: {}", remote_id, message);
        return;
    }

    const auto old_status = record.status;
    const auto old_bytes = record.bytes_transferred;
    record.status = FileStatus::Failed;
    record.end_time = std::chrono::system_clock::now();
    record.error_message = message;
    failed_.insert(remote_id);
    move_bucket_(record, old_status, old_bytes);
}

auto ProgressLedger::set_expected_size(const std::string& remote_id, std::uint64_t size) -> bool {
    std::lock_guard lock(mutex_);
    auto it = files_.find(remote_id);
    if (it == files_.end() || it->second.status == FileStatus::Completed) {
        return false;
    }
    it->second.expected_size = size;
    it->second.bytes_transferred = 0;
    return true;
}

auto ProgressLedger::reset_file(const std::string& remote_id) -> bool {
    std::lock_guard lock(mutex_);
    auto it = files_.find(remote_id);
    if (it == files_.end()) {
        return false;
    }
    auto& record = it->second;

    const auto old_status = record.status;
    const auto old_bytes = record.bytes_transferred;
    record.status = FileStatus::Pending;
    record.bytes_transferred = 0;
    record.start_time = std::chrono::system_clock::now();
    record.end_time.reset();
    record.error_message.reset();
    record.retry_count = 0;
    completed_.erase(remote_id);
    failed_.erase(remote_id);
    move_bucket_(record, old_status, old_bytes);
    ++updates_since_save_;

    spdlog::info("Reset ledger record {}", remote_id);
    return true;
}

auto ProgressLedger::failed_files(std::uint32_t max_retries) const -> std::vector<std::string> {
    std::lock_guard lock(mutex_);
    std::vector<std::string> result;
    for (const auto& id : failed_) {
        auto it = files_.find(id);
        if (it == files_.end()) continue;
        if (it->second.status == FileStatus::Failed && it->second.retry_count < max_retries) {
            result.push_back(id);
        }
    }
    std::ranges::sort(result);
    return result;
}

auto ProgressLedger::statistics() const -> LedgerStatistics {
    std::lock_guard lock(mutex_);
    LedgerStatistics stats;
    stats.total_files = files_.size();
    stats.total_directories = directories_.size();

    for (const auto& [id, record] : files_) {
        switch (record.status) {
            case FileStatus::Completed:  ++stats.completed_files; break;
            case FileStatus::Failed:     ++stats.failed_files; break;
            case FileStatus::InProgress: ++stats.in_progress_files; break;
            case FileStatus::Skipped:    ++stats.skipped_files; break;
            case FileStatus::Pending:    ++stats.pending_files; break;
        }
        stats.total_bytes += record.expected_size.value_or(0);
        stats.transferred_bytes += record.bytes_transferred;
    }

    if (stats.total_files > 0) {
        stats.completion_rate = static_cast<double>(stats.completed_files) / static_cast<double>(stats.total_files);
    }
    if (stats.total_bytes > 0) {
        stats.transfer_rate = static_cast<double>(stats.transferred_bytes) / static_cast<double>(stats.total_bytes);
    }
    stats.session_duration_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - session_clock_start_).count();
    if (stats.session_duration_seconds > 0.0) {
        stats.files_per_second = static_cast<double>(total_files_processed_) / stats.session_duration_seconds;
    }
    return stats;
}

auto ProgressLedger::file(const std::string& remote_id) const -> std::optional<FileRecord> {
    std::lock_guard lock(mutex_);
    if (auto it = files_.find(remote_id); it != files_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto ProgressLedger::directory(const std::string& remote_path) const -> std::optional<DirectoryRecord> {
    std::lock_guard lock(mutex_);
    if (auto it = directories_.find(remote_path); it != directories_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto ProgressLedger::owning_directory_(const std::string& remote_id) -> DirectoryRecord* {
    const auto parent = std::string(parent_of(remote_id));
    if (parent.empty()) {
        return nullptr;
    }
    if (auto it = directories_.find(parent); it != directories_.end()) {
        return &it->second;
    }
    if (auto it = directories_.find(parent + "/"); it != directories_.end()) {
        return &it->second;
    }
    return nullptr;
}

void ProgressLedger::move_bucket_(FileRecord& record, FileStatus old_status, std::uint64_t old_bytes) {
    auto* dir = owning_directory_(record.remote_id);
    if (dir == nullptr) {
        return;
    }

    switch (bucket_of(old_status)) {
        case Bucket::Completed:
            decrement(dir->completed_files);
            dir->transferred_bytes -= std::min(old_bytes, dir->transferred_bytes);
            break;
        case Bucket::Failed:  decrement(dir->failed_files); break;
        case Bucket::Skipped: decrement(dir->skipped_files); break;
        case Bucket::None:    break;
    }
    switch (bucket_of(record.status)) {
        case Bucket::Completed:
            ++dir->completed_files;
            dir->transferred_bytes += record.bytes_transferred;
            break;
        case Bucket::Failed:  ++dir->failed_files; break;
        case Bucket::Skipped: ++dir->skipped_files; break;
        case Bucket::None:    break;
    }

    // completed + failed + skipped <= total_files
    dir->total_files = std::max(dir->total_files, dir->finished_files());
    refresh_directory_status_(*dir);
}

void ProgressLedger::refresh_directory_status_(DirectoryRecord& dir) {
    const bool all_done = dir.finished_files() == dir.total_files && dir.skipped_files == 0;
    if (all_done) {
        const auto closed = dir.failed_files > 0 ? DirectoryStatus::Failed : DirectoryStatus::Completed;
        if (dir.status != closed) {
            dir.status = closed;
            dir.end_time = std::chrono::system_clock::now();
            spdlog::info("Directory {} {}: {} completed, {} failed",
                         dir.remote_path, to_string(closed), dir.completed_files, dir.failed_files);
        }
    } else if (dir.status != DirectoryStatus::InProgress) {
        dir.status = DirectoryStatus::InProgress;
        dir.end_time.reset();
    }
}

} // namespace rmirror::core
