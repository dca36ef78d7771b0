#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "../../infra/error_handler/error.hpp"
#include "records.hpp"

namespace rmirror::core {

struct LedgerStatistics {
    std::uint64_t total_files = 0;
    std::uint64_t completed_files = 0;
    std::uint64_t failed_files = 0;
    std::uint64_t in_progress_files = 0;
    std::uint64_t skipped_files = 0;
    std::uint64_t pending_files = 0;
    std::uint64_t total_directories = 0;
    double completion_rate = 0.0;       // 0..1
    std::uint64_t total_bytes = 0;
    std::uint64_t transferred_bytes = 0;
    double transfer_rate = 0.0;         // доля байт, 0..1
    double session_duration_seconds = 0.0;
    double files_per_second = 0.0;
};

/// Журнал прогресса: единственный источник истины о том, что уже передано.
///
/// Все изменения выполняются под одним мьютексом. Снимок (JSON) пишется
/// через временный файл и rename; без force запись откладывается, пока
/// число терминальных обновлений не достигнет save_interval.
///
/// Допустимые переходы статуса файла:
///   pending     -> in_progress | completed | failed | skipped
///   in_progress -> completed | failed | skipped
///   failed      -> in_progress (повтор)
/// Из completed выводит только reset_file(); skipped возвращается в pending через add_file().
class ProgressLedger {
public:
    ProgressLedger(std::filesystem::path snapshot_path, std::uint32_t save_interval = 10);

    ProgressLedger(const ProgressLedger&) = delete;
    ProgressLedger& operator=(const ProgressLedger&) = delete;

    /// Перечитывает снимок. Отсутствие файла — чистый старт. Повреждённый
    /// снимок переименовывается в <snapshot>.corrupt, состояние пустое, ошибка LedgerCorrupt.
    [[nodiscard]] auto load() -> infra::VoidResult;

    /// Пишет снимок, если force или накопилось save_interval обновлений.
    [[nodiscard]] auto save(bool force = false) -> infra::VoidResult;

    void add_directory(const std::string& remote_path, const std::string& local_path,
                       std::uint64_t total_files, std::uint64_t total_bytes);

    void add_file(const std::string& remote_id, const std::string& local_path,
                  std::optional<std::uint64_t> expected_size = std::nullopt);

    [[nodiscard]] auto is_completed(const std::string& remote_id) -> bool;
    [[nodiscard]] auto is_failed(const std::string& remote_id) const -> bool;

    /// false — записи нет или переход запрещён (запись не меняется).
    auto update_progress(const std::string& remote_id, std::uint64_t bytes, FileStatus status) -> bool;

    /// Переводит запись в failed с сообщением (исчерпан бюджет повторов).
    void set_error(const std::string& remote_id, const std::string& message);

    /// Новый ожидаемый размер незавершённой записи; байты сбрасываются в 0.
    auto set_expected_size(const std::string& remote_id, std::uint64_t size) -> bool;

    /// Явный сброс в pending, в том числе из completed.
    auto reset_file(const std::string& remote_id) -> bool;

    /// Упавшие файлы с retry_count < max_retries.
    [[nodiscard]] auto failed_files(std::uint32_t max_retries) const -> std::vector<std::string>;

    [[nodiscard]] auto statistics() const -> LedgerStatistics;

    [[nodiscard]] auto file(const std::string& remote_id) const -> std::optional<FileRecord>;
    [[nodiscard]] auto directory(const std::string& remote_path) const -> std::optional<DirectoryRecord>;

    [[nodiscard]] auto snapshot_path() const -> const std::filesystem::path& { return snapshot_path_; }

private:
    enum class Bucket { None, Completed, Failed, Skipped };

    static auto bucket_of(FileStatus status) -> Bucket;
    static auto transition_allowed(FileStatus from, FileStatus to) -> bool;

    auto owning_directory_(const std::string& remote_id) -> DirectoryRecord*;
    void move_bucket_(FileRecord& record, FileStatus old_status, std::uint64_t old_bytes);
    void refresh_directory_status_(DirectoryRecord& dir);
    void clear_();

    auto to_json_() const -> std::string;
    auto from_json_(const std::string& text) -> infra::VoidResult;

    const std::filesystem::path snapshot_path_;
    const std::uint32_t save_interval_;

    mutable std::mutex mutex_;       // состояние
    std::mutex save_mutex_;          // упорядочивает запись снимков

    std::unordered_map<std::string, FileRecord> files_;
    std::unordered_map<std::string, DirectoryRecord> directories_;
    std::unordered_set<std::string> completed_;
    std::unordered_set<std::string> failed_;

    std::uint64_t total_files_processed_ = 0;
    std::uint64_t updates_since_save_ = 0;
    TimePoint session_start_;
    std::chrono::steady_clock::time_point session_clock_start_;
};

} // namespace rmirror::core
