#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <regex>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>
#include "../../adapters/remote/remote_client.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/monitoring.hpp"
#include "../../infra/retry.hpp"
#include "../ledger/progress_ledger.hpp"
#include "../rate_governor/rate_governor.hpp"
#include "../session/session_stats.hpp"
#include "../space_governor/space_governor.hpp"

namespace rmirror::core {

/// "/a/b/" + "c" -> "/a/b/c"
[[nodiscard]] auto join_remote(std::string_view base, std::string_view name) -> std::string;

struct FileTask {
    std::string remote_id;                      // полный путь на сервере
    std::filesystem::path local_path;
    std::optional<std::uint64_t> expected_size; // из листинга; nullopt, если там 0
};

enum class TransferOutcome {
    Transferred,
    AlreadyPresent,   // файл назначения уже нужного размера, сеть не использовалась
};

struct TransferResult {
    TransferOutcome outcome = TransferOutcome::Transferred;
    std::uint64_t bytes_received = 0;   // получено по сети в этой попытке
    std::uint64_t resumed_from = 0;
    std::uint64_t final_size = 0;
};

struct BatchSummary {
    std::string remote_dir;
    std::uint64_t listed_files = 0;
    std::uint64_t already_completed = 0;
    std::uint64_t queued = 0;
    std::uint64_t transferred = 0;
    std::uint64_t failed = 0;
    std::uint64_t skipped = 0;
    std::size_t peak_active = 0;

    void merge(const BatchSummary& other);
};

/// Передача файлов: одна возобновляемая передача, обёртка с повторами
/// и пакет каталога на пуле фиксированного размера.
class TransferEngine {
public:
    TransferEngine(const infra::Config& config,
                   std::shared_ptr<ProgressLedger> ledger,
                   RateGovernor& rate,
                   SpaceGovernor& space,
                   SessionStats& stats,
                   adapters::remote::ClientFactory factory);

    /// Одна попытка: проверки на месте, staging, REST, сверка размера, перенос.
    [[nodiscard]] auto transfer_file(const FileTask& task, std::stop_token stop = {},
                                     infra::ProgressMonitor* monitor = nullptr)
        -> infra::Result<TransferResult>;

    /// Пропуск завершённого, проверка места, повторы с backoff, запись в журнал.
    [[nodiscard]] auto transfer_with_retry(const FileTask& task, std::stop_token stop = {},
                                           infra::ProgressMonitor* monitor = nullptr)
        -> infra::VoidResult;

    /// Листинг, фильтр по журналу, пул из max_concurrent_downloads воркеров.
    /// Ошибки отдельных файлов не прерывают пакет; прерывают DiskFull,
    /// ListingFailed и остановка.
    [[nodiscard]] auto transfer_directory(const std::string& remote_dir,
                                          const std::filesystem::path& local_dir,
                                          std::stop_token stop = {})
        -> infra::Result<BatchSummary>;

    /// Листинг с повторами; исчерпание — ListingFailed.
    [[nodiscard]] auto list_directory(const std::string& remote_dir, std::stop_token stop = {})
        -> infra::Result<std::vector<adapters::remote::RemoteEntry>>;

    [[nodiscard]] auto active_transfers() const -> std::size_t { return active_.load(); }
    /// Максимум одновременных передач в последнем пакете каталога.
    [[nodiscard]] auto peak_active_transfers() const -> std::size_t { return peak_active_.load(); }

private:
    class ActiveGuard;

    [[nodiscard]] auto matches_filters_(const std::string& name) const -> bool;
    [[nodiscard]] auto staging_path_(const FileTask& task) const -> std::filesystem::path;
    [[nodiscard]] auto retry_policy_() const -> infra::RetryPolicy;
    void discard_if_remote_changed_(const FileTask& task);
    void cleanup_after_failure_(const std::filesystem::path& staging,
                                std::uint64_t offset, std::uint64_t received,
                                const infra::Error& err) const;

    const infra::Config& config_;
    std::shared_ptr<ProgressLedger> ledger_;
    RateGovernor& rate_;
    SpaceGovernor& space_;
    SessionStats& stats_;
    adapters::remote::ClientFactory factory_;

    std::vector<std::regex> include_patterns_;
    std::vector<std::regex> exclude_patterns_;

    std::atomic<std::size_t> active_{0};
    std::atomic<std::size_t> peak_active_{0};
};

} // namespace rmirror::core
