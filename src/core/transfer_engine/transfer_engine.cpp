#include "transfer_engine.hpp"
#include <algorithm>
#include <future>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../adapters/fs.hpp"
#include "../../extensions/staging.hpp"
#include "../../infra/thread_pool/thread_pool.hpp"

namespace rmirror::core {

namespace remote = adapters::remote;

namespace {

// Шаг записи прогресса в журнал во время передачи
constexpr std::uint64_t kLedgerProgressStep = 1024 * 1024;

auto compile_patterns(const std::vector<std::string>& patterns, std::string_view kind) -> std::vector<std::regex> {
    std::vector<std::regex> compiled;
    for (const auto& pattern : patterns) {
        try {
            compiled.emplace_back(pattern);
        } catch (const std::regex_error& e) {
            spdlog::warn("Invalid {} pattern '{}': {}", kind, pattern, e.what());
        }
    }
    return compiled;
}

auto is_connection_level(infra::ErrorCode code) -> bool {
    switch (code) {
        case infra::ErrorCode::ConnectionFailed:
        case infra::ErrorCode::NetworkTimeout:
        case infra::ErrorCode::ProtocolError:
        case infra::ErrorCode::RemoteRejected:
            return true;
        default:
            return false;
    }
}

} // namespace

auto join_remote(std::string_view base, std::string_view name) -> std::string {
    while (!base.empty() && base.back() == '/') {
        base.remove_suffix(1);
    }
    while (!name.empty() && name.front() == '/') {
        name.remove_prefix(1);
    }
    return fmt::format("{}/{}", base, name);
}

void BatchSummary::merge(const BatchSummary& other) {
    listed_files += other.listed_files;
    already_completed += other.already_completed;
    queued += other.queued;
    transferred += other.transferred;
    failed += other.failed;
    skipped += other.skipped;
    peak_active = std::max(peak_active, other.peak_active);
}

/// Учитывает одновременно выполняющиеся передачи и их максимум.
class TransferEngine::ActiveGuard {
public:
    explicit ActiveGuard(TransferEngine& engine) : engine_(engine) {
        const auto now = engine_.active_.fetch_add(1) + 1;
        auto peak = engine_.peak_active_.load();
        while (now > peak && !engine_.peak_active_.compare_exchange_weak(peak, now)) {
        }
    }
    ~ActiveGuard() { engine_.active_.fetch_sub(1); }

    ActiveGuard(const ActiveGuard&) = delete;
    ActiveGuard& operator=(const ActiveGuard&) = delete;

private:
    TransferEngine& engine_;
};

TransferEngine::TransferEngine(const infra::Config& config,
                               std::shared_ptr<ProgressLedger> ledger,
                               RateGovernor& rate,
                               SpaceGovernor& space,
                               SessionStats& stats,
                               remote::ClientFactory factory)
    : config_(config)
    , ledger_(std::move(ledger))
    , rate_(rate)
    , space_(space)
    , stats_(stats)
    , factory_(std::move(factory))
    , include_patterns_(compile_patterns(config.download.include_patterns, "include"))
    , exclude_patterns_(compile_patterns(config.download.exclude_patterns, "exclude"))
{}

auto TransferEngine::matches_filters_(const std::string& name) const -> bool {
    for (const auto& rx : exclude_patterns_) {
        if (std::regex_match(name, rx)) return false;
    }
    if (include_patterns_.empty()) return true;
    return std::ranges::any_of(include_patterns_, [&](const std::regex& rx) {
        return std::regex_match(name, rx);
    });
}

auto TransferEngine::staging_path_(const FileTask& task) const -> std::filesystem::path {
    return extensions::staging_path_for(task.local_path, config_.download.local_data_dir, config_.download.temp_dir);
}

auto TransferEngine::retry_policy_() const -> infra::RetryPolicy {
    const auto base_ms = static_cast<std::int64_t>(config_.download.backoff_base_seconds * 1000.0);
    return infra::RetryPolicy{
        .max_attempts = static_cast<int>(std::max<std::uint32_t>(config_.remote.retries, 1)),
        .initial_delay = std::chrono::milliseconds(std::max<std::int64_t>(base_ms, 0)),
        .backoff_factor = 2.0,
    };
}

auto TransferEngine::transfer_file(const FileTask& task, std::stop_token stop,
                                   infra::ProgressMonitor* monitor)
    -> infra::Result<TransferResult>
{
    // 1-2. Файл назначения уже есть
    auto existing = adapters::fs::file_size_if_exists(task.local_path);
    if (!existing) {
        return std::unexpected(std::move(existing.error()));
    }
    if (*existing && task.expected_size) {
        if (**existing == *task.expected_size) {
            spdlog::debug("File already complete: {}", task.local_path.string());
            return TransferResult{
                .outcome = TransferOutcome::AlreadyPresent,
                .final_size = **existing,
            };
        }
        if (**existing > *task.expected_size) {
            if (auto removed = adapters::fs::remove_file(task.local_path); !removed) {
                return std::unexpected(std::move(removed.error()));
            }
            spdlog::warn("Removed oversized file: {} ({} > {} bytes)",
                         task.local_path.string(), **existing, *task.expected_size);
        }
    }

    // 3. Staging и точка возобновления
    const auto staging_path = staging_path_(task);
    auto staging = extensions::inspect_staging(staging_path, task.expected_size,
                                               config_.download.resume_downloads);
    if (!staging) {
        return std::unexpected(std::move(staging.error()));
    }

    const auto offset = staging->staged_bytes;
    std::uint64_t received = 0;

    if (staging->decision != extensions::ResumeDecision::Complete) {
        auto connection = remote::open_connection(factory_);
        if (!connection) {
            return std::unexpected(std::move(connection.error()));
        }

        auto writer = extensions::StagingWriter::open(
            staging_path, staging->decision == extensions::ResumeDecision::Fresh);
        if (!writer) {
            return std::unexpected(std::move(writer.error()));
        }
        if (offset > 0) {
            spdlog::debug("Resuming download from byte {}: {}", offset, task.remote_id);
        }

        // 4. Поток в staging, прогресс в журнал крупными шагами
        std::uint64_t since_update = 0;
        auto retrieved = (*connection)->retrieve(task.remote_id, offset,
            [&](std::string_view chunk) -> infra::VoidResult {
                if (stop.stop_requested()) {
                    return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
                        fmt::format("Transfer of {} stopped", task.remote_id)));
                }
                if (auto written = writer->append(chunk); !written) {
                    return written;
                }
                received += chunk.size();
                since_update += chunk.size();
                if (monitor) monitor->add_bytes(chunk.size());
                if (since_update >= kLedgerProgressStep) {
                    ledger_->update_progress(task.remote_id, offset + received, FileStatus::InProgress);
                    since_update = 0;
                }
                return {};
            });

        auto flushed = writer->finish();
        if (!retrieved) {
            cleanup_after_failure_(staging_path, offset, received, retrieved.error());
            return std::unexpected(std::move(retrieved.error()));
        }
        if (!flushed) {
            return std::unexpected(std::move(flushed.error()));
        }
    }

    // 5. Сверка размера
    auto staged = adapters::fs::file_size_if_exists(staging_path);
    if (!staged) {
        return std::unexpected(std::move(staged.error()));
    }
    const auto final_size = staged->value_or(0);
    if (task.expected_size && final_size != *task.expected_size) {
        if (final_size > *task.expected_size) {
            if (auto removed = adapters::fs::remove_file(staging_path); !removed) {
                (void)infra::log_and_return(std::move(removed.error()));
            }
        }
        return std::unexpected(infra::make_error(infra::ErrorCode::SizeMismatch,
            fmt::format("File size mismatch for {}: expected {}, got {}",
                        task.remote_id, *task.expected_size, final_size)));
    }

    // 6. Перенос на место
    if (auto moved = adapters::fs::atomic_move(staging_path, task.local_path); !moved) {
        return std::unexpected(std::move(moved.error()));
    }

    spdlog::info("Successfully downloaded: {}", task.remote_id);
    return TransferResult{
        .outcome = TransferOutcome::Transferred,
        .bytes_received = received,
        .resumed_from = offset,
        .final_size = final_size,
    };
}

void TransferEngine::cleanup_after_failure_(const std::filesystem::path& staging,
                                            std::uint64_t offset, std::uint64_t received,
                                            const infra::Error& err) const
{
    // Частичные данные сохраняются для возобновления. Удаляем только пустой
    // staging после сбоя соединения или staging, для которого сервер отверг REST
    if (!is_connection_level(err.code) || received > 0) {
        return;
    }
    if (offset == 0 || err.code == infra::ErrorCode::RemoteRejected) {
        if (auto removed = adapters::fs::remove_file(staging); !removed) {
            spdlog::debug("Cannot remove staging file {}: {}", staging.string(), removed.error().message);
        }
    }
}

void TransferEngine::discard_if_remote_changed_(const FileTask& task) {
    if (!task.expected_size) {
        return;
    }
    const auto record = ledger_->file(task.remote_id);
    if (!record || !record->expected_size || *record->expected_size == *task.expected_size ||
        record->status == FileStatus::Completed) {
        return;
    }

    spdlog::warn("Remote size of {} changed ({} -> {} bytes), discarding staged data",
                 task.remote_id, *record->expected_size, *task.expected_size);
    if (auto removed = adapters::fs::remove_file(staging_path_(task)); !removed) {
        (void)infra::log_and_return(std::move(removed.error()));
    }
    ledger_->set_expected_size(task.remote_id, *task.expected_size);
}

auto TransferEngine::transfer_with_retry(const FileTask& task, std::stop_token stop,
                                         infra::ProgressMonitor* monitor) -> infra::VoidResult
{
    if (ledger_->is_completed(task.remote_id)) {
        spdlog::debug("Skipping already completed file: {}", task.remote_id);
        stats_.record_skipped();
        return {};
    }

    // Нехватка места не расходует попытки и не помечает файл упавшим
    if (!space_.has_sufficient_space(config_.download.local_data_dir)) {
        stats_.record_skipped();
        return std::unexpected(infra::make_error(infra::ErrorCode::DiskFull,
            fmt::format("Insufficient disk space for {}", task.remote_id)));
    }

    discard_if_remote_changed_(task);
    ledger_->add_file(task.remote_id, task.local_path.string(), task.expected_size);

    ActiveGuard active(*this);
    const auto policy = retry_policy_();
    int attempts_made = 0;

    auto result = infra::with_retry(
        [&](int) -> infra::Result<TransferResult> {
            if (!rate_.wait(stop)) {
                return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
                    fmt::format("Stopped before transferring {}", task.remote_id)));
            }
            ++attempts_made;
            const auto record = ledger_->file(task.remote_id);
            ledger_->update_progress(task.remote_id, record ? record->bytes_transferred : 0,
                                     FileStatus::InProgress);
            return transfer_file(task, stop, monitor);
        },
        policy, stop,
        [&](int attempt, const infra::Error& err) {
            if (err.code == infra::ErrorCode::Interrupted || err.code == infra::ErrorCode::DiskFull) {
                return;
            }
            spdlog::warn("Download attempt {}/{} failed for {}: {}",
                         attempt + 1, policy.max_attempts, task.remote_id, err.message);
            rate_.on_error(err.code);
        });

    const auto current_bytes = [&] {
        const auto record = ledger_->file(task.remote_id);
        return record ? record->bytes_transferred : 0;
    };

    if (result) {
        rate_.on_success();
        ledger_->update_progress(task.remote_id, result->final_size, FileStatus::Completed);
        if (result->outcome == TransferOutcome::AlreadyPresent) {
            stats_.record_skipped();
        } else {
            stats_.record_transferred(result->bytes_received);
        }
        if (auto saved = ledger_->save(); !saved) {
            (void)infra::log_and_return(std::move(saved.error()));
        }
        return {};
    }

    auto err = std::move(result.error());
    switch (err.code) {
        case infra::ErrorCode::Interrupted:
        case infra::ErrorCode::DiskFull:
            // Staging остаётся; запись вернётся в очередь при следующем запуске
            ledger_->update_progress(task.remote_id, current_bytes(), FileStatus::Skipped);
            stats_.record_skipped();
            return std::unexpected(std::move(err));
        default:
            break;
    }

    ledger_->update_progress(task.remote_id, current_bytes(), FileStatus::Failed);
    ledger_->set_error(task.remote_id,
        fmt::format("Failed after {} attempts: {}", attempts_made, err.message));
    stats_.record_failed(task.remote_id);
    spdlog::error("Failed to download {} after {} attempts: {}", task.remote_id, attempts_made, err.message);
    if (auto saved = ledger_->save(); !saved) {
        (void)infra::log_and_return(std::move(saved.error()));
    }
    return std::unexpected(std::move(err));
}

auto TransferEngine::list_directory(const std::string& remote_dir, std::stop_token stop)
    -> infra::Result<std::vector<remote::RemoteEntry>>
{
    auto listing = infra::with_retry(
        [&](int) -> infra::Result<std::vector<remote::RemoteEntry>> {
            if (!rate_.wait(stop)) {
                return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted, "Stopped before listing"));
            }
            auto connection = remote::open_connection(factory_);
            if (!connection) {
                return std::unexpected(std::move(connection.error()));
            }
            return (*connection)->list_directory(remote_dir);
        },
        retry_policy_(), stop,
        [&](int attempt, const infra::Error& err) {
            if (err.code == infra::ErrorCode::Interrupted) return;
            spdlog::warn("Listing attempt {} for {} failed: {}", attempt + 1, remote_dir, err.message);
            rate_.on_error(err.code);
        });

    if (!listing) {
        if (listing.error().code == infra::ErrorCode::Interrupted) {
            return listing;
        }
        return std::unexpected(infra::make_error(infra::ErrorCode::ListingFailed,
            fmt::format("Failed to list {}: {}", remote_dir, listing.error().message)));
    }
    rate_.on_success();
    return listing;
}

auto TransferEngine::transfer_directory(const std::string& remote_dir,
                                        const std::filesystem::path& local_dir,
                                        std::stop_token stop)
    -> infra::Result<BatchSummary>
{
    if (stop.stop_requested()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted, "Stopped before directory"));
    }
    spdlog::info("Processing directory: {}", remote_dir);

    auto listing = list_directory(remote_dir, stop);
    if (!listing) {
        return std::unexpected(std::move(listing.error()));
    }

    std::vector<remote::RemoteEntry> files;
    std::vector<std::string> subdirs;
    for (auto& entry : *listing) {
        if (entry.kind == remote::EntryKind::Directory) {
            subdirs.push_back(entry.name);
        } else if (matches_filters_(entry.name)) {
            files.push_back(std::move(entry));
        }
    }

    BatchSummary summary{.remote_dir = remote_dir, .listed_files = files.size()};
    if (files.empty()) {
        spdlog::warn("No files found in {}", remote_dir);
    }

    std::uint64_t total_bytes = 0;
    for (const auto& f : files) total_bytes += f.size_bytes;
    ledger_->add_directory(remote_dir, local_dir.string(), files.size(), total_bytes);

    std::vector<FileTask> tasks;
    std::uint64_t queued_bytes = 0;
    for (const auto& f : files) {
        // Нулевой размер в листинге (в т.ч. нечисловой) считается неизвестным
        FileTask task{
            .remote_id = join_remote(remote_dir, f.name),
            .local_path = local_dir / f.name,
            .expected_size = f.size_bytes > 0 ? std::optional<std::uint64_t>(f.size_bytes) : std::nullopt,
        };
        if (ledger_->is_completed(task.remote_id)) {
            ++summary.already_completed;
            stats_.record_skipped();
            continue;
        }
        queued_bytes += f.size_bytes;
        tasks.push_back(std::move(task));
    }
    summary.queued = tasks.size();

    bool space_exhausted = false;
    if (tasks.empty()) {
        if (!files.empty()) {
            spdlog::info("All files already downloaded in {}", remote_dir);
        }
    } else {
        spdlog::info("Found {} new files to download in {}", tasks.size(), remote_dir);

        // Остановка пакета: внешний stop или нехватка места в одном из воркеров
        std::stop_source batch_stop;
        std::stop_callback forward_stop(stop, [&batch_stop] { batch_stop.request_stop(); });
        const auto batch_token = batch_stop.get_token();

        // Пик считается для каждого пакета отдельно
        peak_active_.store(active_.load());

        infra::ProgressMonitor monitor(remote_dir, config_.progress.show_progress_bar, config_.quiet);
        monitor.set_total(tasks.size(), queued_bytes);

        std::vector<std::future<infra::VoidResult>> futures;
        futures.reserve(tasks.size());
        {
            infra::ThreadPool pool{std::max<std::uint32_t>(config_.download.max_concurrent_downloads, 1)};
            for (const auto& task : tasks) {
                futures.push_back(pool.enqueue_with_future(
                    [this, &task, &monitor, &batch_stop, batch_token]() -> infra::VoidResult {
                        if (batch_token.stop_requested()) {
                            stats_.record_skipped();
                            return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
                                fmt::format("{} not started", task.remote_id)));
                        }
                        auto res = transfer_with_retry(task, batch_token, &monitor);
                        if (!res && res.error().code == infra::ErrorCode::DiskFull) {
                            batch_stop.request_stop();
                        }
                        monitor.file_done(!res && res.error().code != infra::ErrorCode::Interrupted
                                                && res.error().code != infra::ErrorCode::DiskFull);
                        return res;
                    }));
            }
            pool.wait();
        }

        for (std::size_t i = 0; i < futures.size(); ++i) {
            try {
                auto res = futures[i].get();
                if (res) {
                    ++summary.transferred;
                    continue;
                }
                switch (res.error().code) {
                    case infra::ErrorCode::DiskFull:
                        space_exhausted = true;
                        ++summary.skipped;
                        break;
                    case infra::ErrorCode::Interrupted:
                        ++summary.skipped;
                        break;
                    default:
                        ++summary.failed;
                        break;
                }
            } catch (const std::exception& e) {
                // Исключение одного воркера не останавливает пакет
                const auto& remote_id = tasks[i].remote_id;
                spdlog::error("Exception during download of {}: {}", remote_id, e.what());
                const auto record = ledger_->file(remote_id);
                ledger_->update_progress(remote_id, record ? record->bytes_transferred : 0, FileStatus::Failed);
                ledger_->set_error(remote_id, fmt::format("Unexpected error: {}", e.what()));
                stats_.record_failed(remote_id);
                monitor.file_done(true);
                ++summary.failed;
            }
        }

        summary.peak_active = peak_active_.load();
        spdlog::info("Finished downloading files from {}: {} ok, {} failed, {} skipped",
                     remote_dir, summary.transferred, summary.failed, summary.skipped);
    }

    if (space_exhausted) {
        return std::unexpected(infra::make_error(infra::ErrorCode::DiskFull,
            fmt::format("Disk space exhausted while downloading {}", remote_dir)));
    }
    if (stop.stop_requested()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
            fmt::format("Stopped while downloading {}", remote_dir)));
    }

    if (config_.download.recursive) {
        for (const auto& name : subdirs) {
            auto sub = transfer_directory(join_remote(remote_dir, name), local_dir / name, stop);
            if (!sub) {
                if (sub.error().code == infra::ErrorCode::ListingFailed) {
                    (void)infra::log_and_return(std::move(sub.error()));
                    continue;
                }
                return sub;
            }
            summary.merge(*sub);
        }
    }
    return summary;
}

} // namespace rmirror::core
