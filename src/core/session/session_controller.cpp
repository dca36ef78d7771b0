#include "session_controller.hpp"
#include <chrono>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "../../adapters/ftp/ftp_client.hpp"
#include "report.hpp"

namespace rmirror::core {

/// Сброс журнала (и, для завершённой сессии, очистка temp) при любом выходе.
class SessionController::Finalizer {
public:
    Finalizer(SessionController& owner, bool cleanup_temp)
        : owner_(owner), cleanup_temp_(cleanup_temp) {}

    ~Finalizer() {
        if (auto saved = owner_.ledger_->save(true); !saved) {
            (void)infra::log_and_return(std::move(saved.error()));
        }
        // После остановки staging нужен для возобновления
        if (cleanup_temp_ && !owner_.stop_requested()) {
            (void)owner_.space_.cleanup_temp_files(owner_.config_.download.temp_dir);
        }
        spdlog::info("Progress ledger flushed to {}", owner_.ledger_->snapshot_path().string());
    }

    Finalizer(const Finalizer&) = delete;
    Finalizer& operator=(const Finalizer&) = delete;

private:
    SessionController& owner_;
    bool cleanup_temp_;
};

SessionController::SessionController(infra::Config config)
    : SessionController(config, adapters::ftp::make_client_factory(config)) {}

SessionController::SessionController(infra::Config config, adapters::remote::ClientFactory factory)
    : config_(std::move(config))
    , ledger_(std::make_shared<ProgressLedger>(config_.progress.progress_file, config_.progress.save_interval))
    , rate_(RateGovernorOptions::from_config(config_))
    , space_(config_.storage.min_free_space_bytes())
    , engine_(config_, ledger_, rate_, space_, stats_, std::move(factory))
{}

void SessionController::request_stop() {
    if (stop_source_.request_stop()) {
        spdlog::info("Stop requested, finishing in-flight transfers");
    }
}

void SessionController::fail_(infra::Error err) {
    last_error_ = infra::log_and_return(std::move(err));
}

auto SessionController::prepare_directories_() -> bool {
    for (const auto& dir : {config_.download.local_data_dir, config_.download.temp_dir}) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            fail_(infra::from_error_code(ec, fmt::format("Cannot create {}", dir.string())));
            return false;
        }
    }
    return true;
}

auto SessionController::ensure_space_before_(const std::string& directory) -> bool {
    const auto& data_dir = config_.download.local_data_dir;
    if (space_.has_sufficient_space(data_dir)) {
        return true;
    }

    spdlog::error("Insufficient disk space before downloading {}", directory);
    const auto freed = space_.cleanup_temp_files(config_.download.temp_dir);
    if (freed > 0) {
        spdlog::info("Freed {:.2f} GB of temp space", static_cast<double>(freed) / (1024.0 * 1024.0 * 1024.0));
        if (space_.has_sufficient_space(data_dir)) {
            return true;
        }
    }

    fail_(infra::make_error(infra::ErrorCode::DiskFull,
        fmt::format("Still insufficient disk space after cleanup, stopping before {}", directory)));
    return false;
}

auto SessionController::download_all() -> bool {
    last_error_.reset();
    const auto stop = stop_source_.get_token();

    if (!prepare_directories_()) {
        return false;
    }
    Finalizer finalizer(*this, config_.storage.cleanup_temp_files);

    spdlog::info("Starting download from {}{}", config_.remote.host, config_.remote.base_path);
    spdlog::info("Directories to download: {}", fmt::join(config_.directories_to_download, ", "));

    if (!space_.has_sufficient_space(config_.download.local_data_dir)) {
        fail_(infra::make_error(infra::ErrorCode::DiskFull, "Insufficient disk space to start download"));
        return false;
    }

    const auto start = std::chrono::steady_clock::now();
    bool ok = true;

    for (const auto& directory : config_.directories_to_download) {
        if (stop.stop_requested()) {
            fail_(infra::make_error(infra::ErrorCode::Interrupted, "Download interrupted by user"));
            ok = false;
            break;
        }
        if (!ensure_space_before_(directory)) {
            ok = false;
            break;
        }

        const auto remote_dir = join_remote(config_.remote.base_path, directory);
        const auto local_dir = config_.download.local_data_dir / std::filesystem::path(remote_dir).filename();

        auto batch = engine_.transfer_directory(remote_dir, local_dir, stop);
        if (!batch) {
            const auto code = batch.error().code;
            fail_(std::move(batch.error()));
            ok = false;
            if (code == infra::ErrorCode::DiskFull || code == infra::ErrorCode::Interrupted) {
                break;
            }
            continue; // ListingFailed и прочее: следующий каталог
        }

        if (!config_.quiet) {
            print_ledger_statistics(ledger_->statistics());
        }
    }

    const auto hours = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count() / 3600.0;
    spdlog::info("Download session completed in {:.2f} hours", hours);

    if (!config_.quiet) {
        print_ledger_statistics(ledger_->statistics());
        print_session_summary(stats_.snapshot());
    }
    return ok;
}

auto SessionController::retry_failed(std::uint32_t max_retries) -> bool {
    last_error_.reset();
    const auto stop = stop_source_.get_token();

    const auto failed = ledger_->failed_files(max_retries);
    if (failed.empty()) {
        spdlog::info("No failed files to retry");
        return true;
    }
    if (!prepare_directories_()) {
        return false;
    }
    Finalizer finalizer(*this, false);

    spdlog::info("Retrying {} failed downloads", failed.size());
    std::size_t succeeded = 0;
    for (const auto& remote_id : failed) {
        const auto record = ledger_->file(remote_id);
        if (!record) continue;

        FileTask task{
            .remote_id = remote_id,
            .local_path = record->local_path,
            .expected_size = record->expected_size,
        };
        auto res = engine_.transfer_with_retry(task, stop);
        if (res) {
            ++succeeded;
            continue;
        }
        const auto code = res.error().code;
        if (code == infra::ErrorCode::DiskFull || code == infra::ErrorCode::Interrupted) {
            fail_(std::move(res.error()));
            break;
        }
    }

    spdlog::info("Successfully retried {}/{} files", succeeded, failed.size());
    if (!config_.quiet) {
        print_session_summary(stats_.snapshot());
    }
    return succeeded == failed.size();
}

auto SessionController::status() const -> SessionStatus {
    SessionStatus status{
        .ledger = ledger_->statistics(),
        .rate = rate_.stats(),
        .session = stats_.snapshot(),
    };
    if (auto usage = space_.usage_info(config_.download.local_data_dir)) {
        status.disk = *usage;
    } else {
        (void)infra::log_and_return(std::move(usage.error()));
    }
    return status;
}

} // namespace rmirror::core
