#include <chrono>
#include <thread>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/logging/logging.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/session/report.hpp"
#include "core/session/session_controller.hpp"

using ARGS = rmirror::cli::CLIArgs;

constexpr auto args_parser = rmirror::cli::parse_args;

static auto
__out_config_verse(const rmirror::infra::Config& config)
-> void {
    spdlog::info("rmirror {}", rmirror::cli::kVersion);
    spdlog::info("Remote: {}:{}{}", config.remote.host, config.remote.port, config.remote.base_path);
    spdlog::info("Data dir: {}", config.download.local_data_dir.string());
    spdlog::info("Temp dir: {}", config.download.temp_dir.string());
    spdlog::info("Max concurrent: {}", config.download.max_concurrent_downloads);
    spdlog::info("Rate limit delay: {:.2f}s", config.download.rate_limit_delay);
    spdlog::info("Min free space: {:.1f} GB", config.storage.min_free_space_gb);
}

static auto
__exit_code(const rmirror::core::SessionController& session)
-> int {
    if (const auto& err = session.last_error()) {
        return err->to_exit_code();
    }
    return 1;
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        rmirror::infra::install_signal_handler();

        auto args_opt = args_parser(argc, argv);
        if (!args_opt) {
            return 1; // --help, --version или ошибка
        }
        const ARGS& args = *args_opt;

        if (args.create_config) {
            if (auto res = rmirror::infra::write_default_config(args.config_path); !res) {
                spdlog::error("Config error: {}", res.error().message);
                return res.error().to_exit_code();
            }
            fmt::print("Default configuration created at {}\n", args.config_path.string());
            return 0;
        }

        // 1. Файл + переменные окружения
        auto config_res = rmirror::infra::load_config(args.config_path);
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error().message);
            if (config_res.error().code == rmirror::infra::ErrorCode::FileNotFound) {
                spdlog::info("Use --create-config to write a default configuration");
            }
            return config_res.error().to_exit_code();
        }
        auto config = std::move(*config_res);

        // 2. CLI имеет приоритет
        config.merge_with(rmirror::cli::to_overrides(args));
        if (auto res = config.validate(); !res) {
            spdlog::error("Config error: {}", res.error().message);
            return res.error().to_exit_code();
        }

        if (auto res = rmirror::infra::setup_logging(config.logging, config.quiet); !res) {
            spdlog::error("Logging setup failed: {}", res.error().message);
            return res.error().to_exit_code();
        }
        rmirror::infra::log_system_info(config.download.local_data_dir);

        if (args.cleanup_logs) {
            const auto removed = rmirror::infra::cleanup_old_logs(config.logging.log_file.parent_path());
            spdlog::info("Removed {} old log files", removed);
        }

        if (!config.quiet) {
            __out_config_verse(config);
        }

        rmirror::core::SessionController session(config);

        if (args.status) {
            rmirror::core::print_status(session.status());
            return 0;
        }

        // Сигнал -> остановка сессии
        std::jthread watcher([&session](std::stop_token stop) {
            while (!stop.stop_requested()) {
                if (rmirror::infra::is_interrupted()) {
                    spdlog::warn("Interrupt received, stopping");
                    session.request_stop();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        const bool ok = args.retry_failed
            ? session.retry_failed(args.max_retries)
            : session.download_all();

        watcher.request_stop();

        if (!ok) {
            const int code = __exit_code(session);
            spdlog::error("Session finished with errors (exit code {})", code);
            return code;
        }

        spdlog::info("Session completed successfully");
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
