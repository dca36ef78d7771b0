#include "logging.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace rmirror::infra {

auto parse_level(std::string_view name) -> Result<spdlog::level::level_enum> {
    std::string lowered(name);
    std::ranges::transform(lowered, lowered.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return spdlog::level::debug;
    if (lowered == "info") return spdlog::level::info;
    if (lowered == "warning" || lowered == "warn") return spdlog::level::warn;
    if (lowered == "error") return spdlog::level::err;
    if (lowered == "trace") return spdlog::level::trace;
    if (lowered == "critical") return spdlog::level::critical;

    return std::unexpected(make_error(ErrorCode::InvalidConfig,
        fmt::format("Unknown log level '{}'", name)));
}

auto setup_logging(const LoggingSettings& settings, bool quiet) -> VoidResult {
    auto level = parse_level(settings.level);
    if (!level) {
        return std::unexpected(std::move(level.error()));
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(quiet ? spdlog::level::warn : *level);
    sinks.push_back(console);

    if (!settings.log_file.empty()) {
        std::error_code ec;
        if (settings.log_file.has_parent_path()) {
            std::filesystem::create_directories(settings.log_file.parent_path(), ec);
        }
        if (ec) {
            return std::unexpected(from_error_code(ec, "Cannot create log directory"));
        }
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                settings.log_file.string(),
                settings.max_log_size_mb * 1024 * 1024,
                settings.backup_count);
            file->set_level(*level);
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& e) {
            return std::unexpected(make_error(ErrorCode::PermissionDenied,
                fmt::format("Cannot open log file {}: {}", settings.log_file.string(), e.what())));
        }
    }

    auto logger = std::make_shared<spdlog::logger>("rmirror", sinks.begin(), sinks.end());
    logger->set_level(*level);
    logger->set_pattern(settings.pattern);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    spdlog::info("Logging initialized - Level: {}, File: {}", settings.level, settings.log_file.string());
    return {};
}

void log_system_info(const std::filesystem::path& path) {
    spdlog::info("{}", std::string(60, '='));
    spdlog::info("RMIRROR STARTUP");
    spdlog::info("{}", std::string(60, '='));
    spdlog::info("Hardware threads: {}", std::thread::hardware_concurrency());

    std::error_code ec;
    const auto info = std::filesystem::space(path.empty() ? std::filesystem::path(".") : path, ec);
    if (!ec) {
        constexpr double gb = 1024.0 * 1024.0 * 1024.0;
        spdlog::info("Disk Total: {:.2f} GB", static_cast<double>(info.capacity) / gb);
        spdlog::info("Disk Free: {:.2f} GB", static_cast<double>(info.available) / gb);
    } else {
        spdlog::debug("Disk info unavailable for {}: {}", path.string(), ec.message());
    }
    spdlog::info("{}", std::string(60, '='));
}

std::size_t cleanup_old_logs(const std::filesystem::path& log_directory, std::chrono::hours max_age) {
    std::error_code ec;
    if (!std::filesystem::is_directory(log_directory, ec)) {
        return 0;
    }

    const auto now = std::filesystem::file_time_type::clock::now();
    std::size_t removed = 0;

    for (const auto& entry : std::filesystem::directory_iterator(log_directory, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        const auto name = entry.path().filename().string();
        if (name.find(".log") == std::string::npos) continue;

        const auto mtime = entry.last_write_time(ec);
        if (ec) continue;
        if (now - mtime < max_age) continue;

        if (std::filesystem::remove(entry.path(), ec)) {
            ++removed;
            spdlog::debug("Removed old log file {}", entry.path().string());
        } else if (ec) {
            spdlog::warn("Failed to remove old log file {}: {}", entry.path().string(), ec.message());
        }
    }

    if (removed > 0) {
        spdlog::info("Cleaned up {} old log files", removed);
    }
    return removed;
}

} // namespace rmirror::infra
