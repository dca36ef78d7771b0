#include "space_governor.hpp"
#include <algorithm>
#include <functional>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <vector>
#include "../../adapters/fs.hpp"

namespace rmirror::core {

namespace {

constexpr double kGiB = 1024.0 * 1024.0 * 1024.0;

auto to_gib(std::uint64_t bytes) -> double {
    return static_cast<double>(bytes) / kGiB;
}

} // namespace

auto SpaceGovernor::free_space(const std::filesystem::path& path) const -> infra::Result<std::uint64_t> {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot create {}", path.string())));
    }

    const auto info = std::filesystem::space(path, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot query free space of {}", path.string())));
    }
    spdlog::debug("Free space at {}: {:.2f} GB", path.string(), to_gib(info.available));
    return static_cast<std::uint64_t>(info.available);
}

auto SpaceGovernor::has_sufficient_space(const std::filesystem::path& path,
                                         std::optional<std::uint64_t> threshold) const -> bool
{
    const auto required = threshold.value_or(min_free_bytes_);

    auto free = free_space(path);
    if (!free) {
        (void)infra::log_and_return(std::move(free.error()));
        return false;
    }
    if (*free >= required) {
        return true;
    }

    (void)infra::log_and_return(infra::make_error(infra::ErrorCode::DiskFull,
        fmt::format("Insufficient disk space. Required: {:.2f} GB, Available: {:.2f} GB",
                    to_gib(required), to_gib(*free))));
    return false;
}

auto SpaceGovernor::cleanup_temp_files(const std::filesystem::path& dir) const -> std::uint64_t {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return 0;
    }

    const auto before = adapters::fs::directory_size(dir);

    std::vector<std::filesystem::path> files;
    std::vector<std::filesystem::path> dirs;
    for (auto it = std::filesystem::recursive_directory_iterator(
             dir, std::filesystem::directory_options::skip_permission_denied, ec);
         !ec && it != std::filesystem::recursive_directory_iterator();
         it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_directory(entry_ec) && !it->is_symlink(entry_ec)) {
            dirs.push_back(it->path());
        } else {
            files.push_back(it->path());
        }
    }
    if (ec) {
        spdlog::debug("Temp walk of {} stopped early: {}", dir.string(), ec.message());
    }

    for (const auto& file : files) {
        if (auto removed = adapters::fs::remove_file(file); !removed) {
            spdlog::debug("Failed to remove temp file {}: {}", file.string(), removed.error().message);
        }
    }

    // Глубже лежащие каталоги идут позже в лексикографическом порядке
    std::ranges::sort(dirs, std::greater<>{});
    for (const auto& sub : dirs) {
        std::error_code rm_ec;
        std::filesystem::remove(sub, rm_ec);
        if (rm_ec) {
            spdlog::debug("Failed to remove temp dir {}: {}", sub.string(), rm_ec.message());
        }
    }

    const auto after = adapters::fs::directory_size(dir);
    const auto freed = before > after ? before - after : 0;
    spdlog::info("Cleaned up {:.2f} GB from temp directory {}", to_gib(freed), dir.string());
    return freed;
}

auto SpaceGovernor::usage_info(const std::filesystem::path& path) const -> infra::Result<DiskUsage> {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    const auto info = std::filesystem::space(path, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot query disk usage of {}", path.string())));
    }

    DiskUsage usage;
    usage.total_bytes = info.capacity;
    usage.free_bytes = info.available;
    usage.used_bytes = info.capacity >= info.free ? info.capacity - info.free : 0;
    if (usage.total_bytes > 0) {
        usage.percent_used = 100.0 * static_cast<double>(usage.used_bytes) / static_cast<double>(usage.total_bytes);
        usage.percent_free = 100.0 * static_cast<double>(usage.free_bytes) / static_cast<double>(usage.total_bytes);
    }
    usage.sufficient = usage.free_bytes >= min_free_bytes_;
    return usage;
}

} // namespace rmirror::core
