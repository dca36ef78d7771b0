#include "fs.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <system_error>
#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

namespace rmirror::adapters::fs {

namespace {

// fsync по пути; ошибки открытия игнорируются вызывающим только для каталогов
auto sync_path(const std::filesystem::path& path, int flags) -> bool {
    const int fd = ::open(path.c_str(), flags);
    if (fd == -1) return false;
    const bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}

// Уборка временного файла на пути ошибки: исходная ошибка важнее
void discard_temp(const std::filesystem::path& tmp) {
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    if (ec) {
        spdlog::debug("Cannot remove temporary file {}: {}", tmp.string(), ec.message());
    }
}

} // namespace

auto file_size_if_exists(const std::filesystem::path& path)
    -> infra::Result<std::optional<std::uint64_t>>
{
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot stat {}", path.string())));
    }
    if (!std::filesystem::exists(status)) {
        return std::optional<std::uint64_t>{};
    }
    if (!std::filesystem::is_regular_file(status)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
            fmt::format("Not a regular file: {}", path.string())));
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot get size of {}", path.string())));
    }
    return std::optional<std::uint64_t>{size};
}

auto ensure_parent(const std::filesystem::path& path) -> infra::VoidResult {
    if (!path.has_parent_path()) return {};
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec,
            fmt::format("Cannot create directory {}", path.parent_path().string())));
    }
    return {};
}

auto remove_file(const std::filesystem::path& path) -> infra::VoidResult {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot remove {}", path.string())));
    }
    return {};
}

auto atomic_move(const std::filesystem::path& src,
                 const std::filesystem::path& dst) -> infra::VoidResult
{
    if (auto res = ensure_parent(dst); !res) {
        return res;
    }

    std::error_code ec;
    std::filesystem::rename(src, dst, ec);
    if (!ec) {
        return {};
    }
    if (ec != std::errc::cross_device_link) {
        return std::unexpected(infra::from_error_code(ec,
            fmt::format("Cannot move {} to {}", src.string(), dst.string())));
    }

    // staging на другом устройстве: копия рядом с dst, затем rename
    spdlog::debug("Cross-device move {} -> {}, copying", src.string(), dst.string());
    auto tmp = dst;
    tmp += ".partial";
    std::filesystem::copy_file(src, tmp, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        discard_temp(tmp);
        return std::unexpected(infra::from_error_code(ec,
            fmt::format("Cannot copy {} to {}", src.string(), tmp.string())));
    }
    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        discard_temp(tmp);
        return std::unexpected(infra::from_error_code(ec,
            fmt::format("Cannot move {} to {}", tmp.string(), dst.string())));
    }
    return remove_file(src);
}

auto directory_size(const std::filesystem::path& path) -> std::uint64_t {
    std::uint64_t total = 0;
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        return 0;
    }

    for (auto it = std::filesystem::recursive_directory_iterator(
             path, std::filesystem::directory_options::skip_permission_denied, ec);
         !ec && it != std::filesystem::recursive_directory_iterator();
         it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) {
            const auto size = it->file_size(entry_ec);
            if (!entry_ec) total += size;
        }
    }
    if (ec) {
        spdlog::debug("Directory walk of {} stopped early: {}", path.string(), ec.message());
    }
    return total;
}

auto write_atomically(const std::filesystem::path& path,
                      std::string_view contents) -> infra::VoidResult
{
    if (auto res = ensure_parent(path); !res) {
        return res;
    }

    auto tmp = path;
    tmp += ".tmp";

    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd == -1) {
        return std::unexpected(infra::from_error_code(
            std::error_code(errno, std::generic_category()),
            fmt::format("Cannot open {}", tmp.string())));
    }

    std::size_t written = 0;
    while (written < contents.size()) {
        const ssize_t n = ::write(fd, contents.data() + written, contents.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            const std::error_code ec(errno, std::generic_category());
            ::close(fd);
            discard_temp(tmp);
            return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot write {}", tmp.string())));
        }
        written += static_cast<std::size_t>(n);
    }

    if (::fsync(fd) != 0) {
        const std::error_code ec(errno, std::generic_category());
        ::close(fd);
        discard_temp(tmp);
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot sync {}", tmp.string())));
    }
    ::close(fd);

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        discard_temp(tmp);
        return std::unexpected(infra::from_error_code(ec,
            fmt::format("Cannot replace {}", path.string())));
    }

    // rename долговечен только после fsync каталога
    const auto parent = path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");
    if (!sync_path(parent, O_RDONLY | O_DIRECTORY)) {
        spdlog::debug("Cannot fsync directory {}", parent.string());
    }
    return {};
}

} // namespace rmirror::adapters::fs
