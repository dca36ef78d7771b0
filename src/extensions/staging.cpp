// staging.cpp
#include "staging.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../adapters/fs.hpp"

namespace rmirror::extensions {

auto staging_path_for(const std::filesystem::path& local_path,
                      const std::filesystem::path& data_dir,
                      const std::filesystem::path& temp_dir) -> std::filesystem::path
{
    auto relative = local_path.lexically_normal().lexically_relative(data_dir.lexically_normal());
    if (relative.empty() || *relative.begin() == "..") {
        relative = local_path.filename();
    }
    auto staging = temp_dir / relative;
    staging += ".tmp";
    return staging;
}

auto inspect_staging(const std::filesystem::path& staging_path,
                     std::optional<std::uint64_t> expected_size,
                     bool resume_enabled) -> infra::Result<StagingState>
{
    StagingState state{.path = staging_path};

    auto size = adapters::fs::file_size_if_exists(staging_path);
    if (!size) {
        return std::unexpected(std::move(size.error()));
    }
    if (!*size) {
        return state;
    }

    const auto staged = **size;
    const bool oversized = expected_size && staged > *expected_size;
    if (!resume_enabled || oversized) {
        if (oversized) {
            spdlog::warn("Staging file {} is larger than expected ({} > {}), discarding",
                         staging_path.string(), staged, *expected_size);
        }
        if (auto removed = adapters::fs::remove_file(staging_path); !removed) {
            return std::unexpected(std::move(removed.error()));
        }
        return state;
    }

    state.staged_bytes = staged;
    if (expected_size && staged == *expected_size) {
        state.decision = ResumeDecision::Complete;
    } else if (staged > 0) {
        state.decision = ResumeDecision::Resume;
    }
    return state;
}

auto StagingWriter::open(const std::filesystem::path& path, bool truncate)
    -> infra::Result<StagingWriter>
{
    if (auto res = adapters::fs::ensure_parent(path); !res) {
        return std::unexpected(std::move(res.error()));
    }

    const auto mode = std::ios::binary | (truncate ? std::ios::trunc : std::ios::app);
    std::ofstream stream(path, mode);
    if (!stream) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError,
            fmt::format("Cannot open staging file {}", path.string())));
    }
    return StagingWriter{path, std::move(stream)};
}

auto StagingWriter::append(std::string_view chunk) -> infra::VoidResult {
    if (!stream_.write(chunk.data(), static_cast<std::streamsize>(chunk.size()))) {
        // ofstream не различает ENOSPC; проверяем место по факту
        std::error_code ec;
        const auto space = std::filesystem::space(path_.parent_path(), ec);
        if (!ec && space.available < chunk.size()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::DiskFull,
                fmt::format("No space left while writing {}", path_.string())));
        }
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError,
            fmt::format("Write error in {} after {} bytes", path_.string(), written_)));
    }
    written_ += chunk.size();
    return {};
}

auto StagingWriter::finish() -> infra::VoidResult {
    stream_.flush();
    const bool ok = static_cast<bool>(stream_);
    stream_.close();
    if (!ok || stream_.fail()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError,
            fmt::format("Cannot flush staging file {}", path_.string())));
    }
    return {};
}

} // namespace rmirror::extensions
