// src/extensions/staging.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string_view>
#include "../infra/error_handler/error.hpp"

namespace rmirror::extensions {

enum class ResumeDecision {
    Fresh,      // staging нет (или сброшен): качаем с нуля
    Resume,     // есть частичные данные: REST с staged_bytes
    Complete,   // staging уже полного размера: сеть не нужна
};

struct StagingState {
    std::filesystem::path path;
    std::uint64_t staged_bytes = 0;
    ResumeDecision decision = ResumeDecision::Fresh;
};

/// Путь частичного файла: temp_dir / (local_path относительно data_dir) + ".tmp".
/// Файлы вне data_dir кладутся в корень temp_dir по имени.
[[nodiscard]] auto staging_path_for(const std::filesystem::path& local_path,
                                    const std::filesystem::path& data_dir,
                                    const std::filesystem::path& temp_dir) -> std::filesystem::path;

/// Решает, с какого смещения продолжать. Staging длиннее expected_size
/// (или любой staging при resume_enabled == false) удаляется.
[[nodiscard]] auto inspect_staging(const std::filesystem::path& staging_path,
                                   std::optional<std::uint64_t> expected_size,
                                   bool resume_enabled) -> infra::Result<StagingState>;

/// Дописывает полученные данные в конец staging-файла.
class StagingWriter {
public:
    [[nodiscard]] static auto open(const std::filesystem::path& path, bool truncate)
        -> infra::Result<StagingWriter>;

    [[nodiscard]] auto append(std::string_view chunk) -> infra::VoidResult;

    /// Сбрасывает буферы и закрывает файл.
    [[nodiscard]] auto finish() -> infra::VoidResult;

    [[nodiscard]] auto bytes_written() const -> std::uint64_t { return written_; }

private:
    StagingWriter(std::filesystem::path path, std::ofstream stream)
        : path_(std::move(path)), stream_(std::move(stream)) {}

    std::filesystem::path path_;
    std::ofstream stream_;
    std::uint64_t written_ = 0;
};

} // namespace rmirror::extensions
