#pragma once

#include <filesystem>
#include <expected>
#include <cstdint>
#include <optional>
#include <string_view>
#include "infra/error_handler/error.hpp"

namespace rmirror::adapters::fs {

/// Размер обычного файла или nullopt, если файла нет.
[[nodiscard]] auto file_size_if_exists(const std::filesystem::path& path)
    -> infra::Result<std::optional<std::uint64_t>>;

/// Создаёт родительский каталог path (если он есть).
[[nodiscard]] auto ensure_parent(const std::filesystem::path& path) -> infra::VoidResult;

/// Удаляет файл; отсутствие файла — не ошибка.
[[nodiscard]] auto remove_file(const std::filesystem::path& path) -> infra::VoidResult;

/// Атомарно перемещает src на место dst (rename). Между устройствами
/// копирует во временный файл рядом с dst и переименовывает его.
[[nodiscard]] auto atomic_move(const std::filesystem::path& src,
                               const std::filesystem::path& dst) -> infra::VoidResult;

/// Суммарный размер обычных файлов под path; недоступные записи пропускаются.
[[nodiscard]] auto directory_size(const std::filesystem::path& path) -> std::uint64_t;

/// Записывает содержимое в tmp и переименовывает поверх path.
[[nodiscard]] auto write_atomically(const std::filesystem::path& path,
                                    std::string_view contents) -> infra::VoidResult;

} // namespace rmirror::adapters::fs
