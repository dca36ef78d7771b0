#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include "../../infra/error_handler/error.hpp"

namespace rmirror::core {

struct DiskUsage {
    std::uint64_t total_bytes = 0;
    std::uint64_t used_bytes = 0;
    std::uint64_t free_bytes = 0;
    double percent_used = 0.0;
    double percent_free = 0.0;
    bool sufficient = false;
};

/// Контроль свободного места: go/no-go перед передачами и очистка temp.
class SpaceGovernor {
public:
    explicit SpaceGovernor(std::uint64_t min_free_bytes)
        : min_free_bytes_(min_free_bytes) {}

    /// Доступное место на устройстве path; создаёт path при отсутствии.
    [[nodiscard]] auto free_space(const std::filesystem::path& path) const -> infra::Result<std::uint64_t>;

    /// free_space(path) >= threshold (по умолчанию — min_free_bytes).
    /// Нехватка и ошибка запроса логируются как DiskFull и дают false.
    [[nodiscard]] auto has_sufficient_space(const std::filesystem::path& path,
                                            std::optional<std::uint64_t> threshold = std::nullopt) const -> bool;

    /// Удаляет все файлы под dir, затем опустевшие подкаталоги (сам dir остаётся).
    /// Возвращает разницу занятого объёма до и после.
    auto cleanup_temp_files(const std::filesystem::path& dir) const -> std::uint64_t;

    [[nodiscard]] auto usage_info(const std::filesystem::path& path) const -> infra::Result<DiskUsage>;

    [[nodiscard]] auto min_free_bytes() const -> std::uint64_t { return min_free_bytes_; }

private:
    std::uint64_t min_free_bytes_;
};

} // namespace rmirror::core
