#pragma once

#include <chrono>
#include <filesystem>
#include <spdlog/spdlog.h>
#include "../config/config.hpp"
#include "../error_handler/error.hpp"

namespace rmirror::infra {

/// Устанавливает логгер по умолчанию "rmirror": цветной stdout + ротируемый файл.
/// В режиме quiet консоль получает только предупреждения и ошибки.
[[nodiscard]] auto setup_logging(const LoggingSettings& settings, bool quiet = false) -> VoidResult;

/// Разбор имени уровня ("debug", "info", "warning", "error"); неизвестное имя — InvalidConfig.
[[nodiscard]] auto parse_level(std::string_view name) -> Result<spdlog::level::level_enum>;

/// Логирует сведения о машине при старте: число потоков и объём диска под path.
void log_system_info(const std::filesystem::path& path);

/// Удаляет *.log* файлы старше max_age в каталоге логов. Возвращает число удалённых.
auto cleanup_old_logs(const std::filesystem::path& log_directory,
                      std::chrono::hours max_age = std::chrono::hours(24 * 30)) -> std::size_t;

} // namespace rmirror::infra
