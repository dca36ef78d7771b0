#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <filesystem>
#include "../../infra/config/config.hpp"

namespace rmirror::cli {

inline constexpr std::string_view kVersion = "1.0.0";

struct CLIArgs
{
    std::filesystem::path config_path{"config/config.yaml"}; // -c, --config
    bool status{false};                                       // --status
    bool retry_failed{false};                                 // --retry-failed
    std::uint32_t max_retries{3};                             // --max-retries=N
    bool create_config{false};                                // --create-config
    bool cleanup_logs{false};                                 // --cleanup-logs
    bool quiet{false};                                        // -q, --quiet
    std::vector<std::string> directories;                     // --directories a b c
    std::optional<std::uint32_t> max_concurrent;              // --max-concurrent=N
    std::optional<double> rate_limit;                         // --rate-limit=SECONDS
    std::optional<double> min_space;                          // --min-space=GB
    std::optional<std::string> log_level;                     // --log-level=LEVEL
    std::optional<std::string> data_dir;                      // --data-dir=PATH
};

/// Разбор аргументов командной строки (CLI11).
/// nullopt: --help, --version или ошибка разбора (сообщение уже выведено).
std::optional<CLIArgs> parse_args(int argc, char const* const* argv);

/// Поля, заданные в командной строке, как переопределения конфигурации.
[[nodiscard]] auto to_overrides(const CLIArgs& args) -> infra::ConfigOverrides;

} // namespace rmirror::cli
