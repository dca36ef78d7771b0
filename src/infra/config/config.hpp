#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <chrono>
#include "../error_handler/error.hpp"

namespace rmirror::infra {

struct RemoteSettings {
    std::string host = "ftp.ncbi.nlm.nih.gov";
    std::uint16_t port = 21;
    std::string base_path = "/pubchem/RDF/";
    std::string username = "anonymous";
    std::string password = "anonymous@";
    std::uint32_t timeout_seconds = 30;
    std::uint32_t retries = 3;
};

struct TransferSettings {
    std::filesystem::path local_data_dir = "data/pubchem_rdf";
    std::filesystem::path temp_dir = "data/temp";
    std::uint32_t max_concurrent_downloads = 3;
    double rate_limit_delay = 2.0;          // seconds
    std::size_t chunk_size = 8192;          // bytes
    bool resume_downloads = true;
    bool recursive = false;
    double backoff_base_seconds = 1.0;      // пауза перед повтором: base * 2^attempt

    std::vector<std::string> exclude_patterns;
    std::vector<std::string> include_patterns;
};

struct RateLimitSettings {
    double min_delay = 0.5;
    double max_delay = 30.0;
    double backoff_factor = 2.0;
    std::optional<std::uint32_t> max_requests_per_minute;
};

struct StorageSettings {
    double min_free_space_gb = 50.0;
    bool cleanup_temp_files = true;

    [[nodiscard]] auto min_free_space_bytes() const -> std::uint64_t {
        return static_cast<std::uint64_t>(min_free_space_gb * 1024.0 * 1024.0 * 1024.0);
    }
};

struct LoggingSettings {
    std::string level = "info";
    std::filesystem::path log_file = "logs/rmirror.log";
    std::size_t max_log_size_mb = 100;
    std::size_t backup_count = 5;
    std::string pattern = "[%Y-%m-%d %H:%M:%S] [%l] %v";
};

struct ProgressSettings {
    std::uint32_t save_interval = 10;       // сохранять журнал каждые N файлов
    std::filesystem::path progress_file = "data/download_progress.json";
    bool show_progress_bar = true;
};

/// Переопределения из CLI: заданное поле имеет приоритет над файлом.
struct ConfigOverrides {
    std::optional<std::vector<std::string>> directories;
    std::optional<std::uint32_t> max_concurrent;
    std::optional<double> rate_limit_delay;
    std::optional<double> min_free_space_gb;
    std::optional<std::string> log_level;
    std::optional<std::filesystem::path> local_data_dir;
    bool quiet = false;
};

struct Config {
    RemoteSettings remote;
    TransferSettings download;
    RateLimitSettings rate_limit;
    StorageSettings storage;
    LoggingSettings logging;
    ProgressSettings progress;
    std::vector<std::string> directories_to_download;

    bool quiet = false;

    // Слияние с переопределениями (например, из CLI)
    void merge_with(const ConfigOverrides& other);

    /// Проверка диапазонов; ошибка — InvalidConfig.
    [[nodiscard]] auto validate() const -> VoidResult;
};

/// Загружает конфигурацию из YAML-файла.
/// Без явного пути ищет файл в порядке:
///   1. ./.rmirror.yaml
///   2. $XDG_CONFIG_HOME/rmirror/config.yaml или ~/.config/rmirror/config.yaml
/// Отсутствие файла — ошибка FileNotFound (конфигурация обязательна).
[[nodiscard]] auto load_config(const std::optional<std::filesystem::path>& path = std::nullopt)
    -> Result<Config>;

/// Разбор уже прочитанного текста YAML (без переменных окружения).
[[nodiscard]] auto parse_config(const std::string& yaml_text) -> Result<Config>;

/// Применяет переменные окружения RMIRROR_* поверх конфигурации.
[[nodiscard]] auto apply_env_overrides(Config& config) -> VoidResult;

/// Записывает конфигурацию по умолчанию (create-config).
[[nodiscard]] auto write_default_config(const std::filesystem::path& path) -> VoidResult;

} // namespace rmirror::infra
