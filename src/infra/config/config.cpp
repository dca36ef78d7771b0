#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

#include "config.hpp"

namespace rmirror::infra {

void Config::merge_with(const ConfigOverrides& other) {
    if (other.directories && !other.directories->empty()) directories_to_download = *other.directories;
    if (other.max_concurrent) download.max_concurrent_downloads = *other.max_concurrent;
    if (other.rate_limit_delay) download.rate_limit_delay = *other.rate_limit_delay;
    if (other.min_free_space_gb) storage.min_free_space_gb = *other.min_free_space_gb;
    if (other.log_level) logging.level = *other.log_level;
    if (other.local_data_dir) download.local_data_dir = *other.local_data_dir;
    if (other.quiet) quiet = true;
}

namespace {

template<typename T>
auto check_range(std::string_view name, T value, T min_val, T max_val) -> VoidResult {
    if (value < min_val || value > max_val) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            fmt::format("Configuration {} must be between {} and {} (got {})", name, min_val, max_val, value)));
    }
    return {};
}

template<typename T>
void read_value(const YAML::Node& section, const char* key, T& out) {
    if (section[key]) out = section[key].as<T>();
}

void read_path(const YAML::Node& section, const char* key, std::filesystem::path& out) {
    if (section[key]) out = section[key].as<std::string>();
}

auto require_keys(const YAML::Node& section, std::string_view section_name,
                  std::initializer_list<const char*> keys) -> VoidResult {
    for (const auto* key : keys) {
        if (!section[key]) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                fmt::format("Missing required {} configuration: {}", section_name, key)));
        }
    }
    return {};
}

auto get_config_paths() -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> paths;

    // 1. Локальный файл
    paths.emplace_back(".rmirror.yaml");

    // 2. Пользовательский файл
    const char* config_home = std::getenv("XDG_CONFIG_HOME");
    if (config_home && std::filesystem::exists(config_home)) {
        paths.push_back(std::filesystem::path(config_home) / "rmirror" / "config.yaml");
    } else if (const char* home = std::getenv("HOME")) {
        paths.push_back(std::filesystem::path(home) / ".config" / "rmirror" / "config.yaml");
    }

    return paths;
}

auto from_yaml(const YAML::Node& root) -> Result<Config> {
    if (!root.IsMap()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig, "Configuration root must be a mapping"));
    }

    // "ftp" — прежнее имя секции remote
    const auto remote = root["remote"] ? root["remote"] : root["ftp"];
    if (!remote) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig, "Missing required configuration section: remote"));
    }
    for (const auto* section : {"download", "storage", "logging", "progress"}) {
        if (!root[section]) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                fmt::format("Missing required configuration section: {}", section)));
        }
    }

    const auto download = root["download"];
    const auto storage = root["storage"];
    if (auto res = require_keys(remote, "remote", {"host", "base_path", "timeout", "retries"}); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (auto res = require_keys(download, "download", {"local_data_dir", "temp_dir", "rate_limit_delay"}); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (auto res = require_keys(storage, "storage", {"min_free_space_gb"}); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (!root["directories_to_download"]) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Missing required configuration: directories_to_download"));
    }
    if (!root["directories_to_download"].IsSequence()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig, "directories_to_download must be a list"));
    }

    Config cfg{};

    read_value(remote, "host", cfg.remote.host);
    read_value(remote, "port", cfg.remote.port);
    read_value(remote, "base_path", cfg.remote.base_path);
    read_value(remote, "username", cfg.remote.username);
    read_value(remote, "password", cfg.remote.password);
    read_value(remote, "timeout", cfg.remote.timeout_seconds);
    read_value(remote, "retries", cfg.remote.retries);

    read_path(download, "local_data_dir", cfg.download.local_data_dir);
    read_path(download, "temp_dir", cfg.download.temp_dir);
    read_value(download, "max_concurrent_downloads", cfg.download.max_concurrent_downloads);
    read_value(download, "rate_limit_delay", cfg.download.rate_limit_delay);
    read_value(download, "chunk_size", cfg.download.chunk_size);
    read_value(download, "resume_downloads", cfg.download.resume_downloads);
    read_value(download, "recursive", cfg.download.recursive);
    read_value(download, "backoff_base_seconds", cfg.download.backoff_base_seconds);
    if (download["exclude"]) {
        for (const auto& pat : download["exclude"]) {
            cfg.download.exclude_patterns.push_back(pat.as<std::string>());
        }
    }
    if (download["include"]) {
        for (const auto& pat : download["include"]) {
            cfg.download.include_patterns.push_back(pat.as<std::string>());
        }
    }

    if (const auto rate = root["rate_limit"]) {
        read_value(rate, "min_delay", cfg.rate_limit.min_delay);
        read_value(rate, "max_delay", cfg.rate_limit.max_delay);
        read_value(rate, "backoff_factor", cfg.rate_limit.backoff_factor);
        if (rate["max_requests_per_minute"] && !rate["max_requests_per_minute"].IsNull()) {
            cfg.rate_limit.max_requests_per_minute = rate["max_requests_per_minute"].as<std::uint32_t>();
        }
    }

    read_value(storage, "min_free_space_gb", cfg.storage.min_free_space_gb);
    read_value(storage, "cleanup_temp_files", cfg.storage.cleanup_temp_files);

    const auto logging = root["logging"];
    read_value(logging, "level", cfg.logging.level);
    read_path(logging, "log_file", cfg.logging.log_file);
    read_value(logging, "max_log_size_mb", cfg.logging.max_log_size_mb);
    read_value(logging, "backup_count", cfg.logging.backup_count);
    read_value(logging, "pattern", cfg.logging.pattern);

    const auto progress = root["progress"];
    read_value(progress, "save_interval", cfg.progress.save_interval);
    read_path(progress, "progress_file", cfg.progress.progress_file);
    read_value(progress, "show_progress_bar", cfg.progress.show_progress_bar);

    for (const auto& dir : root["directories_to_download"]) {
        cfg.directories_to_download.push_back(dir.as<std::string>());
    }

    return cfg;
}

auto to_yaml(const Config& cfg) -> std::string {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "remote" << YAML::Value << YAML::BeginMap
        << YAML::Key << "host" << YAML::Value << cfg.remote.host
        << YAML::Key << "port" << YAML::Value << cfg.remote.port
        << YAML::Key << "base_path" << YAML::Value << cfg.remote.base_path
        << YAML::Key << "username" << YAML::Value << cfg.remote.username
        << YAML::Key << "password" << YAML::Value << cfg.remote.password
        << YAML::Key << "timeout" << YAML::Value << cfg.remote.timeout_seconds
        << YAML::Key << "retries" << YAML::Value << cfg.remote.retries
        << YAML::EndMap;

    out << YAML::Key << "download" << YAML::Value << YAML::BeginMap
        << YAML::Key << "local_data_dir" << YAML::Value << cfg.download.local_data_dir.string()
        << YAML::Key << "temp_dir" << YAML::Value << cfg.download.temp_dir.string()
        << YAML::Key << "max_concurrent_downloads" << YAML::Value << cfg.download.max_concurrent_downloads
        << YAML::Key << "rate_limit_delay" << YAML::Value << cfg.download.rate_limit_delay
        << YAML::Key << "chunk_size" << YAML::Value << cfg.download.chunk_size
        << YAML::Key << "resume_downloads" << YAML::Value << cfg.download.resume_downloads
        << YAML::Key << "recursive" << YAML::Value << cfg.download.recursive
        << YAML::Key << "backoff_base_seconds" << YAML::Value << cfg.download.backoff_base_seconds
        << YAML::Key << "exclude" << YAML::Value << YAML::Flow << cfg.download.exclude_patterns
        << YAML::Key << "include" << YAML::Value << YAML::Flow << cfg.download.include_patterns
        << YAML::EndMap;

    out << YAML::Key << "rate_limit" << YAML::Value << YAML::BeginMap
        << YAML::Key << "min_delay" << YAML::Value << cfg.rate_limit.min_delay
        << YAML::Key << "max_delay" << YAML::Value << cfg.rate_limit.max_delay
        << YAML::Key << "backoff_factor" << YAML::Value << cfg.rate_limit.backoff_factor
        << YAML::Key << "max_requests_per_minute" << YAML::Value;
    if (cfg.rate_limit.max_requests_per_minute) {
        out << *cfg.rate_limit.max_requests_per_minute;
    } else {
        out << YAML::Null;
    }
    out << YAML::EndMap;

    out << YAML::Key << "storage" << YAML::Value << YAML::BeginMap
        << YAML::Key << "min_free_space_gb" << YAML::Value << cfg.storage.min_free_space_gb
        << YAML::Key << "cleanup_temp_files" << YAML::Value << cfg.storage.cleanup_temp_files
        << YAML::EndMap;

    out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap
        << YAML::Key << "level" << YAML::Value << cfg.logging.level
        << YAML::Key << "log_file" << YAML::Value << cfg.logging.log_file.string()
        << YAML::Key << "max_log_size_mb" << YAML::Value << cfg.logging.max_log_size_mb
        << YAML::Key << "backup_count" << YAML::Value << cfg.logging.backup_count
        << YAML::Key << "pattern" << YAML::Value << cfg.logging.pattern
        << YAML::EndMap;

    out << YAML::Key << "progress" << YAML::Value << YAML::BeginMap
        << YAML::Key << "save_interval" << YAML::Value << cfg.progress.save_interval
        << YAML::Key << "progress_file" << YAML::Value << cfg.progress.progress_file.string()
        << YAML::Key << "show_progress_bar" << YAML::Value << cfg.progress.show_progress_bar
        << YAML::EndMap;

    out << YAML::Key << "directories_to_download" << YAML::Value << cfg.directories_to_download;

    out << YAML::EndMap;
    return out.c_str();
}

} // namespace

auto Config::validate() const -> VoidResult {
    const VoidResult checks[] = {
        check_range<std::uint32_t>("remote.timeout", remote.timeout_seconds, 1, 300),
        check_range<std::uint32_t>("remote.retries", remote.retries, 1, 10),
        check_range<double>("download.rate_limit_delay", download.rate_limit_delay, 0.1, 60.0),
        check_range<std::uint32_t>("download.max_concurrent_downloads", download.max_concurrent_downloads, 1, 20),
        check_range<double>("storage.min_free_space_gb", storage.min_free_space_gb, 1.0, 10000.0),
        check_range<std::uint32_t>("progress.save_interval", progress.save_interval, 1, 1000),
    };
    for (const auto& check : checks) {
        if (!check) return check;
    }

    if (remote.host.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig, "remote.host must not be empty"));
    }
    if (download.chunk_size == 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig, "download.chunk_size must be positive"));
    }
    if (rate_limit.min_delay < 0.0 || rate_limit.min_delay > rate_limit.max_delay) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            fmt::format("rate_limit.min_delay ({}) must be within [0, max_delay ({})]",
                        rate_limit.min_delay, rate_limit.max_delay)));
    }
    if (rate_limit.backoff_factor < 1.0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig, "rate_limit.backoff_factor must be >= 1.0"));
    }
    if (download.backoff_base_seconds < 0.0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig, "download.backoff_base_seconds must be >= 0"));
    }
    if (rate_limit.max_requests_per_minute && *rate_limit.max_requests_per_minute == 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig, "rate_limit.max_requests_per_minute must be positive"));
    }
    return {};
}

auto parse_config(const std::string& yaml_text) -> Result<Config> {
    try {
        auto cfg = from_yaml(YAML::Load(yaml_text));
        if (!cfg) return cfg;
        if (auto res = cfg->validate(); !res) {
            return std::unexpected(std::move(res.error()));
        }
        return cfg;
    } catch (const YAML::Exception& e) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            fmt::format("Failed to parse configuration: {}", e.what())));
    }
}

auto load_config(const std::optional<std::filesystem::path>& path) -> Result<Config> {
    std::optional<std::filesystem::path> found;
    if (path) {
        if (std::filesystem::exists(*path)) found = *path;
    } else {
        for (const auto& candidate : get_config_paths()) {
            if (std::filesystem::exists(candidate)) {
                found = candidate;
                break;
            }
        }
    }

    if (!found) {
        return std::unexpected(make_error(ErrorCode::FileNotFound,
            fmt::format("Configuration file not found: {}",
                        path ? path->string() : std::string(".rmirror.yaml"))));
    }

    std::ifstream in(*found);
    if (!in) {
        return std::unexpected(make_error(ErrorCode::PermissionDenied,
            fmt::format("Cannot read configuration file: {}", found->string())));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto cfg = parse_config(buffer.str());
    if (!cfg) {
        cfg.error().message = fmt::format("{} ({})", cfg.error().message, found->string());
        return cfg;
    }

    if (auto res = apply_env_overrides(*cfg); !res) {
        return std::unexpected(std::move(res.error()));
    }

    spdlog::debug("Loaded config from {}", found->string());
    return cfg;
}

auto apply_env_overrides(Config& config) -> VoidResult {
    auto env = [](const char* name) -> std::optional<std::string> {
        if (const char* value = std::getenv(name)) return std::string(value);
        return std::nullopt;
    };

    try {
        if (auto v = env("RMIRROR_HOST")) config.remote.host = *v;
        if (auto v = env("RMIRROR_DATA_DIR")) config.download.local_data_dir = *v;
        if (auto v = env("RMIRROR_TEMP_DIR")) config.download.temp_dir = *v;
        if (auto v = env("RMIRROR_RATE_LIMIT")) config.download.rate_limit_delay = std::stod(*v);
        if (auto v = env("RMIRROR_MIN_SPACE")) config.storage.min_free_space_gb = std::stod(*v);
        if (auto v = env("RMIRROR_LOG_LEVEL")) config.logging.level = *v;
        if (auto v = env("RMIRROR_MAX_CONCURRENT")) {
            config.download.max_concurrent_downloads = static_cast<std::uint32_t>(std::stoul(*v));
        }
    } catch (const std::exception& e) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            fmt::format("Invalid environment override: {}", e.what())));
    }

    return config.validate();
}

auto write_default_config(const std::filesystem::path& path) -> VoidResult {
    Config defaults{};
    defaults.directories_to_download = {
        "compound", "substance", "bioassay", "protein", "gene", "taxonomy", "pathway"
    };

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(from_error_code(ec, "Cannot create configuration directory"));
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return std::unexpected(make_error(ErrorCode::PermissionDenied,
            fmt::format("Cannot write configuration file: {}", path.string())));
    }
    out << to_yaml(defaults) << '\n';
    if (!out) {
        return std::unexpected(make_error(ErrorCode::IoError,
            fmt::format("Failed to write configuration file: {}", path.string())));
    }

    spdlog::info("Default configuration created at {}", path.string());
    return {};
}

} // namespace rmirror::infra
