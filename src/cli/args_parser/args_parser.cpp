#include "args_parser.hpp"
#include <CLI/CLI.hpp>
#include <fmt/core.h>

namespace rmirror::cli {

std::optional<CLIArgs> parse_args(int argc, char const* const* argv)
{
    CLI::App app{"rmirror: resumable bulk mirror of a remote FTP tree"};
    app.set_version_flag("--version", std::string(kVersion));

    CLIArgs args;
    std::uint32_t max_concurrent = 0;
    double rate_limit = 0.0;
    double min_space = 0.0;
    std::string log_level;
    std::string data_dir;

    app.add_option("-c,--config", args.config_path, "Configuration file path")
        ->capture_default_str();
    app.add_flag("--status", args.status, "Show download status and exit");
    app.add_flag("--retry-failed", args.retry_failed, "Retry previously failed downloads");
    app.add_option("--max-retries", args.max_retries, "Retry limit for --retry-failed")
        ->check(CLI::Range(1u, 100u))
        ->capture_default_str();
    app.add_flag("--create-config", args.create_config, "Write a default configuration file");
    app.add_flag("--cleanup-logs", args.cleanup_logs, "Remove log files older than 30 days");
    app.add_flag("-q,--quiet", args.quiet, "Warnings and errors only");
    app.add_option("--directories", args.directories, "Directories to download (overrides config)");

    auto* concurrent_opt = app.add_option("--max-concurrent", max_concurrent, "Maximum concurrent downloads")
        ->check(CLI::Range(1u, 20u));
    auto* rate_opt = app.add_option("--rate-limit", rate_limit, "Delay between requests in seconds")
        ->check(CLI::Range(0.1, 60.0));
    auto* space_opt = app.add_option("--min-space", min_space, "Minimum free space in GB");
    auto* level_opt = app.add_option("--log-level", log_level, "Logging level")
        ->check(CLI::IsMember({"debug", "info", "warning", "error"}));
    auto* data_opt = app.add_option("--data-dir", data_dir, "Local data directory");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e);
        return std::nullopt;
    }

    if (concurrent_opt->count() > 0) args.max_concurrent = max_concurrent;
    if (rate_opt->count() > 0) args.rate_limit = rate_limit;
    if (space_opt->count() > 0) args.min_space = min_space;
    if (level_opt->count() > 0) args.log_level = log_level;
    if (data_opt->count() > 0) args.data_dir = data_dir;

    return args;
}

auto to_overrides(const CLIArgs& args) -> infra::ConfigOverrides {
    infra::ConfigOverrides overrides;
    if (!args.directories.empty()) overrides.directories = args.directories;
    overrides.max_concurrent = args.max_concurrent;
    overrides.rate_limit_delay = args.rate_limit;
    overrides.min_free_space_gb = args.min_space;
    overrides.log_level = args.log_level;
    if (args.data_dir) overrides.local_data_dir = std::filesystem::path(*args.data_dir);
    overrides.quiet = args.quiet;
    return overrides;
}

} // namespace rmirror::cli
