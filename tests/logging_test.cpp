#include <gtest/gtest.h>

#include <chrono>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "fakes/test_support.hpp"
#include "infra/logging/logging.hpp"

using namespace rmirror::infra;
using namespace rmirror::testing;

TEST(LoggingTest, ParsesLevelNames)
{
    EXPECT_EQ(parse_level("debug").value(), spdlog::level::debug);
    EXPECT_EQ(parse_level("INFO").value(), spdlog::level::info);
    EXPECT_EQ(parse_level("warning").value(), spdlog::level::warn);
    EXPECT_EQ(parse_level("error").value(), spdlog::level::err);

    auto bad = parse_level("loud");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidConfig);
}

TEST(LoggingTest, WritesToRotatingFile)
{
    TempDir dir;
    LoggingSettings settings;
    settings.level = "info";
    settings.log_file = dir / "logs" / "rmirror.log";

    ASSERT_TRUE(setup_logging(settings, true).has_value());
    spdlog::warn("disk nearly full");
    spdlog::default_logger()->flush();

    EXPECT_NE(read_file(settings.log_file).find("disk nearly full"), std::string::npos);
    spdlog::drop_all();
    spdlog::set_default_logger(spdlog::stdout_color_mt("test"));
}

TEST(LoggingTest, RejectsUnknownLevel)
{
    LoggingSettings settings;
    settings.level = "verbose";
    settings.log_file.clear();
    auto res = setup_logging(settings);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::InvalidConfig);
}

TEST(LoggingTest, CleanupRemovesOnlyOldLogFiles)
{
    TempDir dir;
    write_file(dir / "old.log", "old");
    write_file(dir / "old.log.1", "older");
    write_file(dir / "fresh.log", "fresh");
    write_file(dir / "notes.txt", "keep");

    const auto past = std::filesystem::file_time_type::clock::now() - std::chrono::hours(24 * 60);
    std::filesystem::last_write_time(dir / "old.log", past);
    std::filesystem::last_write_time(dir / "old.log.1", past);
    std::filesystem::last_write_time(dir / "notes.txt", past);

    EXPECT_EQ(cleanup_old_logs(dir.path()), 2u);
    EXPECT_TRUE(std::filesystem::exists(dir / "fresh.log"));
    EXPECT_TRUE(std::filesystem::exists(dir / "notes.txt"));
    EXPECT_FALSE(std::filesystem::exists(dir / "old.log"));
}
