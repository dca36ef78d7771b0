#include <gtest/gtest.h>

#include <memory>
#include "core/session/session_controller.hpp"
#include "fakes/fake_remote.hpp"
#include "fakes/test_support.hpp"

using namespace rmirror::core;
using rmirror::infra::ErrorCode;
using rmirror::testing::FakeServer;
using rmirror::testing::TempDir;
using rmirror::testing::make_test_config;
using rmirror::testing::read_file;

class SessionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = make_test_config(tmp.path());
        config.directories_to_download = {"compound"};
    }

    auto make_session() -> std::unique_ptr<SessionController> {
        return std::make_unique<SessionController>(config, server->factory());
    }

    TempDir tmp;
    rmirror::infra::Config config;
    std::shared_ptr<FakeServer> server = std::make_shared<FakeServer>();
};

TEST_F(SessionControllerTest, SecondRunSkipsCompletedFile)
{
    server->add_file("/pub/compound", "a.ttl", std::string(1000, 'r'));

    {
        auto session = make_session();
        ASSERT_TRUE(session->download_all());
        const auto stats = session->session_stats();
        EXPECT_EQ(stats.files_transferred, 1u);
        EXPECT_EQ(stats.bytes_transferred, 1000u);
        EXPECT_TRUE(session->ledger()->is_completed("/pub/compound/a.ttl"));
        EXPECT_FALSE(session->last_error().has_value());
    }
    EXPECT_EQ(read_file(config.download.local_data_dir / "compound" / "a.ttl").size(), 1000u);
    const auto retrieves = server->retrieve_count();

    auto second = make_session();
    ASSERT_TRUE(second->download_all());
    const auto stats = second->session_stats();
    EXPECT_EQ(stats.files_transferred, 0u);
    EXPECT_EQ(stats.files_skipped, 1u);
    EXPECT_EQ(stats.bytes_transferred, 0u);
    EXPECT_EQ(server->retrieve_count(), retrieves);
}

TEST_F(SessionControllerTest, InsufficientSpaceStopsBeforeAnyTransfer)
{
    config.storage.min_free_space_gb = 1e6;
    server->add_file("/pub/compound", "a.ttl", "data");

    auto session = make_session();
    EXPECT_FALSE(session->download_all());
    ASSERT_TRUE(session->last_error().has_value());
    EXPECT_EQ(session->last_error()->code, ErrorCode::DiskFull);
    EXPECT_EQ(session->last_error()->to_exit_code(), 20);
    EXPECT_EQ(server->connections(), 0);
}

TEST_F(SessionControllerTest, ListingFailureMovesOnToNextDirectory)
{
    config.directories_to_download = {"missing", "compound"};
    server->add_file("/pub/compound", "a.ttl", "data");

    auto session = make_session();
    EXPECT_FALSE(session->download_all());
    ASSERT_TRUE(session->last_error().has_value());
    EXPECT_EQ(session->last_error()->code, ErrorCode::ListingFailed);
    EXPECT_TRUE(session->ledger()->is_completed("/pub/compound/a.ttl"));
}

TEST_F(SessionControllerTest, StopBeforeStartFlushesLedger)
{
    server->add_file("/pub/compound", "a.ttl", "data");

    auto session = make_session();
    session->request_stop();
    EXPECT_TRUE(session->stop_requested());
    EXPECT_FALSE(session->download_all());
    ASSERT_TRUE(session->last_error().has_value());
    EXPECT_EQ(session->last_error()->code, ErrorCode::Interrupted);
    EXPECT_EQ(server->retrieve_count(), 0u);
    EXPECT_TRUE(std::filesystem::exists(config.progress.progress_file));
}

TEST_F(SessionControllerTest, CompletedSessionCleansTemp)
{
    server->add_file("/pub/compound", "a.ttl", "data");
    rmirror::testing::write_file(config.download.temp_dir / "stale" / "old.tmp", "leftover");

    auto session = make_session();
    ASSERT_TRUE(session->download_all());
    EXPECT_TRUE(std::filesystem::is_directory(config.download.temp_dir));
    EXPECT_TRUE(std::filesystem::is_empty(config.download.temp_dir));
}

TEST_F(SessionControllerTest, RetryFailedRecoversRepairedFiles)
{
    server->add_file("/pub/compound", "a.ttl", "alpha");
    server->add_file("/pub/compound", "b.ttl", "beta");
    server->break_file("/pub/compound/b.ttl");

    {
        auto session = make_session();
        EXPECT_TRUE(session->download_all());
        EXPECT_EQ(session->session_stats().files_failed, 1u);
        EXPECT_EQ(session->ledger()->failed_files(3), (std::vector<std::string>{"/pub/compound/b.ttl"}));
    }

    server->repair_file("/pub/compound/b.ttl");
    auto session = make_session();
    ASSERT_TRUE(session->retry_failed(3));
    EXPECT_TRUE(session->ledger()->is_completed("/pub/compound/b.ttl"));
    EXPECT_EQ(read_file(config.download.local_data_dir / "compound" / "b.ttl"), "beta");
    EXPECT_TRUE(session->ledger()->failed_files(3).empty());

    // Нечего повторять
    EXPECT_TRUE(session->retry_failed(3));
}

TEST_F(SessionControllerTest, StatusCombinesAllSnapshots)
{
    server->add_file("/pub/compound", "a.ttl", "data");
    auto session = make_session();
    ASSERT_TRUE(session->download_all());

    const auto status = session->status();
    EXPECT_EQ(status.ledger.total_files, 1u);
    EXPECT_EQ(status.ledger.completed_files, 1u);
    EXPECT_EQ(status.ledger.total_directories, 1u);
    ASSERT_TRUE(status.disk.has_value());
    EXPECT_TRUE(status.disk->sufficient);
    EXPECT_GE(status.rate.total_requests, 2u);
    EXPECT_EQ(status.session.files_transferred, 1u);
}
