#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>
#include "adapters/ftp/ftp_client.hpp"
#include "fakes/loopback_ftp_server.hpp"

using namespace rmirror::adapters;
using rmirror::infra::ErrorCode;
using rmirror::infra::VoidResult;
using rmirror::testing::LoopbackFtpServer;

namespace {

const std::string kDir = "/pub/compound";
const std::string kFile = "/pub/compound/a.ttl";
const std::string kContent = "0123456789abcdef";

auto options_for(const LoopbackFtpServer& server) -> ftp::FtpOptions {
    ftp::FtpOptions options;
    options.host = "127.0.0.1";
    options.port = server.port();
    options.timeout = std::chrono::seconds(5);
    options.buffer_size = 4;
    options.connect_attempts = 1;
    return options;
}

auto collect_into(std::string& out) -> remote::ChunkSink {
    return [&out](std::string_view chunk) -> VoidResult {
        out.append(chunk);
        return {};
    };
}

// Индекс команды в журнале сервера, -1 если её не было
auto position_of(const std::vector<std::string>& commands, const std::string& command) -> std::ptrdiff_t {
    const auto it = std::ranges::find(commands, command);
    return it == commands.end() ? -1 : std::distance(commands.begin(), it);
}

} // namespace

class FtpClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        server.add_directory(kDir,
            "drwxr-xr-x 2 ftp ftp 4096 Jan 01 2024 .\r\n"
            "-rw-r--r-- 1 ftp ftp 16 Jan 01 2024 a.ttl\r\n"
            "drwxr-xr-x 2 ftp ftp 4096 Jan 01 2024 nested\r\n");
        server.add_file(kFile, kContent);
    }

    LoopbackFtpServer server;
};

TEST_F(FtpClientTest, LogsInAndListsDirectory)
{
    ftp::FtpClient client(options_for(server));
    ASSERT_TRUE(client.connect().has_value());

    auto entries = client.list_directory(kDir);
    ASSERT_TRUE(entries.has_value()) << entries.error().message;
    ASSERT_EQ(entries->size(), 2u);
    EXPECT_EQ((*entries)[0].name, "a.ttl");
    EXPECT_EQ((*entries)[0].kind, remote::EntryKind::File);
    EXPECT_EQ((*entries)[0].size_bytes, 16u);
    EXPECT_EQ((*entries)[1].name, "nested");
    EXPECT_EQ((*entries)[1].kind, remote::EntryKind::Directory);

    client.close();
    const std::vector<std::string> expected{
        "USER anonymous", "PASS anonymous@", "TYPE I", "CWD /pub/compound", "EPSV", "LIST", "QUIT",
    };
    EXPECT_EQ(server.commands(), expected);
}

TEST_F(FtpClientTest, FallsBackToPasvWhenEpsvIsRejected)
{
    server.disable_epsv();
    ftp::FtpClient client(options_for(server));
    ASSERT_TRUE(client.connect().has_value());

    auto entries = client.list_directory(kDir);
    ASSERT_TRUE(entries.has_value()) << entries.error().message;
    EXPECT_EQ(entries->size(), 2u);

    const auto commands = server.commands();
    const auto epsv = position_of(commands, "EPSV");
    const auto pasv = position_of(commands, "PASV");
    ASSERT_GE(epsv, 0);
    EXPECT_EQ(pasv, epsv + 1);
    EXPECT_LT(pasv, position_of(commands, "LIST"));
}

TEST_F(FtpClientTest, FreshRetrieveSendsNoRest)
{
    ftp::FtpClient client(options_for(server));
    ASSERT_TRUE(client.connect().has_value());

    std::string received;
    ASSERT_TRUE(client.retrieve(kFile, 0, collect_into(received)).has_value());
    EXPECT_EQ(received, kContent);

    const auto commands = server.commands();
    EXPECT_TRUE(std::ranges::none_of(commands, [](const std::string& c) { return c.starts_with("REST"); }));
    EXPECT_GE(position_of(commands, "RETR " + kFile), 0);
}

TEST_F(FtpClientTest, ResumeSendsRestOffsetBeforeRetr)
{
    ftp::FtpClient client(options_for(server));
    ASSERT_TRUE(client.connect().has_value());

    std::string received;
    auto res = client.retrieve(kFile, 4, collect_into(received));
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(received, kContent.substr(4));

    const auto commands = server.commands();
    const auto rest = position_of(commands, "REST 4");
    ASSERT_GE(rest, 0);
    EXPECT_LT(position_of(commands, "EPSV"), rest);
    EXPECT_EQ(position_of(commands, "RETR " + kFile), rest + 1);
}

TEST_F(FtpClientTest, RejectedRestFailsWithoutRetr)
{
    server.disable_rest();
    ftp::FtpClient client(options_for(server));
    ASSERT_TRUE(client.connect().has_value());

    std::string received;
    auto res = client.retrieve(kFile, 4, collect_into(received));
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::RemoteRejected);
    EXPECT_TRUE(received.empty());
    EXPECT_EQ(position_of(server.commands(), "RETR " + kFile), -1);

    // Управляющее соединение остаётся рабочим
    ASSERT_TRUE(client.retrieve(kFile, 0, collect_into(received)).has_value());
    EXPECT_EQ(received, kContent);
}

TEST_F(FtpClientTest, MissingPathsAreRejected)
{
    ftp::FtpClient client(options_for(server));
    ASSERT_TRUE(client.connect().has_value());

    std::string received;
    auto missing_file = client.retrieve("/pub/compound/missing.ttl", 0, collect_into(received));
    ASSERT_FALSE(missing_file.has_value());
    EXPECT_EQ(missing_file.error().code, ErrorCode::RemoteRejected);

    auto missing_dir = client.list_directory("/pub/missing");
    ASSERT_FALSE(missing_dir.has_value());
    EXPECT_EQ(missing_dir.error().code, ErrorCode::RemoteRejected);
}

TEST_F(FtpClientTest, AbortingSinkDropsControlConnection)
{
    const std::string big_file = "/pub/compound/big.ttl";
    server.add_file(big_file, std::string(256, 'x'));

    ftp::FtpClient client(options_for(server));
    ASSERT_TRUE(client.connect().has_value());

    std::size_t chunks = 0;
    auto res = client.retrieve(big_file, 0, [&chunks](std::string_view) -> VoidResult {
        if (++chunks == 2) {
            return std::unexpected(rmirror::infra::make_error(ErrorCode::Interrupted, "Transfer stopped"));
        }
        return {};
    });
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::Interrupted);
    EXPECT_EQ(chunks, 2u);

    std::string received;
    EXPECT_FALSE(client.retrieve(kFile, 0, collect_into(received)).has_value());

    // Сервер закрыл брошенную сессию и принимает новую
    ftp::FtpClient second(options_for(server));
    ASSERT_TRUE(second.connect().has_value());
    ASSERT_TRUE(second.retrieve(kFile, 0, collect_into(received)).has_value());
    EXPECT_EQ(received, kContent);
    EXPECT_EQ(server.sessions(), 2);
}
