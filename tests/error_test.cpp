#include <gtest/gtest.h>

#include "infra/error_handler/error.hpp"

using namespace rmirror::infra;

TEST(ErrorTest, ClassifiesFatalAndTransientCodes)
{
    EXPECT_TRUE(make_error(ErrorCode::InvalidConfig, "bad").is_fatal());
    EXPECT_TRUE(make_error(ErrorCode::PermissionDenied, "denied").is_fatal());
    EXPECT_FALSE(make_error(ErrorCode::InvalidConfig, "bad").is_transient());

    for (auto code : {ErrorCode::ConnectionFailed, ErrorCode::NetworkTimeout, ErrorCode::ProtocolError,
                      ErrorCode::RemoteRejected, ErrorCode::SizeMismatch, ErrorCode::IoError}) {
        const auto err = make_error(code, "transient");
        EXPECT_TRUE(err.is_transient()) << to_string(code);
        EXPECT_FALSE(err.is_fatal()) << to_string(code);
    }

    // Ресурсы и отмена не повторяются
    EXPECT_FALSE(make_error(ErrorCode::DiskFull, "full").is_transient());
    EXPECT_FALSE(make_error(ErrorCode::Interrupted, "stop").is_transient());
}

TEST(ErrorTest, ExitCodes)
{
    EXPECT_EQ(make_error(ErrorCode::InvalidConfig, "x").to_exit_code(), 1);
    EXPECT_EQ(make_error(ErrorCode::DiskFull, "x").to_exit_code(), 20);
    EXPECT_EQ(make_error(ErrorCode::ListingFailed, "x").to_exit_code(), 21);
    EXPECT_EQ(make_error(ErrorCode::Interrupted, "x").to_exit_code(), 130);
}

TEST(ErrorTest, CapturesSourceLocation)
{
    const auto err = make_error(ErrorCode::IoError, "write failed");
    EXPECT_NE(err.file.find("error_test.cpp"), std::string::npos);
    EXPECT_GT(err.line, 0);
    EXPECT_STREQ(err.what(), "write failed");
}

TEST(ErrorTest, MapsFilesystemErrorCodes)
{
    EXPECT_EQ(from_error_code(std::make_error_code(std::errc::no_space_on_device), "w").code, ErrorCode::DiskFull);
    EXPECT_EQ(from_error_code(std::make_error_code(std::errc::permission_denied), "w").code, ErrorCode::PermissionDenied);
    EXPECT_EQ(from_error_code(std::make_error_code(std::errc::no_such_file_or_directory), "w").code, ErrorCode::FileNotFound);
    EXPECT_EQ(from_error_code(std::make_error_code(std::errc::io_error), "w").code, ErrorCode::IoError);

    const auto err = from_error_code(std::make_error_code(std::errc::io_error), "Cannot write x");
    EXPECT_EQ(err.message.rfind("Cannot write x: ", 0), 0u);
}

TEST(ErrorTest, LogAndReturnPassesErrorThrough)
{
    auto err = log_and_return(make_error(ErrorCode::SizeMismatch, "expected 5, got 3"));
    EXPECT_EQ(err.code, ErrorCode::SizeMismatch);
    EXPECT_EQ(err.message, "expected 5, got 3");
}
