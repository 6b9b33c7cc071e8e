#include <gtest/gtest.h>

#include <cerrno>
#include "infra/error_handler/error.hpp"
#include "infra/retry.hpp"

using fdup::infra::ErrorCode;

TEST(ErrorTest, ExitCodesFollowErrorKind)
{
    EXPECT_EQ(fdup::infra::make_error(ErrorCode::InvalidInput, "x").to_exit_code(), 2);
    EXPECT_EQ(fdup::infra::make_error(ErrorCode::SourceNotFound, "x").to_exit_code(), 2);
    EXPECT_EQ(fdup::infra::make_error(ErrorCode::LimitExceeded, "x").to_exit_code(), 3);
    EXPECT_EQ(fdup::infra::make_error(ErrorCode::CorruptResumeState, "x").to_exit_code(), 4);
    EXPECT_EQ(fdup::infra::make_error(ErrorCode::CopyFailure, "x").to_exit_code(), 5);
    EXPECT_EQ(fdup::infra::make_error(ErrorCode::ArchiveWriteFailure, "x").to_exit_code(), 6);
    EXPECT_EQ(fdup::infra::make_error(ErrorCode::DiskFull, "x").to_exit_code(), 20);
    EXPECT_EQ(fdup::infra::make_error(ErrorCode::Interrupted, "x").to_exit_code(), 130);
    EXPECT_EQ(fdup::infra::make_error(ErrorCode::Unknown, "x").to_exit_code(), 1);
}

TEST(ErrorTest, CapturesSourceLocation)
{
    const auto err = fdup::infra::make_error(ErrorCode::InvalidInput, "bad");
    EXPECT_EQ(err.message, "bad");
    EXPECT_STREQ(err.what(), "bad");
    EXPECT_NE(err.file.find("error_test.cpp"), std::string::npos);
    EXPECT_GT(err.line, 0);
}

TEST(ErrorTest, MapsErrnoToErrorCode)
{
    auto from = [](int e) {
        return fdup::infra::make_error_from(std::error_code(e, std::generic_category()), "ctx").code;
    };
    EXPECT_EQ(from(ENOENT), ErrorCode::FileNotFound);
    EXPECT_EQ(from(EACCES), ErrorCode::PermissionDenied);
    EXPECT_EQ(from(ENOSPC), ErrorCode::DiskFull);
    EXPECT_EQ(from(ENOTDIR), ErrorCode::InvalidPath);
    EXPECT_EQ(from(EIO), ErrorCode::Unknown);
}

TEST(ErrorTest, OnlyDirectoryRaceIsTransient)
{
    EXPECT_TRUE(fdup::infra::make_error(ErrorCode::DirectoryRace, "x").is_transient());
    EXPECT_FALSE(fdup::infra::make_error(ErrorCode::InvalidPath, "x").is_transient());
    EXPECT_FALSE(fdup::infra::make_error(ErrorCode::CopyFailure, "x").is_transient());
}

TEST(RetryTest, RetriesTransientErrorsUntilSuccess)
{
    int calls = 0;
    auto res = fdup::infra::with_retry([&calls]() -> fdup::infra::Result<int> {
        if (++calls < 3) {
            return std::unexpected(fdup::infra::make_error(ErrorCode::DirectoryRace, "race"));
        }
        return 42;
    }, fdup::infra::RetryPolicy{.max_attempts = 5, .initial_delay = std::chrono::milliseconds(0)});

    ASSERT_TRUE(res);
    EXPECT_EQ(*res, 42);
    EXPECT_EQ(calls, 3);
}

TEST(RetryTest, DoesNotRetryPermanentErrors)
{
    int calls = 0;
    auto res = fdup::infra::with_retry([&calls]() -> fdup::infra::VoidResult {
        ++calls;
        return std::unexpected(fdup::infra::make_error(ErrorCode::InvalidPath, "not a dir"));
    });

    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InvalidPath);
    EXPECT_EQ(calls, 1);
}

TEST(RetryTest, GivesUpAfterMaxAttempts)
{
    int calls = 0;
    auto res = fdup::infra::with_retry([&calls]() -> fdup::infra::VoidResult {
        ++calls;
        return std::unexpected(fdup::infra::make_error(ErrorCode::DirectoryRace, "race"));
    }, fdup::infra::RetryPolicy{.max_attempts = 4, .initial_delay = std::chrono::milliseconds(0)});

    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::DirectoryRace);
    EXPECT_EQ(calls, 4);
}
