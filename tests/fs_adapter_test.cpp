#include <gtest/gtest.h>

#include <thread>
#include <vector>
#include "adapters/fs.hpp"
#include "extensions/metadata.hpp"
#include "test_utils.hpp"

namespace fs = fdup::adapters::fs;
using fdup::infra::ErrorCode;

TEST(FsAdapterTest, StrategyBySize)
{
    EXPECT_EQ(fs::select_strategy(0), fs::CopyStrategy::Buffered);
    EXPECT_EQ(fs::select_strategy(999'999), fs::CopyStrategy::Buffered);
    EXPECT_EQ(fs::select_strategy(1'000'000), fs::CopyStrategy::MMap);
    EXPECT_EQ(fs::select_strategy(99'999'999), fs::CopyStrategy::MMap);
    EXPECT_EQ(fs::select_strategy(100'000'000), fs::CopyStrategy::Uring);
}

class FsCopyTest : public ::testing::TestWithParam<fs::CopyStrategy> {
protected:
    fdup::testing::TempDir tmp_;
};

TEST_P(FsCopyTest, CopiesBytesExactly)
{
    const auto content = fdup::testing::pattern(3 * 1024 * 1024 + 17);
    const auto src = tmp_ / "src.bin";
    const auto dst = tmp_ / "dst.bin";
    fdup::testing::write_file(src, content);

    ASSERT_TRUE(fs::copy_file(src, dst, GetParam()));
    EXPECT_EQ(fdup::testing::read_file(dst), content);
}

TEST_P(FsCopyTest, CopiesEmptyFile)
{
    const auto src = tmp_ / "empty.txt";
    const auto dst = tmp_ / "empty_copy.txt";
    fdup::testing::write_file(src, "");

    ASSERT_TRUE(fs::copy_file(src, dst, GetParam()));
    EXPECT_TRUE(std::filesystem::exists(dst));
    EXPECT_EQ(std::filesystem::file_size(dst), 0u);
}

TEST_P(FsCopyTest, TruncatesExistingDestination)
{
    const auto src = tmp_ / "short.txt";
    const auto dst = tmp_ / "long.txt";
    fdup::testing::write_file(src, "abc");
    fdup::testing::write_file(dst, std::string(10'000, 'x'));

    ASSERT_TRUE(fs::copy_file(src, dst, GetParam()));
    EXPECT_EQ(fdup::testing::read_file(dst), "abc");
}

TEST_P(FsCopyTest, MissingSourceFails)
{
    auto res = fs::copy_file(tmp_ / "nope", tmp_ / "dst", GetParam());
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::FileNotFound);
}

INSTANTIATE_TEST_SUITE_P(AllStrategies, FsCopyTest,
    ::testing::Values(fs::CopyStrategy::Buffered, fs::CopyStrategy::MMap, fs::CopyStrategy::Uring));

TEST(FsAdapterTest, EnsureDirectoryIsIdempotent)
{
    fdup::testing::TempDir tmp;
    const auto dir = tmp / "a" / "b" / "c";
    ASSERT_TRUE(fs::ensure_directory(dir));
    ASSERT_TRUE(fs::ensure_directory(dir));
    EXPECT_TRUE(std::filesystem::is_directory(dir));
}

TEST(FsAdapterTest, EnsureDirectoryConcurrentCallersAllSucceed)
{
    fdup::testing::TempDir tmp;
    const auto dir = tmp / "shared" / "part_1";
    std::atomic<int> failures{0};
    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < 16; ++i) {
            threads.emplace_back([&] {
                if (!fs::ensure_directory(dir)) failures.fetch_add(1);
            });
        }
    }
    EXPECT_EQ(failures.load(), 0);
    EXPECT_TRUE(std::filesystem::is_directory(dir));
}

TEST(FsAdapterTest, EnsureDirectoryOverRegularFileFails)
{
    fdup::testing::TempDir tmp;
    const auto blocker = tmp / "part_2";
    fdup::testing::write_file(blocker, "not a directory");

    auto res = fs::ensure_directory(blocker);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InvalidPath);
    EXPECT_FALSE(res.error().is_transient());
}

TEST(MetadataTest, CopiesModificationTimeAndPermissions)
{
    fdup::testing::TempDir tmp;
    const auto src = tmp / "src.txt";
    const auto dst = tmp / "dst.txt";
    fdup::testing::write_file(src, "data");
    fdup::testing::write_file(dst, "data");

    const auto stamp = std::filesystem::file_time_type::clock::now() - std::chrono::hours(48);
    std::filesystem::last_write_time(src, stamp);
    std::filesystem::permissions(src, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
                                      std::filesystem::perms::group_read);

    ASSERT_TRUE(fdup::extensions::copy_metadata(src, dst));
    EXPECT_EQ(std::filesystem::last_write_time(dst), std::filesystem::last_write_time(src));
    EXPECT_EQ(std::filesystem::status(dst).permissions(), std::filesystem::status(src).permissions());
}
