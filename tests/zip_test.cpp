#include <gtest/gtest.h>

#include "infra/interrupt.hpp"
#include "infra/zip/zip_writer.hpp"
#include "test_utils.hpp"
#include "zip_inspect.hpp"

using fdup::infra::zip::ZipWriter;
using fdup::testing::ZipInspector;

class ZipWriterTest : public ::testing::Test {
protected:
    void SetUp() override { fdup::infra::clear_interrupt(); }
    void TearDown() override { fdup::infra::clear_interrupt(); }

    fdup::testing::TempDir tmp_;
};

TEST_F(ZipWriterTest, WritesReadableDeflateEntries)
{
    const auto text = std::string(5000, 'a') + "tail";
    const auto noise = fdup::testing::pattern(200'000, 7);
    fdup::testing::write_file(tmp_ / "in" / "text.txt", text);
    fdup::testing::write_file(tmp_ / "in" / "noise.bin", noise);
    fdup::testing::write_file(tmp_ / "in" / "empty", "");

    const auto archive = tmp_ / "out.zip";
    {
        ZipWriter writer{archive};
        ASSERT_TRUE(writer.open());
        ASSERT_TRUE(writer.add_file(tmp_ / "in" / "text.txt", "text.txt"));
        ASSERT_TRUE(writer.add_file(tmp_ / "in" / "noise.bin", "sub/noise.bin"));
        ASSERT_TRUE(writer.add_file(tmp_ / "in" / "empty", "empty"));
        EXPECT_EQ(writer.entry_count(), 3u);
        ASSERT_TRUE(writer.finish());
    }

    ZipInspector zip{archive};
    ASSERT_TRUE(zip.is_open());
    const auto entries = zip.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].name, "text.txt");
    EXPECT_EQ(entries[1].name, "sub/noise.bin");
    EXPECT_EQ(entries[2].name, "empty");

    EXPECT_EQ(entries[0].method, ZIP_CM_DEFLATE);
    EXPECT_LT(entries[0].compressed_size, entries[0].size);
    EXPECT_EQ(entries[1].size, noise.size());

    EXPECT_EQ(zip.read("text.txt"), text);
    EXPECT_EQ(zip.read("sub/noise.bin"), noise);
    EXPECT_EQ(zip.read("empty"), std::string{});
}

TEST_F(ZipWriterTest, Utf8NamesSurvive)
{
    fdup::testing::write_file(tmp_ / "f.txt", "x");

    const auto archive = tmp_ / "names.zip";
    const std::string name = "\xd0\xba\xd0\xbe\xd0\xbf\xd0\xb8\xd1\x8f_1.txt";
    ZipWriter writer{archive};
    ASSERT_TRUE(writer.open());
    ASSERT_TRUE(writer.add_file(tmp_ / "f.txt", name));
    ASSERT_TRUE(writer.finish());

    ZipInspector zip{archive};
    EXPECT_EQ(zip.names(), std::vector<std::string>{name});
    EXPECT_EQ(zip.read(name), "x");
}

TEST_F(ZipWriterTest, ManyEntriesNeedZip64Directory)
{
    fdup::testing::write_file(tmp_ / "one.txt", "1");

    const auto archive = tmp_ / "many.zip";
    constexpr std::size_t kCount = 0xFFFF + 5;
    {
        ZipWriter writer{archive};
        ASSERT_TRUE(writer.open());
        for (std::size_t i = 0; i < kCount; ++i) {
            ASSERT_TRUE(writer.add_file(tmp_ / "one.txt", fmt::format("f{}.txt", i)));
        }
        ASSERT_TRUE(writer.finish());
    }

    ZipInspector zip{archive};
    const auto names = zip.names();
    ASSERT_EQ(names.size(), kCount);
    EXPECT_EQ(names.back(), fmt::format("f{}.txt", kCount - 1));
    EXPECT_EQ(zip.read(names.back()), "1");
}

TEST_F(ZipWriterTest, MissingSourceIsArchiveWriteFailure)
{
    ZipWriter writer{tmp_ / "x.zip"};
    ASSERT_TRUE(writer.open());
    auto res = writer.add_file(tmp_ / "missing", "missing");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, fdup::infra::ErrorCode::ArchiveWriteFailure);
}

TEST_F(ZipWriterTest, AddBeforeOpenFails)
{
    fdup::testing::write_file(tmp_ / "a.txt", "a");
    ZipWriter writer{tmp_ / "a.zip"};
    auto res = writer.add_file(tmp_ / "a.txt", "a.txt");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, fdup::infra::ErrorCode::ArchiveWriteFailure);
}

TEST_F(ZipWriterTest, DroppedWriterLeavesNoArchive)
{
    fdup::testing::write_file(tmp_ / "a.txt", "a");
    {
        ZipWriter writer{tmp_ / "a.zip"};
        ASSERT_TRUE(writer.open());
        ASSERT_TRUE(writer.add_file(tmp_ / "a.txt", "a.txt"));
    }
    EXPECT_FALSE(std::filesystem::exists(tmp_ / "a.zip"));
}

TEST_F(ZipWriterTest, InterruptCancelsFinish)
{
    fdup::testing::write_file(tmp_ / "a.txt", "a");
    ZipWriter writer{tmp_ / "a.zip"};
    ASSERT_TRUE(writer.open());
    ASSERT_TRUE(writer.add_file(tmp_ / "a.txt", "a.txt"));

    fdup::infra::request_interrupt();
    auto res = writer.finish();
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, fdup::infra::ErrorCode::Interrupted);
    EXPECT_FALSE(std::filesystem::exists(tmp_ / "a.zip"));
}

TEST_F(ZipWriterTest, UnknownEntryIsAbsent)
{
    fdup::testing::write_file(tmp_ / "a.txt", "a");
    ZipWriter writer{tmp_ / "a.zip"};
    ASSERT_TRUE(writer.open());
    ASSERT_TRUE(writer.add_file(tmp_ / "a.txt", "a.txt"));
    ASSERT_TRUE(writer.finish());

    ZipInspector zip{tmp_ / "a.zip"};
    EXPECT_EQ(zip.read("a.txt"), "a");
    EXPECT_FALSE(zip.read("b.txt"));
}
