#include "download/exact_size.hpp"

#include "archive/zip_format.hpp"
#include "archive/zip_stream_writer.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

namespace zipline {

using testutil::Obj;

namespace {

std::vector<std::uint8_t> BuildStored(const DownloadTarget& objects) {
    testutil::MemoryWriter out;
    ZipStreamWriter zip(out);
    for (const auto& o : objects) {
        EXPECT_TRUE(zip.BeginEntry(o.name, o.size).is_ok());
        const std::string body(o.size, 'x');
        EXPECT_TRUE(zip.WriteEntryData(testutil::Bytes(body)).is_ok());
        EXPECT_TRUE(zip.EndEntry().is_ok());
    }
    EXPECT_TRUE(zip.Finish().is_ok());
    return out.data;
}

} // namespace

TEST(ExactSizeTest, EmptyArchiveIsJustTheEndRecord) {
    EXPECT_EQ(StoredZipSizeFormula({}), 22U);
    EXPECT_EQ(ExactStoredZipSize({}).value_or(0), 22U);
}

TEST(ExactSizeTest, FormulaCountsNameTwicePerEntry) {
    DownloadTarget t = {Obj("1", "a.jpg", 100)};
    EXPECT_EQ(StoredZipSizeFormula(t), 22U + 100U + 92U + 10U);
}

TEST(ExactSizeTest, MatchesRealArchiveByteForByte) {
    DownloadTarget t = {Obj("1", "IMG_0001.jpg", 1234), Obj("2", "ceremony/IMG_0002.jpg", 0),
                        Obj("3", "caf\xc3\xa9.jpg", 77), Obj("4", "z.png", 4096)};
    const auto bytes = BuildStored(t);

    auto exact = ExactStoredZipSize(t);
    ASSERT_TRUE(exact.has_value());
    EXPECT_EQ(*exact, bytes.size());
    EXPECT_EQ(*exact, StoredZipSizeFormula(t));
}

TEST(ExactSizeTest, NameLengthIsCountedInBytes) {
    DownloadTarget t = {Obj("1", "\xe5\xa9\x9a\xe7\xa4\xbc.jpg", 3)};
    const auto bytes = BuildStored(t);
    EXPECT_EQ(ExactStoredZipSize(t).value_or(0), bytes.size());
}

TEST(ExactSizeTest, UnknownOnceZip64IsNeeded) {
    DownloadTarget big = {Obj("1", "huge.mov", zip::kMax32)};
    EXPECT_FALSE(ExactStoredZipSize(big).has_value());

    DownloadTarget offsets = {Obj("1", "a.mov", zip::kMax32 - 200), Obj("2", "b.mov", 300)};
    EXPECT_FALSE(ExactStoredZipSize(offsets).has_value());

    DownloadTarget many;
    for (std::uint32_t i = 0; i < zip::kMax16; ++i) many.push_back(Obj(std::to_string(i), "f" + std::to_string(i), 0));
    EXPECT_FALSE(ExactStoredZipSize(many).has_value());
    many.pop_back();
    EXPECT_TRUE(ExactStoredZipSize(many).has_value());
}

TEST(ExactSizeTest, UnknownWhenAnEntryNameCannotBeWritten) {
    DownloadTarget target = {Obj("1", "a.jpg", 10), Obj("2", std::string(zip::kMax16, 'n'), 10)};
    EXPECT_FALSE(ExactStoredZipSize(target).has_value());

    testutil::MemoryWriter out;
    ZipStreamWriter zip(out);
    EXPECT_EQ(zip.BeginEntry(target[1].name, 10).code(), ErrorCode::InvalidArgument);

    target[1].name.pop_back();
    EXPECT_TRUE(ExactStoredZipSize(target).has_value());
}

} // namespace zipline
