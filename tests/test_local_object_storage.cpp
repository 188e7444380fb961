#include "storage/local_object_storage.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

namespace {

using zipline::ErrorCode;
using zipline::LocalObjectStorage;

std::chrono::steady_clock::time_point Later() {
    return std::chrono::steady_clock::now() + std::chrono::seconds(30);
}

TEST(LocalObjectStorageTests, ResolvesEveryReferenceForm) {
    LocalObjectStorage s("/srv/objects/");
    std::string p;

    ASSERT_TRUE(s.ResolvePath("bucket/a/b.jpg", p).is_ok());
    EXPECT_EQ(p, "/srv/objects/bucket/a/b.jpg");

    ASSERT_TRUE(s.ResolvePath("s3://bucket/k.jpg", p).is_ok());
    EXPECT_EQ(p, "/srv/objects/bucket/k.jpg");

    ASSERT_TRUE(s.ResolvePath("https://cdn.example.com/bucket/my%20photo.jpg?sig=1", p).is_ok());
    EXPECT_EQ(p, "/srv/objects/bucket/my photo.jpg");
}

TEST(LocalObjectStorageTests, RefusesReferencesOutsideRoot) {
    LocalObjectStorage s("/srv/objects");
    std::string p;
    EXPECT_EQ(s.ResolvePath("bucket/../../etc/passwd", p).code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(s.ResolvePath("https://h/bucket/%2e%2e/x", p).code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(s.ResolvePath("bucket\\..\\x", p).code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(s.ResolvePath("justabucket", p).code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(s.ResolvePath("ftp://h/bucket/x", p).code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(s.ResolvePath("https://hostonly", p).code(), ErrorCode::InvalidArgument);
}

TEST(LocalObjectStorageTests, OpensAndReadsObject) {
    testutil::TemporaryDirectory tmp;
    tmp.WriteFile("bucket/dir/photo.jpg", "jpeg bytes");

    LocalObjectStorage s(tmp.Path());
    std::unique_ptr<zipline::IObjectStream> stream;
    auto r = s.OpenReadStream("bucket/dir/photo.jpg", Later(), stream);
    ASSERT_TRUE(r.is_ok()) << r.message();
    ASSERT_NE(stream, nullptr);
    EXPECT_EQ(stream->TotalSize().value_or(0), 10u);
    EXPECT_EQ(testutil::ReadAll(*stream), "jpeg bytes");
}

TEST(LocalObjectStorageTests, MissingObjectIsUpstreamError) {
    testutil::TemporaryDirectory tmp;
    LocalObjectStorage s(tmp.Path());
    std::unique_ptr<zipline::IObjectStream> stream;
    EXPECT_EQ(s.OpenReadStream("bucket/none.jpg", Later(), stream).code(), ErrorCode::UpstreamObjectError);
    EXPECT_EQ(stream, nullptr);
    EXPECT_EQ(s.OpenReadStream("../x", Later(), stream).code(), ErrorCode::UpstreamObjectError);
}

TEST(LocalObjectStorageTests, PassedDeadlineFailsOpen) {
    testutil::TemporaryDirectory tmp;
    tmp.WriteFile("bucket/a", "x");
    LocalObjectStorage s(tmp.Path());
    std::unique_ptr<zipline::IObjectStream> stream;
    auto r = s.OpenReadStream("bucket/a", std::chrono::steady_clock::now() - std::chrono::seconds(1), stream);
    EXPECT_EQ(r.code(), ErrorCode::UpstreamObjectError);
}

TEST(LocalObjectStorageTests, CancelledStreamStopsReading) {
    testutil::TemporaryDirectory tmp;
    tmp.WriteFile("bucket/a", std::string(4096, 'z'));
    LocalObjectStorage s(tmp.Path());
    std::unique_ptr<zipline::IObjectStream> stream;
    ASSERT_TRUE(s.OpenReadStream("bucket/a", Later(), stream).is_ok());

    stream->Cancel();
    std::array<std::uint8_t, 16> buf{};
    EXPECT_LT(stream->Read(std::span<std::uint8_t>(buf.data(), buf.size())), 0);
}

} // namespace
