#include "download/strategy_selector.hpp"

#include "testing.hpp"

#include <gtest/gtest.h>

namespace zipline {

using testutil::Obj;

TEST(StrategySelectorTest, TotalEqualToChunkStreamsDirectly) {
    DownloadTarget t = {Obj("1", "a.jpg", 500), Obj("2", "b.jpg", 500)};
    auto s = StrategySelector::Select(t, true, 1000);
    EXPECT_EQ(s.kind, DownloadStrategy::Kind::DirectStream);
    EXPECT_EQ(s.total_size, 1000U);
    EXPECT_EQ(s.estimated_parts, 1U);
}

TEST(StrategySelectorTest, OneByteOverChunkNeedsManifest) {
    DownloadTarget t = {Obj("1", "a.jpg", 500), Obj("2", "b.jpg", 500), Obj("3", "c.jpg", 1)};
    auto s = StrategySelector::Select(t, true, 1000);
    EXPECT_EQ(s.kind, DownloadStrategy::Kind::MultipartManifest);
    EXPECT_EQ(s.total_size, 1001U);
    EXPECT_EQ(s.chunk_size, 1000U);
    EXPECT_EQ(s.estimated_parts, 2U);
}

TEST(StrategySelectorTest, MultipartDisabledAlwaysStreams) {
    DownloadTarget t = {Obj("1", "a.jpg", 5000)};
    auto s = StrategySelector::Select(t, false, 1000);
    EXPECT_EQ(s.kind, DownloadStrategy::Kind::DirectStream);
    EXPECT_EQ(s.estimated_parts, 1U);
}

TEST(StrategySelectorTest, IsDeterministic) {
    DownloadTarget t = {Obj("1", "a.jpg", 700), Obj("2", "b.jpg", 900)};
    auto a = StrategySelector::Select(t, true, 1000);
    auto b = StrategySelector::Select(t, true, 1000);
    EXPECT_EQ(a.kind, b.kind);
    EXPECT_EQ(a.estimated_parts, b.estimated_parts);
    EXPECT_STREQ(StrategyName(a.kind), "MULTIPART_MANIFEST");
}

} // namespace zipline
