#include "download/archive_builder.hpp"

#include "download/exact_size.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <thread>

namespace zipline {

using testutil::Obj;

namespace {

ProgressStore::Options NoSweep() {
    ProgressStore::Options opt;
    opt.background_sweep = false;
    return opt;
}

ArchiveBuilder::Options FastOptions() {
    ArchiveBuilder::Options opt;
    opt.fetch_timeout = std::chrono::milliseconds(300);
    opt.watchdog_poll = std::chrono::milliseconds(10);
    opt.buffer_bytes = 16;
    return opt;
}

struct Fixture {
    testutil::FakeObjectStorage storage;
    ProgressStore store{NoSweep()};
    testutil::MemoryResponseSink sink;
    CancelToken cancel;
    std::string id;

    DownloadTarget AddObjects(int n) {
        DownloadTarget t;
        for (int i = 1; i <= n; ++i) {
            const std::string data = "photo-" + std::to_string(i) + std::string(static_cast<std::size_t>(i * 10), '#');
            t.push_back(Obj(std::to_string(i), "IMG_" + std::to_string(i) + ".jpg", data.size()));
            storage.Put(t.back().storage_ref, data);
        }
        return t;
    }

    void Start(const DownloadTarget& t) {
        ASSERT_TRUE(store.Create("x.zip", t.size(), id).is_ok());
        ASSERT_TRUE(sink.Begin(StreamHeaders{.filename = "x.zip", .download_id = id}).is_ok());
    }
};

class RecordingProgress final : public IProgress {
  public:
    void OnProgress(const ProgressEvent& e) override { done.push_back(e.objects_done); }
    std::vector<std::uint64_t> done;
};

} // namespace

TEST(ArchiveBuilderTest, StreamsEveryObjectInOrder) {
    Fixture f;
    auto target = f.AddObjects(3);
    f.Start(target);

    RecordingProgress progress;
    auto opt = FastOptions();
    opt.progress = &progress;
    ArchiveBuilder builder(f.storage, f.store, opt);

    BuildStats stats;
    auto r = builder.Build(target, f.id, f.sink, f.cancel, stats);
    ASSERT_TRUE(r.is_ok()) << r.message();
    EXPECT_TRUE(f.sink.ended);
    EXPECT_FALSE(f.sink.aborted);
    EXPECT_EQ(stats.archived, 3U);
    EXPECT_TRUE(stats.failed.empty());
    EXPECT_EQ(stats.bytes_written, f.sink.body.size());
    EXPECT_EQ(f.sink.body.size(), ExactStoredZipSize(target).value_or(0));

    auto entries = testutil::ReadZip(f.sink.body);
    ASSERT_EQ(entries.size(), 3U);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(entries[i].name, target[i].name);
        EXPECT_EQ(entries[i].contents.size(), target[i].size);
    }

    auto rec = f.store.Get(f.id);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, ProgressStatus::Ready);
    EXPECT_EQ(rec->processed, 3U);
    EXPECT_EQ(rec->percent, 100);

    EXPECT_EQ(progress.done, (std::vector<std::uint64_t>{1, 2, 3}));
    EXPECT_EQ(f.storage.opened, (std::vector<std::string>{"bucket/1", "bucket/2", "bucket/3"}));
}

TEST(ArchiveBuilderTest, NeverHoldsMoreThanOneStorageConnection) {
    Fixture f;
    auto target = f.AddObjects(6);
    f.Start(target);

    ArchiveBuilder builder(f.storage, f.store, FastOptions());
    BuildStats stats;
    ASSERT_TRUE(builder.Build(target, f.id, f.sink, f.cancel, stats).is_ok());
    EXPECT_EQ(f.storage.max_live, 1);
    EXPECT_EQ(f.storage.Live(), 0);
}

TEST(ArchiveBuilderTest, SkipsObjectThatFailsToOpenAndContinues) {
    Fixture f;
    auto target = f.AddObjects(5);
    f.storage.Put("bucket/3", testutil::FakeObject{.data = "x", .fail_open = true});
    f.Start(target);

    ArchiveBuilder builder(f.storage, f.store, FastOptions());
    BuildStats stats;
    ASSERT_TRUE(builder.Build(target, f.id, f.sink, f.cancel, stats).is_ok());

    auto entries = testutil::ReadZip(f.sink.body);
    ASSERT_EQ(entries.size(), 4U);
    for (const auto& e : entries) EXPECT_NE(e.name, "IMG_3.jpg");

    EXPECT_EQ(stats.archived, 4U);
    EXPECT_EQ(stats.failed, (std::vector<std::string>{"IMG_3.jpg"}));

    auto rec = f.store.Get(f.id);
    EXPECT_EQ(rec->status, ProgressStatus::Ready);
    EXPECT_EQ(rec->processed, 5U);
    EXPECT_EQ(rec->failed_entries, (std::vector<std::string>{"IMG_3.jpg"}));
}

TEST(ArchiveBuilderTest, ReadErrorMidObjectKeepsArchiveValid) {
    Fixture f;
    auto target = f.AddObjects(3);
    f.storage.Put("bucket/2", testutil::FakeObject{.data = std::string(40, 'q'), .fail_after = 20});
    target[1].size = 40;
    f.Start(target);

    ArchiveBuilder builder(f.storage, f.store, FastOptions());
    BuildStats stats;
    ASSERT_TRUE(builder.Build(target, f.id, f.sink, f.cancel, stats).is_ok());

    auto entries = testutil::ReadZip(f.sink.body);
    ASSERT_EQ(entries.size(), 3U);
    EXPECT_EQ(entries[1].name, "IMG_2.jpg");
    EXPECT_EQ(entries[1].contents, std::string(20, 'q'));
    EXPECT_EQ(stats.failed, (std::vector<std::string>{"IMG_2.jpg"}));
    EXPECT_EQ(f.store.Get(f.id)->status, ProgressStatus::Ready);
}

TEST(ArchiveBuilderTest, StalledFetchIsCancelledAndSkipped) {
    Fixture f;
    auto target = f.AddObjects(3);
    f.storage.Put("bucket/2", testutil::FakeObject{.data = std::string(30, 's'), .block_after = 0});
    f.Start(target);

    ArchiveBuilder builder(f.storage, f.store, FastOptions());
    BuildStats stats;
    const auto started = std::chrono::steady_clock::now();
    ASSERT_TRUE(builder.Build(target, f.id, f.sink, f.cancel, stats).is_ok());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));

    auto entries = testutil::ReadZip(f.sink.body);
    ASSERT_EQ(entries.size(), 2U);
    EXPECT_EQ(entries[0].name, "IMG_1.jpg");
    EXPECT_EQ(entries[1].name, "IMG_3.jpg");
    EXPECT_EQ(stats.failed, (std::vector<std::string>{"IMG_2.jpg"}));
}

TEST(ArchiveBuilderTest, SinkFailureAbortsAndMarksError) {
    Fixture f;
    auto target = f.AddObjects(4);
    f.sink.fail_after_bytes = 100;
    f.Start(target);

    ArchiveBuilder builder(f.storage, f.store, FastOptions());
    BuildStats stats;
    auto r = builder.Build(target, f.id, f.sink, f.cancel, stats);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.code(), ErrorCode::StreamAborted);
    EXPECT_TRUE(f.sink.aborted);
    EXPECT_FALSE(f.sink.ended);

    auto rec = f.store.Get(f.id);
    EXPECT_EQ(rec->status, ProgressStatus::Error);
    EXPECT_TRUE(rec->error.has_value());
    EXPECT_EQ(rec->processed, 4U);
    EXPECT_LT(f.storage.opened.size(), 4U);
    EXPECT_EQ(f.storage.Live(), 0);
}

TEST(ArchiveBuilderTest, CancelTokenStopsBlockedFetch) {
    Fixture f;
    auto target = f.AddObjects(3);
    f.storage.Put("bucket/2", testutil::FakeObject{.data = std::string(30, 's'), .block_after = 10});
    f.Start(target);

    auto opt = FastOptions();
    opt.fetch_timeout = std::chrono::seconds(60);
    ArchiveBuilder builder(f.storage, f.store, opt);

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        f.cancel.Cancel();
    });
    BuildStats stats;
    auto r = builder.Build(target, f.id, f.sink, f.cancel, stats);
    canceller.join();

    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.code(), ErrorCode::StreamAborted);
    EXPECT_TRUE(f.sink.aborted);
    EXPECT_EQ(f.storage.opened.size(), 2U);
    EXPECT_EQ(f.store.Get(f.id)->status, ProgressStatus::Error);
}

TEST(ArchiveBuilderTest, AlreadyCancelledFetchesNothing) {
    Fixture f;
    auto target = f.AddObjects(2);
    f.Start(target);
    f.cancel.Cancel();

    ArchiveBuilder builder(f.storage, f.store, FastOptions());
    BuildStats stats;
    EXPECT_EQ(builder.Build(target, f.id, f.sink, f.cancel, stats).code(), ErrorCode::StreamAborted);
    EXPECT_TRUE(f.storage.opened.empty());
}

TEST(ArchiveBuilderTest, EmptyObjectBecomesEmptyEntry) {
    Fixture f;
    DownloadTarget target = {Obj("1", "empty.jpg", 0)};
    f.storage.Put("bucket/1", std::string());
    f.Start(target);

    ArchiveBuilder builder(f.storage, f.store, FastOptions());
    BuildStats stats;
    ASSERT_TRUE(builder.Build(target, f.id, f.sink, f.cancel, stats).is_ok());

    auto entries = testutil::ReadZip(f.sink.body);
    ASSERT_EQ(entries.size(), 1U);
    EXPECT_EQ(entries[0].contents, "");
    EXPECT_EQ(f.sink.body.size(), ExactStoredZipSize(target).value_or(0));
}

} // namespace zipline
