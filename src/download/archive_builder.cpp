#include "download/archive_builder.hpp"

#include "archive/zip_stream_writer.hpp"
#include "download/fetch_watchdog.hpp"
#include "io/counting_writer.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <memory>
#include <utility>

namespace zipline {

namespace {

constexpr const char kCancelledMsg[] = "download cancelled by client";

const char* WatchdogReason(FetchWatchdog::Outcome o) {
    switch (o) {
        case FetchWatchdog::Outcome::TimedOut: return "fetch timed out";
        case FetchWatchdog::Outcome::Cancelled: return "download cancelled";
        case FetchWatchdog::Outcome::None: break;
    }
    return "read error";
}

} // namespace

ArchiveBuilder::ArchiveBuilder(IObjectStorage& storage, ProgressStore& store)
    : ArchiveBuilder(storage, store, Options{}) {}

ArchiveBuilder::ArchiveBuilder(IObjectStorage& storage, ProgressStore& store, Options opt)
    : storage_(storage), store_(store), opt_(std::move(opt)) {
    if (opt_.buffer_bytes == 0) opt_.buffer_bytes = 64 * 1024;
}

void ArchiveBuilder::Report(const std::string& download_id, const ObjectRef& obj,
                            std::uint64_t objects_done, std::uint64_t objects_total,
                            std::uint64_t bytes_done, std::uint64_t bytes_total) {
    if (!opt_.progress) return;
    opt_.progress->OnProgress(ProgressEvent{
        .download_id = download_id,
        .entry = obj.name,
        .objects_done = objects_done,
        .objects_total = objects_total,
        .bytes_done = bytes_done,
        .bytes_total = bytes_total,
    });
}

ArchiveBuilder::EntryOutcome ArchiveBuilder::CopyObject(const ObjectRef& obj,
                                                        ZipStreamWriter& zip,
                                                        FetchWatchdog& watchdog,
                                                        const CancelToken& cancel,
                                                        std::vector<std::uint8_t>& buf,
                                                        Result& fatal) {
    const auto deadline = std::chrono::steady_clock::now() + opt_.fetch_timeout;

    std::unique_ptr<IObjectStream> stream;
    auto r = storage_.OpenReadStream(obj.storage_ref, deadline, stream);
    if (!r.is_ok() || !stream) {
        if (cancel.IsCancelled()) {
            fatal = Result::Fail(ErrorCode::StreamAborted, kCancelledMsg);
            return EntryOutcome::Fatal;
        }
        LogWarn("skipping '%s' (%s): %s", obj.name.c_str(), obj.storage_ref.c_str(),
                r.is_ok() ? "no stream" : r.message().c_str());
        return EntryOutcome::Skipped;
    }

    watchdog.Arm(stream.get(), opt_.fetch_timeout);

    // Ends the entry with what was received and classifies the failure.
    auto fail_midway = [&](const char* what) -> EntryOutcome {
        const auto fired = watchdog.Disarm();
        if (fired == FetchWatchdog::Outcome::Cancelled || cancel.IsCancelled()) {
            fatal = Result::Fail(ErrorCode::StreamAborted, kCancelledMsg);
            return EntryOutcome::Fatal;
        }
        const char* reason = fired == FetchWatchdog::Outcome::None ? what : WatchdogReason(fired);
        LogWarn("skipping '%s' (%s): %s", obj.name.c_str(), obj.storage_ref.c_str(), reason);
        if (zip.InEntry()) {
            auto er = zip.EndEntry();
            if (!er.is_ok()) {
                fatal = er;
                return EntryOutcome::Fatal;
            }
        }
        return EntryOutcome::Skipped;
    };

    // The first chunk is read before the header goes out, so an object that
    // fails straight away leaves no entry behind.
    ssize_t n = stream->Read(buf);
    if (n < 0) return fail_midway(std::strerror(errno));
    watchdog.Touch();

    r = zip.BeginEntry(obj.name, obj.size);
    if (!r.is_ok()) {
        watchdog.Disarm();
        if (zip.Closed()) {
            fatal = Result::Fail(ErrorCode::StreamAborted, r.message());
            return EntryOutcome::Fatal;
        }
        LogWarn("skipping '%s': %s", obj.name.c_str(), r.message().c_str());
        return EntryOutcome::Skipped;
    }

    std::uint64_t copied = 0;
    while (n > 0) {
        r = zip.WriteEntryData(std::span<const std::uint8_t>(buf.data(), static_cast<std::size_t>(n)));
        if (!r.is_ok()) {
            watchdog.Disarm();
            fatal = Result::Fail(ErrorCode::StreamAborted, r.message());
            return EntryOutcome::Fatal;
        }
        copied += static_cast<std::uint64_t>(n);

        if (cancel.IsCancelled()) {
            watchdog.Disarm();
            fatal = Result::Fail(ErrorCode::StreamAborted, kCancelledMsg);
            return EntryOutcome::Fatal;
        }

        n = stream->Read(buf);
        if (n < 0) return fail_midway(std::strerror(errno));
        watchdog.Touch();
    }

    watchdog.Disarm();

    if (copied != obj.size) {
        LogWarn("'%s': catalog size %llu, stored %llu bytes", obj.name.c_str(),
                static_cast<unsigned long long>(obj.size), static_cast<unsigned long long>(copied));
    }

    r = zip.EndEntry();
    if (!r.is_ok()) {
        fatal = r;
        return EntryOutcome::Fatal;
    }
    return EntryOutcome::Archived;
}

Result ArchiveBuilder::Build(const DownloadTarget& objects,
                             const std::string& download_id,
                             IResponseSink& sink,
                             const CancelToken& cancel,
                             BuildStats& stats) {
    stats = BuildStats{};
    stats.requested = objects.size();

    store_.Update(download_id, ProgressUpdate{.status = ProgressStatus::Processing});

    CountingWriter counted(sink);
    ZipStreamWriter zip(counted, ZipStreamWriter::Options{.modified = opt_.modified});
    FetchWatchdog watchdog(cancel, opt_.watchdog_poll);
    std::vector<std::uint8_t> buf(opt_.buffer_bytes);

    const std::uint64_t bytes_total = TotalSize(objects);
    std::uint64_t bytes_done = 0;
    std::uint64_t processed = 0;
    Result fatal = Result::Ok();

    for (const auto& obj : objects) {
        if (cancel.IsCancelled()) {
            fatal = Result::Fail(ErrorCode::StreamAborted, kCancelledMsg);
            break;
        }

        const auto outcome = CopyObject(obj, zip, watchdog, cancel, buf, fatal);
        if (outcome == EntryOutcome::Fatal) break;

        ++processed;
        ProgressUpdate upd{.processed = processed};
        if (outcome == EntryOutcome::Skipped) {
            stats.failed.push_back(obj.name);
            upd.failed_entry = obj.name;
        } else {
            ++stats.archived;
        }
        store_.Update(download_id, upd);

        bytes_done += obj.size;
        Report(download_id, obj, processed, objects.size(), bytes_done, bytes_total);
    }

    if (fatal.is_ok()) {
        auto r = zip.Finish();
        if (r.is_ok()) r = sink.End();
        if (!r.is_ok()) {
            fatal = r.code() == ErrorCode::IoError ? r : Result::Fail(ErrorCode::StreamAborted, r.message());
        }
    }

    stats.bytes_written = counted.BytesWritten();

    if (!fatal.is_ok()) {
        zip.Abandon();
        sink.Abort(fatal.message());
        store_.Update(download_id, ProgressUpdate{
                                       .status = ProgressStatus::Error,
                                       .processed = static_cast<std::uint64_t>(objects.size()),
                                       .error = fatal.message(),
                                   });
        LogError("download %s aborted after %llu/%zu objects: %s", download_id.c_str(),
                 static_cast<unsigned long long>(processed), objects.size(), fatal.message().c_str());
        return fatal;
    }

    store_.Update(download_id, ProgressUpdate{
                                   .status = ProgressStatus::Ready,
                                   .processed = static_cast<std::uint64_t>(objects.size()),
                               });
    if (!stats.failed.empty()) {
        LogWarn("download %s finished with %zu of %zu objects skipped", download_id.c_str(),
                stats.failed.size(), objects.size());
    }
    LogInfo("download %s ready: %zu entries, %llu bytes", download_id.c_str(), stats.archived,
            static_cast<unsigned long long>(stats.bytes_written));
    return Result::Ok();
}

} // namespace zipline
