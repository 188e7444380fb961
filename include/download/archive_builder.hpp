#pragma once

#include "download/collaborators.hpp"
#include "download/progress.hpp"
#include "download/progress_store.hpp"
#include "download/response_sink.hpp"
#include "download/types.hpp"
#include "util/cancel_token.hpp"
#include "util/clock.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace zipline {

class FetchWatchdog;
class ZipStreamWriter;

struct BuildStats {
    std::size_t requested = 0;
    std::size_t archived = 0;
    std::vector<std::string> failed;  // entry names
    std::uint64_t bytes_written = 0;
};

// Streams a list of stored objects into one ZIP archive on a response sink.
//
// Objects are fetched strictly one after another; the next fetch starts only
// after the previous stream has drained. A failing object is skipped and the
// archive continues. A failing sink or a cancelled token ends the download.
class ArchiveBuilder {
  public:
    struct Options {
        // Open deadline, and the longest a read may stall before the stream is cancelled.
        std::chrono::milliseconds fetch_timeout{30000};
        std::chrono::milliseconds watchdog_poll{100};
        std::size_t buffer_bytes = 256 * 1024;
        TimePoint modified = WallClock::now();
        IProgress* progress = nullptr;
    };

    ArchiveBuilder(IObjectStorage& storage, ProgressStore& store);
    ArchiveBuilder(IObjectStorage& storage, ProgressStore& store, Options opt);

    // The sink must already have been begun. On success the sink is ended and
    // the record is "ready"; on failure the sink is aborted and the record is
    // "error". Returns StreamAborted for a dead sink or a cancelled download.
    Result Build(const DownloadTarget& objects,
                 const std::string& download_id,
                 IResponseSink& sink,
                 const CancelToken& cancel,
                 BuildStats& stats);

  private:
    enum class EntryOutcome { Archived, Skipped, Fatal };

    EntryOutcome CopyObject(const ObjectRef& obj,
                            ZipStreamWriter& zip,
                            FetchWatchdog& watchdog,
                            const CancelToken& cancel,
                            std::vector<std::uint8_t>& buf,
                            Result& fatal);

    void Report(const std::string& download_id, const ObjectRef& obj,
                std::uint64_t objects_done, std::uint64_t objects_total,
                std::uint64_t bytes_done, std::uint64_t bytes_total);

    IObjectStorage& storage_;
    ProgressStore& store_;
    Options opt_;
};

} // namespace zipline
