#pragma once

#include "download/archive_builder.hpp"
#include "download/collaborators.hpp"
#include "download/progress_store.hpp"
#include "download/response_sink.hpp"
#include "download/ticket_codec.hpp"
#include "download/types.hpp"
#include "util/cancel_token.hpp"
#include "util/clock.hpp"
#include "util/config.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace zipline {

struct DownloadRequest {
    TargetSelector target;
    std::string requester;
    std::string credential;
    // A signed ticket replaces requester and target; the credential is then unused.
    std::string ticket;
    std::optional<std::uint32_t> part_index;
};

struct DownloadOutcome {
    enum class Kind { Rejected, Manifest, Streamed };

    Kind kind = Kind::Rejected;
    int http_status = 0;
    std::string download_id;
    std::string filename;
    DownloadStrategy strategy;
    std::optional<std::uint64_t> content_length;
    std::size_t part_count = 0;  // manifest only
    BuildStats stats;
};

int HttpStatusFor(ErrorCode code);

// Every character outside [A-Za-z0-9] becomes "_" (one per UTF-8 code point).
std::string SanitizeBaseName(std::string_view name);

// "<title>_all_photos", "<folder>_photos" or "<title>_<liked|favorited>_photos".
std::string BaseNameFor(const TargetSelector& target, const ResolvedTarget& resolved);

// Entry point for every archive download request.
//
// Decides between one streamed archive and a manifest of part links, and for
// streamed archives owns the progress record from creation to scheduled
// removal. Requests are independent; one orchestrator serves any number of
// threads.
class DownloadOrchestrator {
  public:
    struct Options {
        bool multipart_enabled = false;
        std::uint64_t chunk_size_bytes = 2000ULL * 1024 * 1024;
        std::string api_base_path = "/api/photos";
        std::chrono::seconds cleanup_delay{300};
        ArchiveBuilder::Options builder;
        ClockFn clock = SystemClock();
    };

    static Options OptionsFromConfig(const DownloadConfig& cfg);

    DownloadOrchestrator(const IAuthorizer& authorizer,
                         const ITargetResolver& resolver,
                         IObjectStorage& storage,
                         ProgressStore& progress,
                         const TicketCodec& tickets,
                         Options opt);

    // Writes exactly one response to the sink: an error JSON, a manifest JSON
    // or a ZIP stream. Returns the failure for anything but ready/manifest.
    Result HandleDownload(const DownloadRequest& request,
                          IResponseSink& sink,
                          const CancelToken& cancel,
                          DownloadOutcome& outcome);

    Result IssueTicketUrl(const TargetSelector& target,
                          const std::string& requester,
                          const std::string& credential,
                          std::string& out_url) const;

    Result GetProgress(const std::string& download_id, ProgressRecord& out) const;

    const Options& options() const { return opt_; }

  private:
    Result Authorize(const DownloadRequest& request, TargetSelector& target, std::string& requester) const;
    Result Resolve(const TargetSelector& target, const std::string& requester, ResolvedTarget& out) const;
    Result Reject(IResponseSink& sink, ErrorCode code, const std::string& msg, DownloadOutcome& outcome) const;
    Result SendManifest(const DownloadRequest& request, const TargetSelector& target,
                        const DownloadTarget& objects, const std::string& base_name,
                        IResponseSink& sink, DownloadOutcome& outcome) const;
    Result Stream(const DownloadTarget& objects, const std::string& filename,
                  IResponseSink& sink, const CancelToken& cancel, DownloadOutcome& outcome);

    const IAuthorizer& authorizer_;
    const ITargetResolver& resolver_;
    IObjectStorage& storage_;
    ProgressStore& progress_;
    const TicketCodec& tickets_;
    Options opt_;
};

} // namespace zipline
