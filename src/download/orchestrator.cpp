#include "download/orchestrator.hpp"

#include "download/download_urls.hpp"
#include "download/exact_size.hpp"
#include "download/json_views.hpp"
#include "download/partitioner.hpp"
#include "download/strategy_selector.hpp"
#include "util/entry_names.hpp"
#include "util/logger.hpp"

#include <utility>
#include <vector>

namespace zipline {

namespace {

bool IsAsciiAlnum(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

void NormalizeNames(DownloadTarget& objects) {
    std::vector<std::string> names;
    names.reserve(objects.size());
    for (const auto& o : objects) names.push_back(o.name);
    MakeUniqueEntryNames(names);
    for (std::size_t i = 0; i < objects.size(); ++i) objects[i].name = std::move(names[i]);
}

} // namespace

int HttpStatusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                return 200;
        case ErrorCode::NotFound:            return 404;
        case ErrorCode::PartNotFound:        return 404;
        case ErrorCode::Expired:             return 410;
        case ErrorCode::Unauthorized:        return 401;
        case ErrorCode::InvalidTicket:       return 401;
        case ErrorCode::ExpiredTicket:       return 401;
        case ErrorCode::InvalidArgument:     return 400;
        case ErrorCode::UpstreamObjectError: return 502;
        case ErrorCode::SigningError:
        case ErrorCode::StreamAborted:
        case ErrorCode::IoError:
        case ErrorCode::ConfigError:         return 500;
    }
    return 500;
}

std::string SanitizeBaseName(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char ch : name) {
        const auto c = static_cast<unsigned char>(ch);
        if (IsAsciiAlnum(c)) {
            out.push_back(ch);
        } else if ((c & 0xC0) != 0x80) {
            out.push_back('_');
        }
    }
    return out;
}

std::string BaseNameFor(const TargetSelector& target, const ResolvedTarget& resolved) {
    switch (target.kind) {
        case DownloadKind::Folder:
            return (resolved.folder_name.empty() ? std::string("folder") : SanitizeBaseName(resolved.folder_name)) +
                   "_photos";
        case DownloadKind::Liked:
        case DownloadKind::Favorited:
            return SanitizeBaseName(resolved.gallery_title) + "_" + DownloadKindName(target.kind) + "_photos";
        case DownloadKind::All:
            break;
    }
    return SanitizeBaseName(resolved.gallery_title) + "_all_photos";
}

DownloadOrchestrator::Options DownloadOrchestrator::OptionsFromConfig(const DownloadConfig& cfg) {
    Options opt;
    opt.multipart_enabled = cfg.multipart_enabled();
    opt.chunk_size_bytes = cfg.chunk_size_bytes();
    opt.api_base_path = cfg.api_base_path;
    opt.cleanup_delay = cfg.progress_cleanup_delay;
    opt.builder.fetch_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(cfg.fetch_timeout);
    return opt;
}

DownloadOrchestrator::DownloadOrchestrator(const IAuthorizer& authorizer,
                                           const ITargetResolver& resolver,
                                           IObjectStorage& storage,
                                           ProgressStore& progress,
                                           const TicketCodec& tickets,
                                           Options opt)
    : authorizer_(authorizer),
      resolver_(resolver),
      storage_(storage),
      progress_(progress),
      tickets_(tickets),
      opt_(std::move(opt)) {}

Result DownloadOrchestrator::Reject(IResponseSink& sink, ErrorCode code, const std::string& msg,
                                    DownloadOutcome& outcome) const {
    outcome.kind = DownloadOutcome::Kind::Rejected;
    outcome.http_status = HttpStatusFor(code);
    LogWarn("download rejected (%d %s): %s", outcome.http_status, ErrorCodeName(code), msg.c_str());

    if (!sink.HeadersSent()) {
        auto r = sink.SendJson(outcome.http_status, ErrorJson(code, msg).dump());
        if (!r.is_ok()) LogWarn("could not deliver error response: %s", r.message().c_str());
    }
    return Result::Fail(code, msg);
}

Result DownloadOrchestrator::Authorize(const DownloadRequest& request, TargetSelector& target,
                                       std::string& requester) const {
    if (!request.ticket.empty()) {
        TicketPayload payload;
        auto r = tickets_.Verify(request.ticket, payload);
        if (!r.is_ok()) return r;

        // A part link names its gallery again; it has to be the ticket's.
        if (!request.target.gallery_id.empty() && !(request.target == payload.target)) {
            return Result::Fail(ErrorCode::Unauthorized, "ticket was issued for a different target");
        }
        target = payload.target;
        requester = payload.requester;
        return Result::Ok();
    }

    if (!authorizer_.IsAuthorized(request.target, request.requester, request.credential)) {
        return Result::Fail(ErrorCode::Unauthorized, "access denied to gallery " + request.target.gallery_id);
    }
    target = request.target;
    requester = request.requester;
    return Result::Ok();
}

Result DownloadOrchestrator::Resolve(const TargetSelector& target, const std::string& requester,
                                     ResolvedTarget& out) const {
    if (target.gallery_id.empty()) return Result::Fail(ErrorCode::InvalidArgument, "missing gallery id");
    if (target.kind == DownloadKind::Folder && target.folder_id.empty()) {
        return Result::Fail(ErrorCode::InvalidArgument, "folder download without folder id");
    }

    auto r = resolver_.Resolve(target, requester, out);
    if (!r.is_ok()) return r;

    if (out.expires_at && *out.expires_at < opt_.clock()) {
        return Result::Fail(ErrorCode::Expired, "gallery " + target.gallery_id + " has expired");
    }
    if (out.objects.empty()) return Result::Fail(ErrorCode::NotFound, "No photos found to download");

    SortTarget(out.objects);
    NormalizeNames(out.objects);
    return Result::Ok();
}

Result DownloadOrchestrator::SendManifest(const DownloadRequest& request, const TargetSelector& target,
                                          const DownloadTarget& objects, const std::string& base_name,
                                          IResponseSink& sink, DownloadOutcome& outcome) const {
    const auto parts = Partitioner::Split(objects, opt_.chunk_size_bytes, base_name);
    const auto body = ManifestJson(parts, opt_.api_base_path, target, request.ticket).dump();

    outcome.kind = DownloadOutcome::Kind::Manifest;
    outcome.http_status = 200;
    outcome.part_count = parts.size();

    LogInfo("multipart manifest for gallery %s: %zu objects, %llu bytes, %zu parts", target.gallery_id.c_str(),
            objects.size(), static_cast<unsigned long long>(outcome.strategy.total_size), parts.size());

    auto r = sink.SendJson(200, body);
    if (!r.is_ok()) return Result::Fail(ErrorCode::StreamAborted, r.message());
    return Result::Ok();
}

Result DownloadOrchestrator::Stream(const DownloadTarget& objects, const std::string& filename,
                                    IResponseSink& sink, const CancelToken& cancel, DownloadOutcome& outcome) {
    const auto exact = ExactStoredZipSize(objects);

    std::string id;
    auto r = progress_.Create(filename, objects.size(), id);
    if (!r.is_ok()) return Reject(sink, r.code(), r.message(), outcome);

    outcome.kind = DownloadOutcome::Kind::Streamed;
    outcome.download_id = id;
    outcome.filename = filename;
    outcome.content_length = exact;

    LogInfo("starting download %s: %s, %zu objects, %s%llu bytes", id.c_str(), filename.c_str(), objects.size(),
            exact ? "exact size " : "unknown size, estimated ",
            static_cast<unsigned long long>(exact ? *exact : StoredZipSizeFormula(objects)));

    r = sink.Begin(StreamHeaders{
        .content_type = "application/zip",
        .filename = filename,
        .content_length = exact,
        .download_id = id,
    });
    if (!r.is_ok()) {
        progress_.Update(id, ProgressUpdate{
                                 .status = ProgressStatus::Error,
                                 .processed = static_cast<std::uint64_t>(objects.size()),
                                 .error = r.message(),
                             });
        progress_.ScheduleRemoval(id, opt_.cleanup_delay);
        if (!sink.HeadersSent()) return Reject(sink, ErrorCode::StreamAborted, r.message(), outcome);

        outcome.http_status = 500;
        sink.Abort(r.message());
        return Result::Fail(ErrorCode::StreamAborted, r.message());
    }
    outcome.http_status = 200;

    auto builder_opt = opt_.builder;
    builder_opt.modified = opt_.clock();
    ArchiveBuilder builder(storage_, progress_, builder_opt);
    r = builder.Build(objects, id, sink, cancel, outcome.stats);

    progress_.ScheduleRemoval(id, opt_.cleanup_delay);

    if (exact && r.is_ok() && outcome.stats.bytes_written != *exact) {
        LogWarn("download %s: declared %llu bytes, wrote %llu", id.c_str(), static_cast<unsigned long long>(*exact),
                static_cast<unsigned long long>(outcome.stats.bytes_written));
    }
    return r;
}

Result DownloadOrchestrator::HandleDownload(const DownloadRequest& request,
                                            IResponseSink& sink,
                                            const CancelToken& cancel,
                                            DownloadOutcome& outcome) {
    outcome = DownloadOutcome{};

    TargetSelector target;
    std::string requester;
    auto r = Authorize(request, target, requester);
    if (!r.is_ok()) return Reject(sink, r.code(), r.message(), outcome);

    ResolvedTarget resolved;
    r = Resolve(target, requester, resolved);
    if (!r.is_ok()) return Reject(sink, r.code(), r.message(), outcome);

    outcome.strategy = StrategySelector::Select(resolved.objects, opt_.multipart_enabled, opt_.chunk_size_bytes);
    const std::string base_name = BaseNameFor(target, resolved);

    if (request.part_index) {
        const auto parts = Partitioner::Split(resolved.objects, opt_.chunk_size_bytes, base_name);
        const ArchivePart* part = nullptr;
        r = Partitioner::FindPart(parts, *request.part_index, part);
        if (!r.is_ok()) return Reject(sink, r.code(), r.message(), outcome);

        LogInfo("delivering part %u/%zu of gallery %s (%zu objects)", part->index, parts.size(),
                target.gallery_id.c_str(), part->count());
        return Stream(part->objects, part->filename, sink, cancel, outcome);
    }

    if (outcome.strategy.kind == DownloadStrategy::Kind::MultipartManifest) {
        return SendManifest(request, target, resolved.objects, base_name, sink, outcome);
    }

    return Stream(resolved.objects, base_name + ".zip", sink, cancel, outcome);
}

Result DownloadOrchestrator::IssueTicketUrl(const TargetSelector& target,
                                            const std::string& requester,
                                            const std::string& credential,
                                            std::string& out_url) const {
    if (!authorizer_.IsAuthorized(target, requester, credential)) {
        return Result::Fail(ErrorCode::Unauthorized, "access denied to gallery " + target.gallery_id);
    }

    ResolvedTarget resolved;
    auto r = Resolve(target, requester, resolved);
    if (!r.is_ok()) return r;

    TicketPayload payload{.requester = requester, .target = target};
    std::string token;
    r = tickets_.Issue(payload, token);
    if (!r.is_ok()) return r;

    out_url = BuildTicketUrl(opt_.api_base_path, token);
    LogInfo("issued download ticket for gallery %s (%s), valid until %lld", target.gallery_id.c_str(),
            DownloadKindName(target.kind), static_cast<long long>(ToUnixSeconds(payload.expires_at)));
    return Result::Ok();
}

Result DownloadOrchestrator::GetProgress(const std::string& download_id, ProgressRecord& out) const {
    auto rec = progress_.Get(download_id);
    if (!rec) return Result::Fail(ErrorCode::NotFound, "Download not found");
    out = std::move(*rec);
    return Result::Ok();
}

} // namespace zipline
