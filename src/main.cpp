#define _FILE_OFFSET_BITS 64

#include "archive/archive_inspector.hpp"
#include "catalog/json_catalog.hpp"
#include "download/download_urls.hpp"
#include "download/file_response_sink.hpp"
#include "download/json_views.hpp"
#include "download/orchestrator.hpp"
#include "download/progress_store.hpp"
#include "download/ticket_codec.hpp"
#include "storage/local_object_storage.hpp"
#include "system/signals.hpp"
#include "util/config.hpp"
#include "util/console_progress.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr const char *kDefaultConfigPath = "/etc/zipline/zipline.json";

enum class Mode { None, Download, IssueTicket, FetchUrl, Inspect };

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s -d -C <catalog> -g <gallery> [--folder <id> | --filter liked|favorited] [--part N] [-o <out|->]\n"
        "   %s -t -C <catalog> -g <gallery> [--folder <id> | --filter ...]\n"
        "   %s -u <ticket-or-part-url> -C <catalog> [-o <out|->]\n"
        "   %s --inspect <archive.zip>\n"
        "\n"
        "Modes:\n"
        "  -d, --download          Stream the gallery archive, or print the part manifest\n"
        "  -t, --issue-ticket      Print a signed download URL for the target\n"
        "  -u, --url               Download through a ticket URL or a manifest part URL\n"
        "      --inspect           List the entries of a ZIP archive\n"
        "\n"
        "Options:\n"
        "  -c, --config            Config file (default %s)\n"
        "  -C, --catalog           Gallery catalog JSON\n"
        "  -r, --storage-root      Object storage root directory (overrides config)\n"
        "  -g, --gallery           Gallery id\n"
        "      --folder            Folder id (folder download)\n"
        "      --filter            liked | favorited\n"
        "  -p, --part              1-based part index\n"
        "      --user              Requester id\n"
        "      --password          Gallery password\n"
        "  -o, --output            Output file or '-' for stdout (default <archive name>)\n"
        "  -m, --multipart         Enable multipart downloads (overrides config)\n"
        "  -s, --chunk-size        Part size threshold in MB (overrides config)\n"
        "      --secret            Ticket signing secret (overrides config)\n"
        "      --progress          Show console progress\n"
        "      --show-record       Print the progress record JSON when done\n"
        "  -v, --verbose           Debug logging\n"
        "  -h, --help              Show this help\n",
        argv, argv, argv, argv, kDefaultConfigPath);
}

bool ParseU64(const char *s, std::uint64_t &out) {
    char *end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (!end || *end != '\0' || end == s || errno == ERANGE) return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

int InspectArchive(const std::string &path) {
    zipline::ArchiveInspector inspector;
    if (auto r = inspector.OpenFile(path); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.message().c_str());
        return 1;
    }

    std::vector<zipline::ArchiveEntryInfo> entries;
    if (auto r = zipline::ListArchiveEntries(inspector, entries); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.message().c_str());
        return 1;
    }

    std::uint64_t total = 0;
    for (const auto &e : entries) {
        std::printf("%12llu  %s\n", static_cast<unsigned long long>(e.size), e.name.c_str());
        total += e.size;
    }
    std::printf("%12llu  %zu entries\n", static_cast<unsigned long long>(total), entries.size());
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    zipline::CancelToken cancel;
    zipline::InstallSignalHandlers(cancel);

    Mode mode = Mode::None;
    std::string config_path;
    std::string catalog_path;
    std::string url;
    std::string inspect_path;
    std::string out_cli;
    std::optional<std::string> root_cli;
    std::optional<std::string> secret_cli;
    std::optional<std::uint64_t> chunk_cli;
    bool multipart_cli = false;
    bool progress = false;
    bool show_record = false;
    bool verbose = false;

    zipline::DownloadRequest request;
    std::string folder_id;
    std::string filter;

    enum LongOnly {
        kOptInspect = 256,
        kOptFolder,
        kOptFilter,
        kOptUser,
        kOptPassword,
        kOptSecret,
        kOptProgress,
        kOptShowRecord,
    };

    static option long_opts[] = {
        {"download", no_argument, nullptr, 'd'},
        {"issue-ticket", no_argument, nullptr, 't'},
        {"url", required_argument, nullptr, 'u'},
        {"inspect", required_argument, nullptr, kOptInspect},
        {"config", required_argument, nullptr, 'c'},
        {"catalog", required_argument, nullptr, 'C'},
        {"storage-root", required_argument, nullptr, 'r'},
        {"gallery", required_argument, nullptr, 'g'},
        {"folder", required_argument, nullptr, kOptFolder},
        {"filter", required_argument, nullptr, kOptFilter},
        {"part", required_argument, nullptr, 'p'},
        {"user", required_argument, nullptr, kOptUser},
        {"password", required_argument, nullptr, kOptPassword},
        {"output", required_argument, nullptr, 'o'},
        {"multipart", no_argument, nullptr, 'm'},
        {"chunk-size", required_argument, nullptr, 's'},
        {"secret", required_argument, nullptr, kOptSecret},
        {"progress", no_argument, nullptr, kOptProgress},
        {"show-record", no_argument, nullptr, kOptShowRecord},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "dtu:c:C:r:g:p:o:ms:vh", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'd': mode = Mode::Download; break;
            case 't': mode = Mode::IssueTicket; break;
            case 'u':
                mode = Mode::FetchUrl;
                url = optarg;
                break;
            case kOptInspect:
                mode = Mode::Inspect;
                inspect_path = optarg;
                break;

            case 'c': config_path = optarg; break;
            case 'C': catalog_path = optarg; break;
            case 'r': root_cli = optarg; break;
            case 'g': request.target.gallery_id = optarg; break;
            case kOptFolder: folder_id = optarg; break;
            case kOptFilter: filter = optarg; break;
            case kOptUser: request.requester = optarg; break;
            case kOptPassword: request.credential = optarg; break;
            case 'o': out_cli = optarg; break;
            case 'm': multipart_cli = true; break;
            case kOptSecret: secret_cli = optarg; break;
            case kOptProgress: progress = true; break;
            case kOptShowRecord: show_record = true; break;
            case 'v': verbose = true; break;

            case 'p': {
                std::uint64_t v = 0;
                if (!ParseU64(optarg, v) || v > UINT32_MAX) {
                    std::fprintf(stderr, "Invalid --part: %s\n", optarg);
                    return 2;
                }
                request.part_index = static_cast<std::uint32_t>(v);
                break;
            }

            case 's': {
                std::uint64_t v = 0;
                if (!ParseU64(optarg, v)) {
                    std::fprintf(stderr, "Invalid --chunk-size: %s\n", optarg);
                    return 2;
                }
                chunk_cli = v;
                break;
            }

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (mode == Mode::None) {
        PrintUsage(argv[0]);
        return 2;
    }

    if (mode == Mode::Inspect) return InspectArchive(inspect_path);

    zipline::DownloadConfig cfg;
    {
        const bool explicit_cfg = !config_path.empty();
        const std::string path = explicit_cfg ? config_path : kDefaultConfigPath;
        auto r = zipline::DownloadConfig::LoadFromFile(path, cfg);
        if (!r.is_ok()) {
            if (explicit_cfg) {
                std::fprintf(stderr, "ERROR: %s\n", r.message().c_str());
                return 1;
            }
            cfg = zipline::DownloadConfig{};
        }
    }
    if (root_cli) cfg.storage_root = *root_cli;
    if (secret_cli) cfg.ticket_secret = *secret_cli;
    if (chunk_cli) cfg.chunk_size_mb = *chunk_cli;
    if (multipart_cli) cfg.mode = zipline::DownloadMode::Multipart;
    if (verbose) cfg.log_level = zipline::LogLevel::Debug;
    if (auto r = cfg.Validate(); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.message().c_str());
        return 2;
    }
    zipline::Logger::Instance().SetLevel(cfg.log_level);

    if (!folder_id.empty() && !filter.empty()) {
        std::fprintf(stderr, "--folder and --filter are exclusive\n");
        return 2;
    }
    if (!folder_id.empty()) {
        request.target.kind = zipline::DownloadKind::Folder;
        request.target.folder_id = folder_id;
    } else if (!filter.empty()) {
        auto kind = zipline::ParseDownloadKind(filter);
        if (!kind || (*kind != zipline::DownloadKind::Liked && *kind != zipline::DownloadKind::Favorited)) {
            std::fprintf(stderr, "Invalid --filter: %s\n", filter.c_str());
            return 2;
        }
        request.target.kind = *kind;
    }

    if (mode == Mode::FetchUrl) {
        if (url.find("/download/part") != std::string::npos) {
            auto link = zipline::ParsePartUrl(url);
            if (!link) {
                std::fprintf(stderr, "ERROR: %s\n", link.error().c_str());
                return 2;
            }
            request.target = link->target;
            request.part_index = link->part_index;
            request.ticket = link->ticket;
        } else {
            auto token = zipline::ParseTicketUrl(url);
            if (!token) {
                std::fprintf(stderr, "ERROR: %s\n", token.error().c_str());
                return 2;
            }
            request.ticket = *token;
        }
    } else if (request.target.gallery_id.empty()) {
        std::fprintf(stderr, "--gallery is required\n");
        return 2;
    }

    if (catalog_path.empty()) {
        std::fprintf(stderr, "--catalog is required\n");
        return 2;
    }
    zipline::JsonCatalog catalog;
    if (auto r = zipline::JsonCatalog::LoadFromFile(catalog_path, catalog); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.message().c_str());
        return 1;
    }

    zipline::LocalObjectStorage storage(cfg.storage_root);
    zipline::ProgressStore store(zipline::ProgressStore::Options{
        .retention = cfg.progress_retention,
        .sweep_interval = cfg.progress_sweep_interval,
    });
    zipline::TicketCodec tickets(zipline::TicketCodec::Options{
        .secret = cfg.ticket_secret,
        .ttl = cfg.ticket_ttl,
    });

    zipline::ConsoleProgressSink console;
    auto opt = zipline::DownloadOrchestrator::OptionsFromConfig(cfg);
    if (progress) opt.builder.progress = &console;

    zipline::DownloadOrchestrator orchestrator(catalog, catalog, storage, store, tickets, opt);

    if (mode == Mode::IssueTicket) {
        std::string ticket_url;
        auto r = orchestrator.IssueTicketUrl(request.target, request.requester, request.credential, ticket_url);
        if (!r.is_ok()) {
            std::fprintf(stderr, "ERROR: %s (%s)\n", r.message().c_str(), zipline::ErrorCodeName(r.code()));
            return 1;
        }
        std::printf("%s\n", ticket_url.c_str());
        return 0;
    }

    zipline::FileResponseSink sink(out_cli);
    zipline::DownloadOutcome outcome;
    auto r = orchestrator.HandleDownload(request, sink, cancel, outcome);
    zipline::ClearProgressLine();

    if (!sink.JsonBody().empty()) {
        std::printf("%s\n", sink.JsonBody().c_str());
    }

    if (show_record && !outcome.download_id.empty()) {
        zipline::ProgressRecord rec;
        if (orchestrator.GetProgress(outcome.download_id, rec).is_ok()) {
            std::fprintf(stderr, "%s\n", zipline::ProgressJson(rec).dump(2).c_str());
        }
    }

    if (!r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s (%s, HTTP %d)\n", r.message().c_str(), zipline::ErrorCodeName(r.code()),
                     zipline::HttpStatusFor(r.code()));
        return 1;
    }

    if (outcome.kind == zipline::DownloadOutcome::Kind::Streamed) {
        LogInfo("%s: %zu of %zu objects archived, %llu bytes", outcome.filename.c_str(), outcome.stats.archived,
                outcome.stats.requested, static_cast<unsigned long long>(outcome.stats.bytes_written));
    }
    return 0;
}
