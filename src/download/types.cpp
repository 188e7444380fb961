#include "download/types.hpp"

#include <algorithm>

namespace zipline {

void SortTarget(DownloadTarget& target) {
    std::stable_sort(target.begin(), target.end(), [](const ObjectRef& a, const ObjectRef& b) {
        return a.id < b.id;
    });
}

std::uint64_t TotalSize(const DownloadTarget& target) {
    std::uint64_t total = 0;
    for (const auto& o : target) total += o.size;
    return total;
}

const char* DownloadKindName(DownloadKind kind) {
    switch (kind) {
        case DownloadKind::All:       return "all";
        case DownloadKind::Folder:    return "folder";
        case DownloadKind::Liked:     return "liked";
        case DownloadKind::Favorited: return "favorited";
    }
    return "all";
}

std::optional<DownloadKind> ParseDownloadKind(std::string_view name) {
    if (name == "all") return DownloadKind::All;
    if (name == "folder") return DownloadKind::Folder;
    if (name == "liked") return DownloadKind::Liked;
    if (name == "favorited") return DownloadKind::Favorited;
    return std::nullopt;
}

const char* StrategyName(DownloadStrategy::Kind kind) {
    return kind == DownloadStrategy::Kind::MultipartManifest ? "MULTIPART_MANIFEST" : "DIRECT_STREAM";
}

const char* ProgressStatusName(ProgressStatus status) {
    switch (status) {
        case ProgressStatus::Preparing:  return "preparing";
        case ProgressStatus::Processing: return "processing";
        case ProgressStatus::Ready:      return "ready";
        case ProgressStatus::Error:      return "error";
    }
    return "error";
}

} // namespace zipline
