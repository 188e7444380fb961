#pragma once

#include "util/clock.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zipline {

// One stored object of a download.
struct ObjectRef {
    std::string id;
    std::string name;         // archive entry name
    std::string storage_ref;  // opaque to the core, understood by IObjectStorage
    std::uint64_t size = 0;
};

// Ordered ascending by id; see SortTarget().
using DownloadTarget = std::vector<ObjectRef>;

void SortTarget(DownloadTarget& target);
std::uint64_t TotalSize(const DownloadTarget& target);

enum class DownloadKind { All, Folder, Liked, Favorited };

const char* DownloadKindName(DownloadKind kind);
std::optional<DownloadKind> ParseDownloadKind(std::string_view name);

struct TargetSelector {
    std::string gallery_id;
    DownloadKind kind = DownloadKind::All;
    std::string folder_id;  // DownloadKind::Folder only

    bool operator==(const TargetSelector&) const = default;
};

struct ArchivePart {
    std::uint32_t index = 0;  // 1-based
    std::string filename;
    DownloadTarget objects;
    std::uint64_t size = 0;

    std::size_t count() const { return objects.size(); }
};

struct DownloadStrategy {
    enum class Kind { DirectStream, MultipartManifest };

    Kind kind = Kind::DirectStream;
    std::uint64_t total_size = 0;
    std::uint64_t chunk_size = 0;
    std::uint64_t estimated_parts = 1;
};

const char* StrategyName(DownloadStrategy::Kind kind);

enum class ProgressStatus { Preparing, Processing, Ready, Error };

const char* ProgressStatusName(ProgressStatus status);

struct ProgressRecord {
    std::string id;
    ProgressStatus status = ProgressStatus::Preparing;
    std::uint64_t total = 0;
    std::uint64_t processed = 0;
    int percent = 0;
    std::string filename;
    std::optional<std::string> error;
    std::vector<std::string> failed_entries;
    TimePoint created_at{};
    TimePoint updated_at{};
    std::optional<TimePoint> remove_at;
};

} // namespace zipline
