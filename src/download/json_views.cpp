#include "download/json_views.hpp"

#include "download/download_urls.hpp"

#include <cstdio>
#include <ctime>

namespace zipline {

std::string FormatIsoTime(TimePoint tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        --secs;
    }

    std::tm tm{};
    gmtime_r(&secs, &tm);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900, tm.tm_mon + 1,
                  tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buf;
}

nlohmann::json ProgressJson(const ProgressRecord& record) {
    nlohmann::json p = {
        {"downloadId", record.id},
        {"status", ProgressStatusName(record.status)},
        {"progress", record.percent},
        {"totalPhotos", record.total},
        {"processedPhotos", record.processed},
        {"filename", record.filename},
        {"failedFiles", record.failed_entries},
        {"createdAt", FormatIsoTime(record.created_at)},
        {"updatedAt", FormatIsoTime(record.updated_at)},
    };
    if (record.error) p["error"] = *record.error;
    return {{"success", true}, {"progress", std::move(p)}};
}

nlohmann::json ManifestJson(const std::vector<ArchivePart>& parts,
                            std::string_view base_path,
                            const TargetSelector& target,
                            std::string_view ticket) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& part : parts) {
        arr.push_back({
            {"part", part.index},
            {"filename", part.filename},
            {"size", part.size},
            {"count", part.count()},
            {"downloadUrl", BuildPartUrl(base_path, target, part.index, ticket)},
        });
    }
    return {{"multipart", true}, {"parts", std::move(arr)}};
}

nlohmann::json ErrorJson(ErrorCode code, const std::string& message) {
    return {{"success", false}, {"error", message}, {"code", ErrorCodeName(code)}};
}

} // namespace zipline
