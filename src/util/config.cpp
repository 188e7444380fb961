#include "util/config.hpp"

#include "util/config_json_utils.hpp"

namespace zipline {

namespace {

Result CheckSeconds(const char* key, std::chrono::seconds v, std::chrono::seconds::rep min,
                    std::chrono::seconds max) {
    if (v.count() < min || v > max) {
        return Result::Fail(ErrorCode::ConfigError, std::string(key) + " must be within " + std::to_string(min) +
                                                        ".." + std::to_string(max.count()) + " seconds");
    }
    return Result::Ok();
}

} // namespace

const char* DownloadModeName(DownloadMode mode) {
    return mode == DownloadMode::Multipart ? "multipart" : "single";
}

std::optional<DownloadMode> ParseDownloadMode(std::string_view name) {
    if (name == "single") return DownloadMode::Single;
    if (name == "multipart") return DownloadMode::Multipart;
    return std::nullopt;
}

Result DownloadConfig::Validate() const {
    if (chunk_size_mb < kMinChunkSizeMb || chunk_size_mb > kMaxChunkSizeMb) {
        return Result::Fail(ErrorCode::ConfigError,
                            "download.chunkSize must be within " + std::to_string(kMinChunkSizeMb) + ".." +
                                std::to_string(kMaxChunkSizeMb) + " MB");
    }
    auto r = CheckSeconds("ticket.ttlSeconds", ticket_ttl, 1, kMaxTimeout);
    if (!r.is_ok()) return r;
    r = CheckSeconds("progress.retentionSeconds", progress_retention, 1, kMaxRetention);
    if (!r.is_ok()) return r;
    r = CheckSeconds("progress.sweepIntervalSeconds", progress_sweep_interval, 1, kMaxTimeout);
    if (!r.is_ok()) return r;
    r = CheckSeconds("progress.cleanupDelaySeconds", progress_cleanup_delay, 0, kMaxRetention);
    if (!r.is_ok()) return r;
    r = CheckSeconds("storage.fetchTimeoutSeconds", fetch_timeout, 1, kMaxTimeout);
    if (!r.is_ok()) return r;
    if (storage_root.empty()) {
        return Result::Fail(ErrorCode::ConfigError, "storage.root must not be empty");
    }
    if (api_base_path.empty()) {
        return Result::Fail(ErrorCode::ConfigError, "api.basePath must not be empty");
    }
    return Result::Ok();
}

Result DownloadConfig::LoadFromFile(const std::string& path, DownloadConfig& out) {
    out = DownloadConfig{};

    nlohmann::json json;
    std::string err;
    if (!config::detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorCode::ConfigError, err);
    }
    if (!config::detail::FillConfigFromJson(json, out, err)) {
        return Result::Fail(ErrorCode::ConfigError, err + " in " + path);
    }

    auto r = out.Validate();
    if (!r.is_ok()) return Result::Fail(ErrorCode::ConfigError, r.message() + " in " + path);
    return Result::Ok();
}

} // namespace zipline
