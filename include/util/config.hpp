#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace zipline {

enum class DownloadMode { Single, Multipart };

const char* DownloadModeName(DownloadMode mode);
std::optional<DownloadMode> ParseDownloadMode(std::string_view name);

// Service settings. Every field has a usable default; a config file only
// needs to name what it changes.
struct DownloadConfig {
    static constexpr std::uint64_t kMinChunkSizeMb = 1;
    static constexpr std::uint64_t kMaxChunkSizeMb = 10000;
    static constexpr std::chrono::seconds kMaxTimeout{24 * 60 * 60};
    static constexpr std::chrono::seconds kMaxRetention{30 * 24 * 60 * 60};

    DownloadMode mode = DownloadMode::Single;
    std::uint64_t chunk_size_mb = 2000;

    std::string ticket_secret;
    std::chrono::seconds ticket_ttl{300};

    std::chrono::seconds progress_retention{1800};
    std::chrono::seconds progress_sweep_interval{300};
    std::chrono::seconds progress_cleanup_delay{300};

    std::chrono::seconds fetch_timeout{30};
    std::string storage_root = ".";

    std::string api_base_path = "/api/photos";
    LogLevel log_level = LogLevel::Info;

    bool multipart_enabled() const { return mode == DownloadMode::Multipart; }
    std::uint64_t chunk_size_bytes() const { return chunk_size_mb * 1024ULL * 1024ULL; }

    // Range and consistency checks; ConfigError on the first violation.
    Result Validate() const;

    // Starts from defaults, overlays the file, then validates.
    static Result LoadFromFile(const std::string& path, DownloadConfig& out);
};

} // namespace zipline
