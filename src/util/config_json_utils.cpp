#include "util/config_json_utils.hpp"

#include <fstream>

namespace zipline::config::detail {

namespace {

const nlohmann::json* Find(const nlohmann::json& j, const char* section, const char* key) {
    auto sec = j.find(section);
    if (sec != j.end() && sec->is_object()) {
        auto it = sec->find(key);
        if (it != sec->end()) return &*it;
    }
    auto flat = j.find(std::string(section) + "." + key);
    if (flat != j.end()) return &*flat;
    return nullptr;
}

std::string KeyName(const char* section, const char* key) {
    return std::string(section) + "." + key;
}

// Absent keys return true and leave `out` alone; present keys of the wrong type fail.
bool GetStringIfPresent(const nlohmann::json& j, const char* section, const char* key,
                        std::string& out, std::string& err) {
    const auto* v = Find(j, section, key);
    if (!v) return true;
    if (!v->is_string()) {
        err = KeyName(section, key) + " must be a string";
        return false;
    }
    out = v->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* section, const char* key,
                     std::uint64_t& out, std::string& err) {
    const auto* v = Find(j, section, key);
    if (!v) return true;
    if (!(v->is_number_unsigned() || v->is_number_integer())) {
        err = KeyName(section, key) + " must be an integer";
        return false;
    }
    auto n = v->get<long long>();
    if (n < 0) {
        err = KeyName(section, key) + " must not be negative";
        return false;
    }
    out = static_cast<std::uint64_t>(n);
    return true;
}

bool GetSecondsIfPresent(const nlohmann::json& j, const char* section, const char* key,
                         std::chrono::seconds& out, std::string& err) {
    std::uint64_t v = static_cast<std::uint64_t>(out.count());
    if (!GetU64IfPresent(j, section, key, v, err)) return false;
    out = std::chrono::seconds(static_cast<std::chrono::seconds::rep>(v));
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, DownloadConfig& cfg, std::string& err) {
    {
        std::string mode;
        if (!GetStringIfPresent(j, "download", "mode", mode, err)) return false;
        if (!mode.empty()) {
            auto m = ParseDownloadMode(mode);
            if (!m) {
                err = "download.mode must be 'single' or 'multipart', got '" + mode + "'";
                return false;
            }
            cfg.mode = *m;
        }
    }
    if (!GetU64IfPresent(j, "download", "chunkSize", cfg.chunk_size_mb, err)) return false;

    if (!GetStringIfPresent(j, "ticket", "secret", cfg.ticket_secret, err)) return false;
    if (!GetSecondsIfPresent(j, "ticket", "ttlSeconds", cfg.ticket_ttl, err)) return false;

    if (!GetSecondsIfPresent(j, "progress", "retentionSeconds", cfg.progress_retention, err)) return false;
    if (!GetSecondsIfPresent(j, "progress", "sweepIntervalSeconds", cfg.progress_sweep_interval, err)) {
        return false;
    }
    if (!GetSecondsIfPresent(j, "progress", "cleanupDelaySeconds", cfg.progress_cleanup_delay, err)) {
        return false;
    }

    if (!GetSecondsIfPresent(j, "storage", "fetchTimeoutSeconds", cfg.fetch_timeout, err)) return false;
    if (!GetStringIfPresent(j, "storage", "root", cfg.storage_root, err)) return false;

    if (!GetStringIfPresent(j, "api", "basePath", cfg.api_base_path, err)) return false;

    {
        std::string level;
        if (!GetStringIfPresent(j, "log", "level", level, err)) return false;
        if (!level.empty()) {
            auto lvl = ParseLogLevel(level);
            if (!lvl) {
                err = "log.level is not a known level: '" + level + "'";
                return false;
            }
            cfg.log_level = *lvl;
        }
    }

    return true;
}

} // namespace zipline::config::detail
