#include "catalog/json_catalog.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string_view>

namespace zipline {

using json = nlohmann::json;

namespace {

bool Contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

std::expected<std::vector<std::string>, std::string> ParseStringArray(const json& j, const char* key,
                                                                       const std::string& where) {
    std::vector<std::string> out;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return out;
    if (!it->is_array()) return std::unexpected(where + ": '" + key + "' must be an array");
    for (const auto& item : *it) {
        if (!item.is_string()) return std::unexpected(where + ": '" + key + "' must hold strings");
        out.push_back(item.get<std::string>());
    }
    return out;
}

std::string IdOf(const json& item) {
    auto it = item.find("id");
    if (it == item.end()) return {};
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<long long>());
    return {};
}

std::expected<CatalogPhoto, std::string> ParsePhoto(const json& item, const std::string& gallery_id) {
    if (!item.is_object()) return std::unexpected("gallery " + gallery_id + ": photo must be an object");

    CatalogPhoto p;
    p.id = IdOf(item);
    if (p.id.empty()) return std::unexpected("gallery " + gallery_id + ": photo without id");
    const std::string where = "photo " + p.id;

    p.filename = item.value("filename", "");
    if (p.filename.empty()) p.filename = p.id;
    p.storage_ref = item.value("originalUrl", "");
    if (p.storage_ref.empty()) p.storage_ref = item.value("storageKey", "");
    if (p.storage_ref.empty()) return std::unexpected(where + ": needs originalUrl or storageKey");

    auto size = item.find("fileSize");
    if (size != item.end() && !size->is_null()) {
        if (!size->is_number_integer() || size->get<long long>() < 0) {
            return std::unexpected(where + ": fileSize must be a non-negative integer");
        }
        p.size = size->get<std::uint64_t>();
    }
    auto folder = item.find("folderId");
    if (folder != item.end() && folder->is_string()) p.folder_id = folder->get<std::string>();

    auto liked = ParseStringArray(item, "likedBy", where);
    if (!liked) return std::unexpected(liked.error());
    p.liked_by = std::move(*liked);

    auto fav = ParseStringArray(item, "favoritedBy", where);
    if (!fav) return std::unexpected(fav.error());
    p.favorited_by = std::move(*fav);

    return p;
}

std::expected<CatalogGallery, std::string> ParseGallery(const json& item) {
    if (!item.is_object()) return std::unexpected("gallery must be an object");

    CatalogGallery g;
    g.id = IdOf(item);
    if (g.id.empty()) return std::unexpected("gallery without id");
    const std::string where = "gallery " + g.id;

    g.title = item.value("title", "");
    g.owner = item.value("ownerId", "");
    g.password = item.value("password", "");
    g.is_public = item.value("isPublic", false);

    auto allowed = ParseStringArray(item, "allowedUsers", where);
    if (!allowed) return std::unexpected(allowed.error());
    g.allowed_users = std::move(*allowed);

    auto exp = item.find("expiresAt");
    if (exp != item.end() && !exp->is_null()) {
        if (exp->is_number_integer()) {
            g.expires_at = FromUnixSeconds(exp->get<std::int64_t>());
        } else if (exp->is_string()) {
            g.expires_at = ParseIsoTime(exp->get<std::string>());
            if (!g.expires_at) return std::unexpected(where + ": unreadable expiresAt");
        } else {
            return std::unexpected(where + ": expiresAt must be a number or a string");
        }
    }

    auto folders = item.find("folders");
    if (folders != item.end() && !folders->is_null()) {
        if (!folders->is_array()) return std::unexpected(where + ": 'folders' must be an array");
        for (const auto& f : *folders) {
            CatalogFolder folder;
            folder.id = IdOf(f);
            if (folder.id.empty()) return std::unexpected(where + ": folder without id");
            folder.name = f.value("name", "");
            g.folders.push_back(std::move(folder));
        }
    }

    auto photos = item.find("photos");
    if (photos != item.end() && !photos->is_null()) {
        if (!photos->is_array()) return std::unexpected(where + ": 'photos' must be an array");
        for (const auto& p : *photos) {
            auto parsed = ParsePhoto(p, g.id);
            if (!parsed) return std::unexpected(parsed.error());
            g.photos.push_back(std::move(*parsed));
        }
    }

    return g;
}

} // namespace

std::optional<TimePoint> ParseIsoTime(const std::string& s) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &y, &mo, &d, &h, &mi, &sec, &consumed) != 6) {
        if (std::sscanf(s.c_str(), "%4d-%2d-%2d%n", &y, &mo, &d, &consumed) != 3) return std::nullopt;
    }
    std::string_view rest(s.c_str() + consumed);
    if (!rest.empty() && rest.front() == '.') {
        rest.remove_prefix(1);
        while (!rest.empty() && rest.front() >= '0' && rest.front() <= '9') rest.remove_prefix(1);
    }
    if (!rest.empty() && rest != "Z" && rest != "+00:00") return std::nullopt;
    if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || sec > 60) return std::nullopt;

    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon = mo - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min = mi;
    tm.tm_sec = sec;
    return FromUnixSeconds(static_cast<std::int64_t>(timegm(&tm)));
}

std::expected<JsonCatalog, std::string> JsonCatalog::Parse(const std::string& json_input) {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) return std::unexpected("JSON root must be an object");

        JsonCatalog c;
        auto galleries = j.find("galleries");
        if (galleries == j.end() || !galleries->is_array()) {
            return std::unexpected("'galleries' must be an array");
        }
        for (const auto& item : *galleries) {
            auto g = ParseGallery(item);
            if (!g) return std::unexpected(g.error());
            if (c.FindGallery(g->id)) return std::unexpected("duplicate gallery id " + g->id);
            c.galleries_.push_back(std::move(*g));
        }
        return c;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

Result JsonCatalog::LoadFromFile(const std::string& path, JsonCatalog& out) {
    std::ifstream is(path);
    if (!is.good()) return Result::Fail(ErrorCode::IoError, "cannot open catalog: " + path);

    std::ostringstream ss;
    ss << is.rdbuf();

    auto parsed = Parse(ss.str());
    if (!parsed) return Result::Fail(ErrorCode::ConfigError, path + ": " + parsed.error());
    out = std::move(*parsed);

    LogDebug("catalog %s: %zu galleries", path.c_str(), out.galleries_.size());
    return Result::Ok();
}

const CatalogGallery* JsonCatalog::FindGallery(const std::string& id) const {
    for (const auto& g : galleries_) {
        if (g.id == id) return &g;
    }
    return nullptr;
}

Result JsonCatalog::Resolve(const TargetSelector& target,
                            const std::string& requester,
                            ResolvedTarget& out) const {
    out = ResolvedTarget{};

    const auto* g = FindGallery(target.gallery_id);
    if (!g) return Result::Fail(ErrorCode::NotFound, "Gallery not found");

    out.gallery_title = g->title;
    out.expires_at = g->expires_at;

    if (target.kind == DownloadKind::Folder) {
        auto it = std::find_if(g->folders.begin(), g->folders.end(),
                               [&](const CatalogFolder& f) { return f.id == target.folder_id; });
        if (it == g->folders.end()) return Result::Fail(ErrorCode::NotFound, "Folder not found");
        out.folder_name = it->name;
    }

    for (const auto& p : g->photos) {
        bool take = false;
        switch (target.kind) {
            case DownloadKind::All:       take = true; break;
            case DownloadKind::Folder:    take = p.folder_id == target.folder_id; break;
            case DownloadKind::Liked:     take = Contains(p.liked_by, requester); break;
            case DownloadKind::Favorited: take = Contains(p.favorited_by, requester); break;
        }
        if (take) {
            out.objects.push_back(ObjectRef{
                .id = p.id,
                .name = p.filename,
                .storage_ref = p.storage_ref,
                .size = p.size,
            });
        }
    }
    return Result::Ok();
}

bool JsonCatalog::IsAuthorized(const TargetSelector& target,
                               const std::string& requester,
                               const std::string& credential) const {
    const auto* g = FindGallery(target.gallery_id);
    if (!g) return true;

    if (g->is_public) return true;
    if (!requester.empty() && (requester == g->owner || Contains(g->allowed_users, requester))) return true;
    if (!g->password.empty() && credential == g->password) return true;
    return false;
}

} // namespace zipline
