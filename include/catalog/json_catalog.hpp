#pragma once

#include "download/collaborators.hpp"
#include "download/types.hpp"
#include "util/clock.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace zipline {

struct CatalogPhoto {
    std::string id;
    std::string filename;
    std::string storage_ref;  // "originalUrl", or "storageKey" when no URL is given
    std::uint64_t size = 0;
    std::string folder_id;
    std::vector<std::string> liked_by;
    std::vector<std::string> favorited_by;
};

struct CatalogFolder {
    std::string id;
    std::string name;
};

struct CatalogGallery {
    std::string id;
    std::string title;
    std::string owner;
    std::string password;  // empty: no password access
    bool is_public = false;
    std::vector<std::string> allowed_users;
    std::optional<TimePoint> expires_at;
    std::vector<CatalogFolder> folders;
    std::vector<CatalogPhoto> photos;
};

// Gallery catalog read from a JSON document:
//
//   {"galleries": [{"id", "title", "ownerId", "password", "isPublic",
//                   "allowedUsers": [...], "expiresAt",
//                   "folders": [{"id", "name"}],
//                   "photos": [{"id", "filename", "fileSize", "originalUrl" | "storageKey",
//                               "folderId", "likedBy": [...], "favoritedBy": [...]}]}]}
//
// "expiresAt" is unix seconds or an ISO 8601 UTC string.
class JsonCatalog final : public ITargetResolver, public IAuthorizer {
  public:
    static std::expected<JsonCatalog, std::string> Parse(const std::string& json_input);
    static Result LoadFromFile(const std::string& path, JsonCatalog& out);

    Result Resolve(const TargetSelector& target,
                   const std::string& requester,
                   ResolvedTarget& out) const override;

    // Owner, listed users, public galleries and the gallery password grant
    // access. Unknown galleries are let through so they resolve to NotFound.
    bool IsAuthorized(const TargetSelector& target,
                      const std::string& requester,
                      const std::string& credential) const override;

    const CatalogGallery* FindGallery(const std::string& id) const;
    const std::vector<CatalogGallery>& Galleries() const { return galleries_; }

  private:
    std::vector<CatalogGallery> galleries_;
};

std::optional<TimePoint> ParseIsoTime(const std::string& s);

} // namespace zipline
