#include "download/download_urls.hpp"

#include "util/url_codec.hpp"

#include <charconv>
#include <utility>
#include <vector>

namespace zipline {

namespace {

constexpr std::string_view kPartPath = "/download/part";
constexpr std::string_view kTicketPath = "/download-zip";

std::string JoinBase(std::string_view base, std::string_view path) {
    while (!base.empty() && base.back() == '/') base.remove_suffix(1);
    return std::string(base) + std::string(path);
}

void AddParam(std::string& url, bool& first, std::string_view key, std::string_view value) {
    url.push_back(first ? '?' : '&');
    first = false;
    url.append(key);
    url.push_back('=');
    url += PercentEncode(value);
}

using QueryParams = std::vector<std::pair<std::string, std::string>>;

std::expected<QueryParams, std::string> ParseQuery(std::string_view query) {
    QueryParams out;
    while (!query.empty()) {
        const auto amp = query.find('&');
        const auto item = query.substr(0, amp);
        if (!item.empty()) {
            const auto eq = item.find('=');
            auto key = PercentDecode(item.substr(0, eq), true);
            auto value = PercentDecode(eq == std::string_view::npos ? std::string_view{} : item.substr(eq + 1), true);
            if (!key || !value) return std::unexpected("malformed escape in query string");
            out.emplace_back(std::move(*key), std::move(*value));
        }
        if (amp == std::string_view::npos) break;
        query.remove_prefix(amp + 1);
    }
    return out;
}

const std::string* FindParam(const QueryParams& params, std::string_view key) {
    for (const auto& [k, v] : params) {
        if (k == key) return &v;
    }
    return nullptr;
}

void SplitUrl(std::string_view url, std::string_view& path, std::string_view& query) {
    url = url.substr(0, url.find('#'));
    const auto q = url.find('?');
    path = url.substr(0, q);
    query = q == std::string_view::npos ? std::string_view{} : url.substr(q + 1);
}

bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::string BuildPartUrl(std::string_view base_path, const TargetSelector& target,
                         std::uint32_t part_index, std::string_view ticket) {
    std::string url = JoinBase(base_path, kPartPath);
    bool first = true;
    AddParam(url, first, "galleryId", target.gallery_id);
    AddParam(url, first, "partIndex", std::to_string(part_index));
    if (target.kind == DownloadKind::Folder) {
        AddParam(url, first, "folderId", target.folder_id);
    } else if (target.kind == DownloadKind::Liked || target.kind == DownloadKind::Favorited) {
        AddParam(url, first, "filter", DownloadKindName(target.kind));
    }
    if (!ticket.empty()) AddParam(url, first, "ticket", ticket);
    return url;
}

std::string BuildTicketUrl(std::string_view base_path, std::string_view token) {
    std::string url = JoinBase(base_path, kTicketPath);
    bool first = true;
    AddParam(url, first, "ticket", token);
    return url;
}

std::expected<PartLink, std::string> ParsePartUrl(std::string_view url) {
    std::string_view path;
    std::string_view query;
    SplitUrl(url, path, query);

    if (!EndsWith(path, kPartPath)) {
        return std::unexpected("not a part download URL: " + std::string(path));
    }

    auto params = ParseQuery(query);
    if (!params) return std::unexpected(params.error());

    PartLink link;

    const auto* gallery = FindParam(*params, "galleryId");
    if (!gallery || gallery->empty()) return std::unexpected("missing galleryId");
    link.target.gallery_id = *gallery;

    const auto* index = FindParam(*params, "partIndex");
    if (!index || index->empty()) return std::unexpected("missing partIndex");
    {
        const char* b = index->data();
        const char* e = b + index->size();
        auto [p, ec] = std::from_chars(b, e, link.part_index);
        if (ec != std::errc() || p != e) return std::unexpected("partIndex is not a number: " + *index);
    }

    const auto* folder = FindParam(*params, "folderId");
    const auto* filter = FindParam(*params, "filter");
    if (folder && !folder->empty()) {
        if (filter && !filter->empty()) return std::unexpected("folderId and filter are exclusive");
        link.target.kind = DownloadKind::Folder;
        link.target.folder_id = *folder;
    } else if (filter && !filter->empty()) {
        auto kind = ParseDownloadKind(*filter);
        if (!kind || (*kind != DownloadKind::Liked && *kind != DownloadKind::Favorited)) {
            return std::unexpected("unknown filter: " + *filter);
        }
        link.target.kind = *kind;
    }

    if (const auto* ticket = FindParam(*params, "ticket")) link.ticket = *ticket;
    return link;
}

std::expected<std::string, std::string> ParseTicketUrl(std::string_view url) {
    std::string_view path;
    std::string_view query;
    SplitUrl(url, path, query);

    if (url.find('?') == std::string_view::npos && url.find('/') == std::string_view::npos) {
        if (url.empty()) return std::unexpected("empty ticket");
        return std::string(url);
    }

    auto params = ParseQuery(query);
    if (!params) return std::unexpected(params.error());
    const auto* ticket = FindParam(*params, "ticket");
    if (!ticket || ticket->empty()) return std::unexpected("URL carries no ticket");
    return *ticket;
}

} // namespace zipline
