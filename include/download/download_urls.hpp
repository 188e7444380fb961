#pragma once

#include "download/types.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace zipline {

// What a part link carries back to the transport.
struct PartLink {
    TargetSelector target;
    std::uint32_t part_index = 0;
    std::string ticket;  // empty for credential-based requests
};

// <base>/download/part?galleryId=..&partIndex=..[&folderId=..][&filter=liked|favorited][&ticket=..]
std::string BuildPartUrl(std::string_view base_path, const TargetSelector& target,
                         std::uint32_t part_index, std::string_view ticket);

// <base>/download-zip?ticket=<token>
std::string BuildTicketUrl(std::string_view base_path, std::string_view token);

std::expected<PartLink, std::string> ParsePartUrl(std::string_view url);

// Accepts a ticket URL or a bare token.
std::expected<std::string, std::string> ParseTicketUrl(std::string_view url);

} // namespace zipline
