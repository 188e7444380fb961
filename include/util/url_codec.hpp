#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace zipline {

// RFC 3986 unreserved characters pass through; everything else is %XX.
std::string PercentEncode(std::string_view s);

// Decodes %XX escapes; with plus_as_space "+" becomes " " (query strings).
// Returns nullopt on a truncated or non-hex escape.
std::optional<std::string> PercentDecode(std::string_view s, bool plus_as_space = false);

} // namespace zipline
