#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace zipline {

// Turns a display name into a safe relative archive entry name:
// - backslashes become "/"
// - leading "./" and "/" are stripped, duplicate slashes collapsed
// - "." and ".." segments are dropped
// An empty result becomes "file".
std::string NormalizeEntryName(std::string_view raw);

// Normalizes every name and renames repeats to "name (2).ext", "name (3).ext", ...
// The first occurrence keeps its name. Order is preserved.
void MakeUniqueEntryNames(std::vector<std::string>& names);

} // namespace zipline
