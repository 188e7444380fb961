#pragma once

#include "download/types.hpp"

#include <cstdint>
#include <optional>

namespace zipline {

// Byte length of the stored-mode archive ZipStreamWriter produces for these
// objects: 22 + sum(size + 92 + 2 * name bytes).
std::uint64_t StoredZipSizeFormula(const DownloadTarget& objects);

// As above, but nullopt whenever the archive needs ZIP64 records; the
// transport must then stream without a declared length.
std::optional<std::uint64_t> ExactStoredZipSize(const DownloadTarget& objects);

} // namespace zipline
