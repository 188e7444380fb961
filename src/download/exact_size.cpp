#include "download/exact_size.hpp"

#include "archive/zip_format.hpp"

namespace zipline {

std::uint64_t StoredZipSizeFormula(const DownloadTarget& objects) {
    std::uint64_t total = zip::kEndOfCentralDirSize;
    for (const auto& o : objects) {
        total += o.size + zip::kStoredEntryOverhead + 2 * static_cast<std::uint64_t>(o.name.size());
    }
    return total;
}

std::optional<std::uint64_t> ExactStoredZipSize(const DownloadTarget& objects) {
    if (objects.size() >= zip::kMax16) return std::nullopt;

    std::uint64_t offset = 0;
    std::uint64_t central = 0;
    for (const auto& o : objects) {
        if (o.size >= zip::kMax32 || offset >= zip::kMax32) return std::nullopt;
        // ZipStreamWriter refuses such names, so the entry would be skipped.
        if (o.name.size() >= zip::kMax16) return std::nullopt;
        offset += zip::kLocalHeaderSize + o.name.size() + o.size + zip::kDataDescriptorSize;
        central += zip::kCentralHeaderSize + o.name.size();
    }
    if (offset >= zip::kMax32 || central >= zip::kMax32) return std::nullopt;

    return offset + central + zip::kEndOfCentralDirSize;
}

} // namespace zipline
