#include "download/partitioner.hpp"

#include <utility>

namespace zipline {

namespace {

void ClosePart(std::vector<ArchivePart>& parts,
               DownloadTarget& chunk,
               std::uint64_t& chunk_size,
               const std::string& base_name) {
    ArchivePart part;
    part.index = static_cast<std::uint32_t>(parts.size() + 1);
    part.filename = base_name + "_part" + std::to_string(part.index) + ".zip";
    part.objects = std::move(chunk);
    part.size = chunk_size;
    parts.push_back(std::move(part));

    chunk.clear();
    chunk_size = 0;
}

} // namespace

std::vector<ArchivePart> Partitioner::Split(const DownloadTarget& target,
                                            std::uint64_t threshold_bytes,
                                            const std::string& base_name) {
    std::vector<ArchivePart> parts;
    DownloadTarget chunk;
    std::uint64_t chunk_size = 0;

    for (const auto& object : target) {
        // The non-empty check lets an oversized object open its own part
        // instead of emitting an empty one first.
        if (!chunk.empty() && chunk_size + object.size > threshold_bytes) {
            ClosePart(parts, chunk, chunk_size, base_name);
        }
        chunk.push_back(object);
        chunk_size += object.size;
    }
    if (!chunk.empty()) {
        ClosePart(parts, chunk, chunk_size, base_name);
    }
    return parts;
}

Result Partitioner::FindPart(const std::vector<ArchivePart>& parts,
                             std::uint32_t index,
                             const ArchivePart*& out) {
    out = nullptr;
    if (index == 0 || index > parts.size()) {
        return Result::Fail(ErrorCode::PartNotFound,
                            "Part " + std::to_string(index) + " not found (" +
                                std::to_string(parts.size()) + " part(s) available)");
    }
    out = &parts[index - 1];
    return Result::Ok();
}

} // namespace zipline
