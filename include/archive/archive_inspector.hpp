#pragma once

#include "util/result.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace zipline {

struct ArchiveEntryInfo {
    std::string name;
    std::uint64_t size = 0;
};

// Read-side view of a produced archive, backed by libarchive. Opening from a
// file or memory lets libarchive use the seekable ZIP reader (central
// directory first).
class ArchiveInspector {
public:
    ArchiveInspector() = default;
    ~ArchiveInspector();

    ArchiveInspector(const ArchiveInspector&) = delete;
    ArchiveInspector& operator=(const ArchiveInspector&) = delete;

    Result OpenFile(const std::string& path);
    // The memory must outlive the inspector.
    Result OpenMemory(std::span<const std::uint8_t> data);

    // Returns Ok + eof=true at end of archive.
    Result Next(ArchiveEntryInfo& out, bool& eof);

    Result ReadCurrentToString(std::string& out);
    Result SkipCurrent();

private:
    Result Prepare();
    Result FailWith(const std::string& what) const;

    struct archive* ar_ = nullptr;
    bool opened_ = false;
    bool in_entry_ = false;
};

// Lists every regular entry; with contents != nullptr also reads entry bodies.
Result ListArchiveEntries(ArchiveInspector& inspector,
                          std::vector<ArchiveEntryInfo>& entries,
                          std::vector<std::string>* contents = nullptr);

} // namespace zipline
