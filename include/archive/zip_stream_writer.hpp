#pragma once

#include "io/io.hpp"
#include "util/clock.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace zipline {

// Forward-only ZIP writer for stored (uncompressed) entries.
//
// Every entry is written as local header, raw bytes, data descriptor, so the
// CRC does not have to be known up front and nothing is ever seeked. ZIP64
// records are emitted only when a size, offset or entry count needs them;
// below those limits the output layout matches zip::kStoredEntryOverhead
// exactly.
class ZipStreamWriter {
  public:
    struct Options {
        TimePoint modified = WallClock::now();  // DOS timestamp of every entry
    };

    explicit ZipStreamWriter(IWriter& out);
    ZipStreamWriter(IWriter& out, const Options& opt);

    ZipStreamWriter(const ZipStreamWriter&) = delete;
    ZipStreamWriter& operator=(const ZipStreamWriter&) = delete;

    // size_hint decides whether the local header carries a ZIP64 extra field.
    Result BeginEntry(std::string_view name, std::uint64_t size_hint);
    Result WriteEntryData(std::span<const std::uint8_t> data);
    Result EndEntry();

    // Writes central directory and end records. The writer is closed afterwards.
    Result Finish();

    // Stops the writer without emitting anything further.
    void Abandon();

    bool InEntry() const { return in_entry_; }
    bool Closed() const { return closed_; }
    std::size_t EntryCount() const { return entries_.size(); }
    std::uint64_t BytesWritten() const { return offset_; }

  private:
    struct CentralRecord {
        std::string name;
        std::uint32_t crc = 0;
        std::uint64_t size = 0;
        std::uint64_t local_offset = 0;
        bool zip64_local = false;
    };

    Result Emit(std::span<const std::uint8_t> bytes);
    Result WriteCentralDirectory();

    IWriter& out_;
    std::uint16_t dos_time_ = 0;
    std::uint16_t dos_date_ = 0;

    std::vector<CentralRecord> entries_;
    CentralRecord current_{};
    bool in_entry_ = false;
    bool closed_ = false;
    std::uint64_t offset_ = 0;
};

} // namespace zipline
