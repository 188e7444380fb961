#include "archive/zip_stream_writer.hpp"

#include "archive/zip_format.hpp"

#include <zlib.h>

#include <climits>
#include <ctime>

namespace zipline {

namespace {

class LeBuffer {
  public:
    void U16(std::uint16_t v) {
        buf_.push_back(static_cast<std::uint8_t>(v & 0xFF));
        buf_.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    }
    void U32(std::uint32_t v) {
        for (int i = 0; i < 4; ++i) buf_.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
    }
    void U64(std::uint64_t v) {
        for (int i = 0; i < 8; ++i) buf_.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
    }
    void Bytes(std::string_view s) { buf_.insert(buf_.end(), s.begin(), s.end()); }

    std::span<const std::uint8_t> Span() const { return {buf_.data(), buf_.size()}; }

  private:
    std::vector<std::uint8_t> buf_;
};

void ToDosDateTime(TimePoint tp, std::uint16_t& dos_time, std::uint16_t& dos_date) {
    const std::time_t t = WallClock::to_time_t(tp);
    std::tm tm{};
    if (localtime_r(&t, &tm) == nullptr || tm.tm_year < 80) {
        dos_time = 0;
        dos_date = (1 << 5) | 1;  // 1980-01-01
        return;
    }
    dos_time = static_cast<std::uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
    dos_date = static_cast<std::uint16_t>(((tm.tm_year - 80) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
}

bool HasNonAscii(std::string_view s) {
    for (char c : s) {
        if (static_cast<unsigned char>(c) >= 0x80) return true;
    }
    return false;
}

std::uint32_t Crc32Update(std::uint32_t crc, std::span<const std::uint8_t> data) {
    uLong c = crc;
    const Bytef* p = data.data();
    std::size_t rem = data.size();
    while (rem > 0) {
        const uInt n = rem > UINT_MAX ? UINT_MAX : static_cast<uInt>(rem);
        c = crc32(c, p, n);
        p += n;
        rem -= n;
    }
    return static_cast<std::uint32_t>(c);
}

std::uint16_t EntryFlags(std::string_view name) {
    std::uint16_t flags = zip::kFlagDataDescriptor;
    if (HasNonAscii(name)) flags |= zip::kFlagUtf8;
    return flags;
}

} // namespace

ZipStreamWriter::ZipStreamWriter(IWriter& out) : ZipStreamWriter(out, Options{}) {}

ZipStreamWriter::ZipStreamWriter(IWriter& out, const Options& opt) : out_(out) {
    ToDosDateTime(opt.modified, dos_time_, dos_date_);
}

Result ZipStreamWriter::Emit(std::span<const std::uint8_t> bytes) {
    if (bytes.empty()) return Result::Ok();
    auto r = out_.WriteAll(bytes);
    if (!r.is_ok()) {
        closed_ = true;
        return r;
    }
    offset_ += bytes.size();
    return Result::Ok();
}

Result ZipStreamWriter::BeginEntry(std::string_view name, std::uint64_t size_hint) {
    if (closed_) return Result::Fail(ErrorCode::StreamAborted, "zip writer is closed");
    if (in_entry_) return Result::Fail(ErrorCode::InvalidArgument, "previous zip entry not ended");
    if (name.empty()) return Result::Fail(ErrorCode::InvalidArgument, "empty zip entry name");
    if (name.size() >= zip::kMax16) {
        return Result::Fail(ErrorCode::InvalidArgument, "zip entry name too long");
    }

    current_ = CentralRecord{};
    current_.name = std::string(name);
    current_.local_offset = offset_;
    current_.zip64_local = size_hint >= zip::kMax32;

    LeBuffer h;
    h.U32(zip::kLocalHeaderSig);
    h.U16(current_.zip64_local ? zip::kVersionZip64 : zip::kVersionDefault);
    h.U16(EntryFlags(name));
    h.U16(zip::kMethodStore);
    h.U16(dos_time_);
    h.U16(dos_date_);
    h.U32(0);  // crc, in data descriptor
    if (current_.zip64_local) {
        h.U32(static_cast<std::uint32_t>(zip::kMax32));
        h.U32(static_cast<std::uint32_t>(zip::kMax32));
    } else {
        h.U32(0);
        h.U32(0);
    }
    h.U16(static_cast<std::uint16_t>(name.size()));
    h.U16(current_.zip64_local ? 20 : 0);
    h.Bytes(name);
    if (current_.zip64_local) {
        h.U16(zip::kZip64ExtraId);
        h.U16(16);
        h.U64(0);
        h.U64(0);
    }

    auto r = Emit(h.Span());
    if (!r.is_ok()) return r;
    in_entry_ = true;
    return Result::Ok();
}

Result ZipStreamWriter::WriteEntryData(std::span<const std::uint8_t> data) {
    if (closed_) return Result::Fail(ErrorCode::StreamAborted, "zip writer is closed");
    if (!in_entry_) return Result::Fail(ErrorCode::InvalidArgument, "no open zip entry");

    auto r = Emit(data);
    if (!r.is_ok()) return r;
    current_.crc = Crc32Update(current_.crc, data);
    current_.size += data.size();
    return Result::Ok();
}

Result ZipStreamWriter::EndEntry() {
    if (closed_) return Result::Fail(ErrorCode::StreamAborted, "zip writer is closed");
    if (!in_entry_) return Result::Fail(ErrorCode::InvalidArgument, "no open zip entry");

    if (!current_.zip64_local && current_.size >= zip::kMax32) {
        closed_ = true;
        return Result::Fail(ErrorCode::IoError,
                            "zip entry '" + current_.name + "' outgrew its declared size (4 GiB limit)");
    }

    LeBuffer d;
    d.U32(zip::kDataDescriptorSig);
    d.U32(current_.crc);
    if (current_.zip64_local) {
        d.U64(current_.size);
        d.U64(current_.size);
    } else {
        d.U32(static_cast<std::uint32_t>(current_.size));
        d.U32(static_cast<std::uint32_t>(current_.size));
    }

    auto r = Emit(d.Span());
    if (!r.is_ok()) return r;

    entries_.push_back(std::move(current_));
    current_ = CentralRecord{};
    in_entry_ = false;
    return Result::Ok();
}

Result ZipStreamWriter::WriteCentralDirectory() {
    for (const auto& e : entries_) {
        const bool size64 = e.size >= zip::kMax32;
        const bool offset64 = e.local_offset >= zip::kMax32;
        const bool any64 = size64 || offset64 || e.zip64_local;

        LeBuffer extra;
        if (size64 || offset64) {
            extra.U16(zip::kZip64ExtraId);
            extra.U16(static_cast<std::uint16_t>((size64 ? 16 : 0) + (offset64 ? 8 : 0)));
            if (size64) {
                extra.U64(e.size);
                extra.U64(e.size);
            }
            if (offset64) extra.U64(e.local_offset);
        }
        const auto extra_bytes = extra.Span();

        LeBuffer c;
        c.U32(zip::kCentralHeaderSig);
        c.U16(static_cast<std::uint16_t>((zip::kHostUnix << 8) |
                                         (any64 ? zip::kVersionZip64 : zip::kVersionDefault)));
        c.U16(any64 ? zip::kVersionZip64 : zip::kVersionDefault);
        c.U16(EntryFlags(e.name));
        c.U16(zip::kMethodStore);
        c.U16(dos_time_);
        c.U16(dos_date_);
        c.U32(e.crc);
        const auto size32 = static_cast<std::uint32_t>(size64 ? zip::kMax32 : e.size);
        c.U32(size32);
        c.U32(size32);
        c.U16(static_cast<std::uint16_t>(e.name.size()));
        c.U16(static_cast<std::uint16_t>(extra_bytes.size()));
        c.U16(0);  // comment
        c.U16(0);  // disk number start
        c.U16(0);  // internal attributes
        c.U32(0100644U << 16);
        c.U32(static_cast<std::uint32_t>(offset64 ? zip::kMax32 : e.local_offset));
        c.Bytes(e.name);

        auto r = Emit(c.Span());
        if (!r.is_ok()) return r;
        r = Emit(extra_bytes);
        if (!r.is_ok()) return r;
    }
    return Result::Ok();
}

Result ZipStreamWriter::Finish() {
    if (closed_) return Result::Fail(ErrorCode::StreamAborted, "zip writer is closed");
    if (in_entry_) return Result::Fail(ErrorCode::InvalidArgument, "zip entry still open");

    const std::uint64_t cd_offset = offset_;
    auto r = WriteCentralDirectory();
    if (!r.is_ok()) return r;
    const std::uint64_t cd_size = offset_ - cd_offset;
    const std::uint64_t count = entries_.size();

    const bool need64 = count >= zip::kMax16 || cd_offset >= zip::kMax32 || cd_size >= zip::kMax32;
    if (need64) {
        const std::uint64_t eocd64_offset = offset_;

        LeBuffer z;
        z.U32(zip::kZip64EndOfCentralDirSig);
        z.U64(zip::kZip64EndOfCentralDirSize - 12);
        z.U16((zip::kHostUnix << 8) | zip::kVersionZip64);
        z.U16(zip::kVersionZip64);
        z.U32(0);
        z.U32(0);
        z.U64(count);
        z.U64(count);
        z.U64(cd_size);
        z.U64(cd_offset);

        z.U32(zip::kZip64LocatorSig);
        z.U32(0);
        z.U64(eocd64_offset);
        z.U32(1);

        r = Emit(z.Span());
        if (!r.is_ok()) return r;
    }

    LeBuffer e;
    e.U32(zip::kEndOfCentralDirSig);
    e.U16(0);
    e.U16(0);
    const auto count16 = static_cast<std::uint16_t>(count >= zip::kMax16 ? zip::kMax16 : count);
    e.U16(count16);
    e.U16(count16);
    e.U32(static_cast<std::uint32_t>(cd_size >= zip::kMax32 ? zip::kMax32 : cd_size));
    e.U32(static_cast<std::uint32_t>(cd_offset >= zip::kMax32 ? zip::kMax32 : cd_offset));
    e.U16(0);

    r = Emit(e.Span());
    if (!r.is_ok()) return r;

    closed_ = true;
    return Result::Ok();
}

void ZipStreamWriter::Abandon() {
    closed_ = true;
    in_entry_ = false;
}

} // namespace zipline
