#include "archive/archive_inspector.hpp"

#include <vector>

namespace zipline {

ArchiveInspector::~ArchiveInspector() {
    if (ar_) {
        archive_read_free(ar_);
        ar_ = nullptr;
    }
}

Result ArchiveInspector::FailWith(const std::string& what) const {
    const char* em = ar_ ? archive_error_string(ar_) : nullptr;
    return Result::Fail(ErrorCode::IoError, what + ": " + (em ? em : "unknown"));
}

Result ArchiveInspector::Prepare() {
    if (opened_) return Result::Fail(ErrorCode::InvalidArgument, "Archive already opened");

    ar_ = archive_read_new();
    if (!ar_) return Result::Fail(ErrorCode::IoError, "archive_read_new failed");

    archive_read_support_format_zip(ar_);
    return Result::Ok();
}

Result ArchiveInspector::OpenFile(const std::string& path) {
    auto r = Prepare();
    if (!r.is_ok()) return r;

    if (archive_read_open_filename(ar_, path.c_str(), 64 * 1024) != ARCHIVE_OK) {
        return FailWith("archive_read_open_filename(" + path + ")");
    }
    opened_ = true;
    return Result::Ok();
}

Result ArchiveInspector::OpenMemory(std::span<const std::uint8_t> data) {
    auto r = Prepare();
    if (!r.is_ok()) return r;

    if (archive_read_open_memory(ar_, data.data(), data.size()) != ARCHIVE_OK) {
        return FailWith("archive_read_open_memory");
    }
    opened_ = true;
    return Result::Ok();
}

Result ArchiveInspector::Next(ArchiveEntryInfo& out, bool& eof) {
    eof = false;
    if (!opened_) return Result::Fail(ErrorCode::InvalidArgument, "Archive not opened");

    if (in_entry_) {
        auto r = SkipCurrent();
        if (!r.is_ok()) return r;
    }

    while (true) {
        archive_entry* entry = nullptr;
        const int r = archive_read_next_header(ar_, &entry);
        if (r == ARCHIVE_EOF) {
            eof = true;
            return Result::Ok();
        }
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) return FailWith("archive_read_next_header");

        if (archive_entry_filetype(entry) != AE_IFREG) {
            archive_read_data_skip(ar_);
            continue;
        }

        const char* name = archive_entry_pathname_utf8(entry);
        if (!name) name = archive_entry_pathname(entry);
        out.name = name ? std::string(name) : std::string();
        out.size = archive_entry_size_is_set(entry)
                       ? static_cast<std::uint64_t>(archive_entry_size(entry))
                       : 0;
        in_entry_ = true;
        return Result::Ok();
    }
}

Result ArchiveInspector::SkipCurrent() {
    if (!in_entry_) return Result::Ok();
    if (archive_read_data_skip(ar_) != ARCHIVE_OK) return FailWith("archive_read_data_skip");
    in_entry_ = false;
    return Result::Ok();
}

Result ArchiveInspector::ReadCurrentToString(std::string& out) {
    if (!in_entry_) return Result::Fail(ErrorCode::InvalidArgument, "No current entry");
    out.clear();

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const la_ssize_t n = archive_read_data(ar_, buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) return FailWith("archive_read_data");
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }

    in_entry_ = false;
    return Result::Ok();
}

Result ListArchiveEntries(ArchiveInspector& inspector,
                          std::vector<ArchiveEntryInfo>& entries,
                          std::vector<std::string>* contents) {
    entries.clear();
    if (contents) contents->clear();

    while (true) {
        ArchiveEntryInfo info;
        bool eof = false;
        auto r = inspector.Next(info, eof);
        if (!r.is_ok()) return r;
        if (eof) break;

        if (contents) {
            std::string body;
            r = inspector.ReadCurrentToString(body);
            if (!r.is_ok()) return r;
            contents->push_back(std::move(body));
        }
        entries.push_back(std::move(info));
    }
    return Result::Ok();
}

} // namespace zipline
