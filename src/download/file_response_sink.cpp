#include "download/file_response_sink.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <utility>

namespace zipline {

FileResponseSink::FileResponseSink(std::string path) : path_(std::move(path)) {}

Result FileResponseSink::Begin(const StreamHeaders& headers) {
    if (headers_sent_) return Result::Fail(ErrorCode::InvalidArgument, "response already started");

    if (path_.empty()) path_ = headers.filename;
    auto r = FileOrStdoutWriter::Open(path_, writer_);
    if (!r.is_ok()) return r;

    headers_sent_ = true;
    status_ = 200;
    headers_ = headers;

    if (headers.content_length) {
        LogInfo("writing %s to %s (%s=%s, %llu bytes)", headers.filename.c_str(), path_.c_str(), kDownloadIdHeader,
                headers.download_id.c_str(), static_cast<unsigned long long>(*headers.content_length));
    } else {
        LogInfo("writing %s to %s (%s=%s, length unknown)", headers.filename.c_str(), path_.c_str(),
                kDownloadIdHeader, headers.download_id.c_str());
    }
    return Result::Ok();
}

Result FileResponseSink::SendJson(int status, const std::string& body) {
    if (headers_sent_) return Result::Fail(ErrorCode::InvalidArgument, "response already started");
    headers_sent_ = true;
    status_ = status;
    json_body_ = body;
    return Result::Ok();
}

Result FileResponseSink::WriteAll(std::span<const std::uint8_t> in) {
    if (!headers_) return Result::Fail(ErrorCode::InvalidArgument, "body written before headers");
    if (aborted_) return Result::Fail(ErrorCode::StreamAborted, "response aborted");
    return writer_.WriteAll(in);
}

Result FileResponseSink::End() {
    if (!headers_) return Result::Fail(ErrorCode::InvalidArgument, "no body to end");
    return writer_.Flush();
}

void FileResponseSink::Abort(const std::string& reason) {
    if (aborted_) return;
    aborted_ = true;
    LogWarn("output %s aborted: %s", path_.c_str(), reason.c_str());

    if (headers_ && path_ != "-") {
        if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
            LogWarn("could not remove partial %s: %s", path_.c_str(), std::strerror(errno));
        }
    }
}

} // namespace zipline
