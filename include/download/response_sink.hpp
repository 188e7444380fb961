#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace zipline {

constexpr const char kDownloadIdHeader[] = "X-Download-ID";

struct StreamHeaders {
    std::string content_type = "application/zip";
    std::string filename;                         // Content-Disposition attachment
    std::optional<std::uint64_t> content_length;  // nullopt => chunked
    std::string download_id;                      // kDownloadIdHeader
};

// The response half of one download request, as seen by the core.
//
// Either SendJson() is called once, or Begin() followed by body writes and
// End()/Abort(). Body writes fail once the client has gone away.
class IResponseSink : public IWriter {
  public:
    virtual Result Begin(const StreamHeaders& headers) = 0;
    virtual Result SendJson(int status, const std::string& body) = 0;
    virtual Result End() = 0;
    // Terminates the connection without completing the body.
    virtual void Abort(const std::string& reason) = 0;
    virtual bool HeadersSent() const = 0;
};

} // namespace zipline
