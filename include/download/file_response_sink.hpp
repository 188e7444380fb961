#pragma once

#include "download/response_sink.hpp"
#include "io/file_writer.hpp"

#include <optional>
#include <string>

namespace zipline {

// Response sink for the command line: the archive body goes to a file (or
// stdout for "-"), JSON responses are kept for the caller to print. An
// aborted archive file is removed. An empty path means the attachment
// filename from the headers.
class FileResponseSink final : public IResponseSink {
  public:
    explicit FileResponseSink(std::string path);

    Result Begin(const StreamHeaders& headers) override;
    Result SendJson(int status, const std::string& body) override;
    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result End() override;
    void Abort(const std::string& reason) override;
    bool HeadersSent() const override { return headers_sent_; }

    int Status() const { return status_; }
    const std::string& JsonBody() const { return json_body_; }
    const std::optional<StreamHeaders>& Headers() const { return headers_; }
    bool Aborted() const { return aborted_; }

  private:
    std::string path_;
    FileOrStdoutWriter writer_;
    bool headers_sent_ = false;
    bool aborted_ = false;
    int status_ = 0;
    std::string json_body_;
    std::optional<StreamHeaders> headers_;
};

} // namespace zipline
