#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>

namespace zipline {

// Writes to a regular file (created/truncated) or to stdout for "-".
class FileOrStdoutWriter final : public IWriter {
  public:
    static Result Open(std::string path, FileOrStdoutWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result Flush() override;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

} // namespace zipline
