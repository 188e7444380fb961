#pragma once

#include "download/collaborators.hpp"
#include "io/file_reader.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>

namespace zipline {

// Object storage backed by a directory tree: bucket "b", key "k/x.jpg" lives
// at <root>/b/k/x.jpg.
//
// A storage reference is either "bucket/key" or an object URL
// ("http(s)://host/bucket/key", "s3://bucket/key"); URL paths are
// percent-decoded. References that would leave the root are refused.
class LocalObjectStorage final : public IObjectStorage {
  public:
    explicit LocalObjectStorage(std::string root);

    Result OpenReadStream(const std::string& storage_ref,
                          std::chrono::steady_clock::time_point deadline,
                          std::unique_ptr<IObjectStream>& out) override;

    // Maps a storage reference to a path under the root.
    Result ResolvePath(const std::string& storage_ref, std::string& out_path) const;

    const std::string& Root() const { return root_; }

  private:
    std::string root_;
};

class LocalObjectStream final : public IObjectStream {
  public:
    ssize_t Read(std::span<std::uint8_t> out) override { return reader_.Read(out); }
    std::optional<std::uint64_t> TotalSize() const override { return reader_.TotalSize(); }
    void Cancel() override { reader_.Cancel(); }

  private:
    friend class LocalObjectStorage;
    FileReader reader_;
};

} // namespace zipline
