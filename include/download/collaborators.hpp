#pragma once

#include "download/types.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace zipline {

// Precomputed access decision; the core never inspects credentials itself.
class IAuthorizer {
  public:
    virtual ~IAuthorizer() = default;
    virtual bool IsAuthorized(const TargetSelector& target,
                              const std::string& requester,
                              const std::string& credential) const = 0;
};

struct ResolvedTarget {
    DownloadTarget objects;
    std::string gallery_title;
    std::string folder_name;  // DownloadKind::Folder only
    std::optional<TimePoint> expires_at;
};

class ITargetResolver {
  public:
    virtual ~ITargetResolver() = default;
    // Fails with ErrorCode::NotFound when the gallery or folder does not exist.
    virtual Result Resolve(const TargetSelector& target,
                           const std::string& requester,
                           ResolvedTarget& out) const = 0;
};

class IObjectStream : public IReader {
  public:
    // Must be callable from another thread while Read() is blocked; any
    // pending and later Read() then returns -1 and the connection is released.
    virtual void Cancel() = 0;
};

class IObjectStorage {
  public:
    virtual ~IObjectStorage() = default;
    virtual Result OpenReadStream(const std::string& storage_ref,
                                  std::chrono::steady_clock::time_point deadline,
                                  std::unique_ptr<IObjectStream>& out) = 0;
};

} // namespace zipline
