#pragma once
#include <cstdint>
#include <string_view>

namespace zipline {

struct ProgressEvent {
    std::string_view download_id;
    std::string_view entry;

    std::uint64_t objects_done = 0;
    std::uint64_t objects_total = 0;

    std::uint64_t bytes_done = 0;
    std::uint64_t bytes_total = 0;   // 0 => unknown
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace zipline
