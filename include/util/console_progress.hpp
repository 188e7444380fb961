#pragma once

#include "download/progress.hpp"

#include <cstdint>
#include <string>

namespace zipline {

// Single-line stderr progress for the command line front end.
class ConsoleProgressSink final : public IProgress {
public:
    explicit ConsoleProgressSink(std::uint64_t min_step_bytes = 4 * 1024 * 1024ULL)
        : min_step_(min_step_bytes) {}

    void OnProgress(const ProgressEvent& e) override;

private:
    std::uint64_t min_step_ = 0;
    std::uint64_t next_ = 0;
    std::uint64_t last_objects_done_ = 0;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace zipline
