#pragma once

#include "download/types.hpp"

#include <cstdint>

namespace zipline {

class StrategySelector {
  public:
    // Pure: the same target and settings always yield the same strategy.
    static DownloadStrategy Select(const DownloadTarget& target,
                                   bool multipart_enabled,
                                   std::uint64_t chunk_size_bytes);
};

} // namespace zipline
