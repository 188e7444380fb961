#include "download/strategy_selector.hpp"

namespace zipline {

DownloadStrategy StrategySelector::Select(const DownloadTarget& target,
                                          bool multipart_enabled,
                                          std::uint64_t chunk_size_bytes) {
    DownloadStrategy s;
    s.total_size = TotalSize(target);
    s.chunk_size = chunk_size_bytes;

    if (multipart_enabled && chunk_size_bytes > 0 && s.total_size > chunk_size_bytes) {
        s.kind = DownloadStrategy::Kind::MultipartManifest;
        s.estimated_parts = (s.total_size + chunk_size_bytes - 1) / chunk_size_bytes;
    } else {
        s.kind = DownloadStrategy::Kind::DirectStream;
        s.estimated_parts = 1;
    }
    return s;
}

} // namespace zipline
