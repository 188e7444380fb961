#pragma once

#include "download/types.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace zipline {

class Partitioner {
  public:
    // Greedy split in target order. An object never straddles two parts; an
    // object larger than the threshold gets a part of its own. Part i is
    // named "<base_name>_part<i>.zip".
    static std::vector<ArchivePart> Split(const DownloadTarget& target,
                                          std::uint64_t threshold_bytes,
                                          const std::string& base_name);

    static Result FindPart(const std::vector<ArchivePart>& parts,
                           std::uint32_t index,
                           const ArchivePart*& out);
};

} // namespace zipline
