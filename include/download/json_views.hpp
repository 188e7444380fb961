#pragma once

#include "download/types.hpp"
#include "util/clock.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace zipline {

// ISO 8601 UTC with milliseconds, e.g. 2025-01-31T12:00:00.000Z
std::string FormatIsoTime(TimePoint tp);

// {"success":true,"progress":{...}}
nlohmann::json ProgressJson(const ProgressRecord& record);

// {"multipart":true,"parts":[{part,filename,size,count,downloadUrl}, ...]}
nlohmann::json ManifestJson(const std::vector<ArchivePart>& parts,
                            std::string_view base_path,
                            const TargetSelector& target,
                            std::string_view ticket);

// {"success":false,"error":...,"code":...}
nlohmann::json ErrorJson(ErrorCode code, const std::string& message);

} // namespace zipline
