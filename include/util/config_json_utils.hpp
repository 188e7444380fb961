#pragma once

#include "util/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace zipline::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);

// Keys are read nested ({"download": {"mode": ...}}) or flat ({"download.mode": ...}).
bool FillConfigFromJson(const nlohmann::json& j, DownloadConfig& cfg, std::string& err);

} // namespace zipline::config::detail
