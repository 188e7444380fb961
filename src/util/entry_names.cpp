#include "util/entry_names.hpp"

#include <unordered_set>

namespace zipline {

namespace {

constexpr const char kFallbackName[] = "file";

void AppendSegment(std::string& out, std::string_view seg) {
    if (seg.empty() || seg == "." || seg == "..") return;
    if (!out.empty()) out.push_back('/');
    out.append(seg);
}

std::string WithCounter(const std::string& name, unsigned n) {
    const auto slash = name.rfind('/');
    const auto dot = name.rfind('.');
    const bool has_ext = dot != std::string::npos && dot > 0 &&
                         (slash == std::string::npos || dot > slash + 1);
    const std::string suffix = " (" + std::to_string(n) + ")";
    if (!has_ext) return name + suffix;
    return name.substr(0, dot) + suffix + name.substr(dot);
}

} // namespace

std::string NormalizeEntryName(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());

    std::string_view sv = raw;
    while (!sv.empty()) {
        std::size_t pos = 0;
        while (pos < sv.size() && sv[pos] != '/' && sv[pos] != '\\') ++pos;
        AppendSegment(out, sv.substr(0, pos));
        if (pos == sv.size()) break;
        sv.remove_prefix(pos + 1);
    }

    if (out.empty()) out = kFallbackName;
    return out;
}

void MakeUniqueEntryNames(std::vector<std::string>& names) {
    std::unordered_set<std::string> used;
    used.reserve(names.size() * 2);

    for (auto& n : names) n = NormalizeEntryName(n);

    for (auto& n : names) {
        if (used.insert(n).second) continue;
        for (unsigned i = 2;; ++i) {
            auto candidate = WithCounter(n, i);
            if (used.insert(candidate).second) {
                n = std::move(candidate);
                break;
            }
        }
    }
}

} // namespace zipline
