#pragma once

#include <string>
#include <string_view>

namespace xfer {

// Rewrites an archive entry name as a plain relative path: empty and "."
// segments are dropped, so leading "/" and "./" vanish along with doubled
// and trailing slashes. ".." segments are kept for the caller to judge.
inline std::string NormalizeTarPath(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    while (!s.empty()) {
        const auto slash = s.find('/');
        const std::string_view seg = s.substr(0, slash);
        s = slash == std::string_view::npos ? std::string_view{} : s.substr(slash + 1);
        if (seg.empty() || seg == ".") continue;
        if (!out.empty()) out.push_back('/');
        out.append(seg);
    }
    return out;
}

} // namespace xfer
