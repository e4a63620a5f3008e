#include "xfer/archive_path_policy.hpp"

#include "util/path_utils.hpp"

#include <utility>

namespace xfer {

namespace {

std::string_view FirstSegment(std::string_view p) { return p.substr(0, p.find('/')); }

} // namespace

bool ArchivePathPolicy::IsSafeRelativePath(std::string_view p) {
    if (p.empty() || p.front() == '/') return false;
    if (p.find_first_of(std::string_view("\\\0", 2)) != std::string_view::npos) return false;

    while (true) {
        const auto slash = p.find('/');
        if (p.substr(0, slash) == "..") return false;
        if (slash == std::string_view::npos) return true;
        p.remove_prefix(slash + 1);
    }
}

Result ArchivePathPolicy::AcceptEntry(const char* raw_path, std::string& out_relative) {
    out_relative = NormalizeTarPath(raw_path ? raw_path : "");
    if (out_relative.empty()) return Result::Ok();
    if (!IsSafeRelativePath(out_relative)) {
        return Result::Fail(ErrorKind::Archive, "Unsafe path in archive: " + out_relative);
    }

    const std::string_view top = FirstSegment(out_relative);
    if (root_.empty()) {
        root_ = std::string(top);
    } else if (top != root_) {
        return Result::Fail(ErrorKind::Archive,
                            "Archive has more than one top-level entry ('" + root_ + "' and '" + std::string(top) + "')");
    }
    return Result::Ok();
}

Result ArchivePathPolicy::AcceptLinkTarget(const char* raw_path, std::string& out_relative) const {
    out_relative.clear();
    if (!raw_path || !*raw_path) return Result::Ok();

    std::string target = NormalizeTarPath(raw_path);
    if (!IsSafeRelativePath(target) || FirstSegment(target) != root_) {
        return Result::Fail(ErrorKind::Archive, "Unsafe hardlink target in archive: " + target);
    }
    out_relative = std::move(target);
    return Result::Ok();
}

} // namespace xfer
