#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace xfer {

// Checks entry names of a transfer archive before anything is written.
// Every entry must stay inside the destination and under the one top-level
// name the archive was packed with. One policy object per archive.
class ArchivePathPolicy {
  public:
    // Normalizes `raw_path` to a relative path in `out_relative`. The first
    // entry fixes the root name; an empty result means "skip this entry".
    Result AcceptEntry(const char* raw_path, std::string& out_relative);
    // Hard link targets must point at an entry of the same root. Null or
    // empty targets leave `out_relative` empty.
    Result AcceptLinkTarget(const char* raw_path, std::string& out_relative) const;

    // Empty until the first entry was accepted.
    const std::string& Root() const { return root_; }

    static bool IsSafeRelativePath(std::string_view p);

  private:
    std::string root_;
};

} // namespace xfer
