#pragma once

#include "io/io.hpp"
#include "xfer/progress.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace xfer {

// Packs a file or directory into a gzip-compressed tar stream with a single
// root entry named after the source, and unpacks such streams back to disk.
class Archiver {
  public:
    struct Options {
        IProgress* progress_sink = nullptr;
    };

    Archiver() = default;
    explicit Archiver(const Options& opt) : opt_(opt) {}

    // Fails with ErrorKind::Validation when `path` is neither a regular file
    // nor a directory.
    Result Pack(const std::string& path, IWriter& out) const;

    // `dst_dir` must already exist. A stream that is not a valid archive, or
    // holds more than one top-level entry, fails with ErrorKind::Archive.
    // `root_name` receives the name of the extracted top-level entry.
    Result Unpack(IReader& in, const std::string& dst_dir, std::string* root_name = nullptr) const;

  private:
    Options opt_{};
};

} // namespace xfer
