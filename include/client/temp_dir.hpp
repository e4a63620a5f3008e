#pragma once

#include "util/result.hpp"

#include <string>

namespace xfer {

// Private (0700) scratch directory removed with everything in it when the
// owner goes out of scope.
class TempDir {
  public:
    // Created under $TMPDIR, or /tmp.
    static Result Create(TempDir& out);

    TempDir() = default;
    TempDir(TempDir&& other) noexcept;
    TempDir& operator=(TempDir&& other) noexcept;
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    ~TempDir();

    const std::string& Path() const { return path_; }
    std::string File(const std::string& name) const { return path_ + "/" + name; }

  private:
    void Cleanup();

    std::string path_;
};

} // namespace xfer
