#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace xfer {

class FileWriter final : public IWriter {
  public:
    // Creates or truncates `path`. With `exclusive`, fails if it already exists.
    static Result Create(std::string path, FileWriter& out, bool exclusive = false);
    // mkostemp in `dir`; the file name is `prefix` plus a random suffix.
    static Result CreateTemp(const std::string& dir, const std::string& prefix, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    void Close() { fd_.Close(); }

    const std::string& Path() const { return path_; }
    std::uint64_t BytesWritten() const { return written_; }

  private:
    std::string path_;
    Fd fd_;
    std::uint64_t written_ = 0;
};

} // namespace xfer
