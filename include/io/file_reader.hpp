#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace xfer {

class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader &out);
    // Takes ownership of an already open descriptor.
    static FileReader Adopt(Fd fd, std::string path);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

    const std::string &Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

} // namespace xfer
