#pragma once

#include "io/io.hpp"

#include <vector>
#include <zlib.h>

namespace xfer {

// Inflates a gzip stream pulled from `source`. A source that ends before the
// gzip trailer is reported as a read error.
class GzipReader final : public IReader {
  public:
    explicit GzipReader(IReader& source);
    ~GzipReader() override;

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return std::nullopt; }

  private:
    IReader& source_;
    z_stream strm_{};
    std::vector<std::uint8_t> in_buffer_;
    bool eof_reached_ = false;
    bool source_drained_ = false;
};

} // namespace xfer
