#pragma once

#include "io/io.hpp"

#include <vector>
#include <zlib.h>

namespace xfer {

// Deflates everything written into a gzip stream on `sink`.
// Finish() must be called to emit the trailer.
class GzipWriter final : public IWriter {
  public:
    explicit GzipWriter(IWriter& sink, int level = Z_DEFAULT_COMPRESSION);
    ~GzipWriter() override;

    GzipWriter(const GzipWriter&) = delete;
    GzipWriter& operator=(const GzipWriter&) = delete;

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result Finish();

  private:
    Result Pump(int flush);

    IWriter& sink_;
    z_stream strm_{};
    std::vector<std::uint8_t> out_buffer_;
    bool finished_ = false;
};

} // namespace xfer
