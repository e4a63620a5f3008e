#include "io/gzip_writer.hpp"
#include <stdexcept>

namespace xfer {

GzipWriter::GzipWriter(IWriter& sink, int level)
    : sink_(sink), out_buffer_(64 * 1024) {
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;

    // 16 + MAX_WBITS writes a gzip header and trailer instead of raw zlib
    if (deflateInit2(&strm_, level, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib deflate");
    }
}

GzipWriter::~GzipWriter() {
    deflateEnd(&strm_);
}

Result GzipWriter::Pump(int flush) {
    while (true) {
        strm_.next_out = out_buffer_.data();
        strm_.avail_out = static_cast<uInt>(out_buffer_.size());

        const int ret = deflate(&strm_, flush);
        if (ret == Z_STREAM_ERROR) {
            return Result::Fail(ErrorKind::Archive, "deflate failed");
        }

        const size_t produced = out_buffer_.size() - strm_.avail_out;
        if (produced > 0) {
            auto wr = sink_.WriteAll(std::span<const std::uint8_t>(out_buffer_.data(), produced));
            if (!wr.is_ok()) return wr;
        }

        if (flush == Z_FINISH) {
            if (ret == Z_STREAM_END) return Result::Ok();
            continue;
        }
        // Output buffer had room left: deflate consumed all input.
        if (strm_.avail_out != 0) return Result::Ok();
    }
}

Result GzipWriter::WriteAll(std::span<const std::uint8_t> in) {
    if (finished_) return Result::Fail(ErrorKind::Archive, "gzip stream already finished");
    if (in.empty()) return Result::Ok();

    strm_.next_in = const_cast<Bytef*>(in.data());
    strm_.avail_in = static_cast<uInt>(in.size());
    return Pump(Z_NO_FLUSH);
}

Result GzipWriter::Finish() {
    if (finished_) return Result::Ok();
    finished_ = true;
    strm_.next_in = Z_NULL;
    strm_.avail_in = 0;
    return Pump(Z_FINISH);
}

} // namespace xfer
