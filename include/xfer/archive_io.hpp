#pragma once

#include "io/io.hpp"

#include <archive.h>

#include <string>
#include <vector>

namespace xfer {

// Feeds libarchive from an IReader. Must outlive the archive handle.
class ArchiveReadSource {
  public:
    explicit ArchiveReadSource(IReader& reader, size_t buffer_size = 64 * 1024)
        : reader_(reader), buffer_(buffer_size) {}

    int Open(struct archive* ar);

  private:
    static la_ssize_t ReadCb(struct archive* ar, void* client_data, const void** out_buf);

    IReader& reader_;
    std::vector<std::uint8_t> buffer_;
};

// Drains libarchive output into an IWriter. Must outlive the archive handle.
class ArchiveWriteSink {
  public:
    explicit ArchiveWriteSink(IWriter& writer) : writer_(writer) {}

    int Open(struct archive* aw);
    const Result& LastError() const { return last_error_; }

  private:
    static la_ssize_t WriteCb(struct archive* aw, void* client_data, const void* buf, size_t len);

    IWriter& writer_;
    Result last_error_;
};

std::string ArchiveErr(struct archive* ar);

} // namespace xfer
