#include "xfer/archive_io.hpp"

#include "system/signals.hpp"

#include <cerrno>

namespace xfer {

la_ssize_t ArchiveReadSource::ReadCb(struct archive* ar, void* client_data, const void** out_buf) {
    if (CancelRequested()) {
        archive_set_error(ar, EINTR, "interrupted");
        return -1;
    }

    auto* self = static_cast<ArchiveReadSource*>(client_data);
    const ssize_t n = self->reader_.Read(std::span<std::uint8_t>(self->buffer_.data(), self->buffer_.size()));
    if (n < 0) {
        archive_set_error(ar, EIO, "stream is not a valid compressed archive");
        return -1;
    }

    *out_buf = self->buffer_.data();
    return static_cast<la_ssize_t>(n);
}

int ArchiveReadSource::Open(struct archive* ar) {
    return archive_read_open(ar, this, nullptr, ReadCb, nullptr);
}

la_ssize_t ArchiveWriteSink::WriteCb(struct archive* aw, void* client_data, const void* buf, size_t len) {
    auto* self = static_cast<ArchiveWriteSink*>(client_data);
    if (CancelRequested()) {
        self->last_error_ = Result::Fail(ErrorKind::Io, EINTR, "interrupted");
        archive_set_error(aw, EINTR, "interrupted");
        return -1;
    }

    auto r = self->writer_.WriteAll(std::span<const std::uint8_t>(static_cast<const std::uint8_t*>(buf), len));
    if (!r.is_ok()) {
        self->last_error_ = r;
        archive_set_error(aw, r.err ? r.err : EIO, "%s", r.msg.c_str());
        return -1;
    }
    return static_cast<la_ssize_t>(len);
}

int ArchiveWriteSink::Open(struct archive* aw) {
    return archive_write_open(aw, this, nullptr, WriteCb, nullptr);
}

std::string ArchiveErr(struct archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

} // namespace xfer
