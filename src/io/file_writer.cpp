// file_writer.cpp - Writer implementation for regular files.

#include "io/file_writer.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace xfer {

Result FileWriter::Create(std::string path, FileWriter& out, bool exclusive) {
    out.path_ = std::move(path);
    out.written_ = 0;

    int flags = O_WRONLY | O_CREAT;
    flags |= exclusive ? O_EXCL : O_TRUNC;
    auto r = Fd::Open(out.path_, flags, 0600, out.fd_);
    if (!r.is_ok()) {
        return r.WithContext("Failed to open output");
    }
    return Result::Ok();
}

Result FileWriter::CreateTemp(const std::string& dir, const std::string& prefix, FileWriter& out) {
    std::string tmpl = dir + "/" + prefix + "XXXXXX";
    const int fd = ::mkostemp(tmpl.data(), O_CLOEXEC);
    if (fd < 0) {
        const int e = errno;
        return Result::Fail(ErrorKind::Io, e,
                            "mkostemp in " + dir + " failed (" + std::string(std::strerror(e)) + ")");
    }
    out.fd_.Reset(fd);
    out.path_ = std::move(tmpl);
    out.written_ = 0;
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            written_ += static_cast<std::uint64_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int e = errno;
        return Result::Fail(ErrorKind::Io, e,
                            "write " + path_ + " failed (" + std::string(std::strerror(e)) + ")");
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        const int e = errno;
        return Result::Fail(ErrorKind::Io, e,
                            "fsync " + path_ + " failed (" + std::string(std::strerror(e)) + ")");
    }
    return Result::Ok();
}

} // namespace xfer
