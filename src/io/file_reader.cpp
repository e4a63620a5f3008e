#include "io/file_reader.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace xfer {

namespace {

std::optional<std::uint64_t> StatSize(int fd) {
    struct stat st{};
    if (::fstat(fd, &st) == 0 && S_ISREG(st.st_mode)) {
        return static_cast<std::uint64_t>(st.st_size);
    }
    return std::nullopt;
}

} // namespace

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);

    Fd fd;
    auto r = Fd::Open(out.path_, O_RDONLY, 0, fd);
    if (!r.is_ok()) {
        return r.WithContext("Failed to open input");
    }
    out.size_ = StatSize(fd.Get());
    out.fd_ = std::move(fd);
    return Result::Ok();
}

FileReader FileReader::Adopt(Fd fd, std::string path) {
    FileReader reader;
    reader.path_ = std::move(path);
    reader.size_ = StatSize(fd.Get());
    reader.fd_ = std::move(fd);
    return reader;
}

std::optional<std::uint64_t> FileReader::TotalSize() const { return size_; }

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace xfer
