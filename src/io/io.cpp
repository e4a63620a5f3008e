#include "io/io.hpp"

#include <cerrno>
#include <vector>

namespace xfer {

Result CopyStream(IReader& in, IWriter& out, std::uint64_t* copied) {
    std::vector<std::uint8_t> buf(64 * 1024);
    std::uint64_t total = 0;

    while (true) {
        const ssize_t n = in.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return Result::Fail(ErrorKind::Io, errno, "read failed while copying");

        auto wr = out.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!wr.is_ok()) return wr;

        total += static_cast<std::uint64_t>(n);
        if (copied) *copied = total;
    }
    return Result::Ok();
}

} // namespace xfer
