#pragma once
#include "io/io.hpp"

#include <algorithm>
#include <cstdint>
#include <vector>

namespace xfer {

// Replays bytes already consumed from `rest` before continuing with it.
class PrefixedReader final : public IReader {
public:
    PrefixedReader(std::vector<std::uint8_t> prefix, IReader& rest)
        : prefix_(std::move(prefix)), rest_(rest) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ < prefix_.size()) {
            const size_t n = std::min(out.size(), prefix_.size() - pos_);
            std::copy_n(prefix_.begin() + static_cast<std::ptrdiff_t>(pos_), n, out.begin());
            pos_ += n;
            return static_cast<ssize_t>(n);
        }
        return rest_.Read(out);
    }

private:
    std::vector<std::uint8_t> prefix_;
    size_t pos_ = 0;
    IReader& rest_;
};

// Fill `out` with up to `want` bytes, stopping early only at end of stream.
inline ssize_t ReadPrefix(IReader& in, std::vector<std::uint8_t>& out, size_t want) {
    out.resize(want);
    size_t got = 0;
    while (got < want) {
        const ssize_t n = in.Read(std::span<std::uint8_t>(out.data() + got, want - got));
        if (n < 0) return -1;
        if (n == 0) break;
        got += static_cast<size_t>(n);
    }
    out.resize(got);
    return static_cast<ssize_t>(got);
}

} // namespace xfer
