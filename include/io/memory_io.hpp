#pragma once
#include "io/io.hpp"

#include <algorithm>
#include <cstdint>
#include <vector>

namespace xfer {

// Reads from a caller-owned byte range.
class SpanReader final : public IReader {
public:
    explicit SpanReader(std::span<const std::uint8_t> data) : data_(data) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size()) return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(pos_), n, out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override { return data_.size(); }

private:
    std::span<const std::uint8_t> data_;
    size_t pos_ = 0;
};

// Appends everything written to a vector.
class VectorWriter final : public IWriter {
public:
    Result WriteAll(std::span<const std::uint8_t> in) override {
        data_.insert(data_.end(), in.begin(), in.end());
        return Result::Ok();
    }

    std::vector<std::uint8_t>& Data() { return data_; }
    std::vector<std::uint8_t> Take() { return std::move(data_); }

private:
    std::vector<std::uint8_t> data_;
};

} // namespace xfer
