#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace xfer {

// "90s", "1h30m", "500ms", "7d". A bare number is seconds.
std::expected<std::chrono::milliseconds, std::string> ParseDuration(std::string_view s);

// "50MB", "1.5GiB", "1024". Decimal units are powers of 1000, binary of 1024.
std::expected<std::uint64_t, std::string> ParseByteSize(std::string_view s);

// 1234567 -> "1.23 MB"
std::string FormatDecimalBytes(std::uint64_t bytes);

// 5400000ms -> "1h 30m"
std::string FormatDuration(std::chrono::milliseconds d);

} // namespace xfer
