#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace xfer {

std::string HexEncodeUpper(std::span<const std::uint8_t> bytes);

// Accepts upper or lower case digits; rejects odd length and non-hex characters.
std::expected<std::vector<std::uint8_t>, std::string> HexDecode(std::string_view hex);

} // namespace xfer
