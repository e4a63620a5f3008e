#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace xfer {

// Bytes needed to test every known signature.
inline constexpr std::size_t kSniffPrefixSize = 512;

// Returns the MIME type of the first well-known file signature found at the
// start of `head`, or nullopt. A correctly sealed container is
// indistinguishable from random bytes, so a match means the upload was not
// encrypted. Only signatures of three bytes or more are checked to keep the
// false positive rate on random data negligible.
std::optional<std::string_view> SniffContentType(std::span<const std::uint8_t> head);

} // namespace xfer
