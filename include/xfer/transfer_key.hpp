#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace xfer {

// The user-facing credential "<identifier>/<HEX-KEY>".
struct TransferKey {
    std::string id;
    std::string key_hex;

    std::string ToString() const { return id + "/" + key_hex; }
};

// Splits on the first '/'. Both halves must be non-empty; the identifier and
// key are not validated further here.
std::expected<TransferKey, std::string> ParseTransferKey(std::string_view text);

} // namespace xfer
