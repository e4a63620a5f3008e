#include "xfer/transfer_key.hpp"

#include <cctype>

namespace xfer {

std::expected<TransferKey, std::string> ParseTransferKey(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);

    const auto slash = text.find('/');
    if (slash == std::string_view::npos) {
        return std::unexpected("invalid transfer key - please ensure you have entered it correctly");
    }

    TransferKey key;
    key.id = std::string(text.substr(0, slash));
    key.key_hex = std::string(text.substr(slash + 1));
    if (key.id.empty() || key.key_hex.empty()) {
        return std::unexpected("invalid transfer key - please ensure you have entered it correctly");
    }
    return key;
}

} // namespace xfer
