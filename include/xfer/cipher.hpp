#pragma once

#include "io/io.hpp"
#include "xfer/progress.hpp"
#include "util/result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace xfer {

// ChaCha20-Poly1305 container: nonce || ciphertext || tag.
inline constexpr std::size_t kKeySize = 32;
inline constexpr std::size_t kNonceSize = 12;
inline constexpr std::size_t kTagSize = 16;
inline constexpr std::size_t kContainerOverhead = kNonceSize + kTagSize;

using CipherKey = std::array<std::uint8_t, kKeySize>;

struct SealedContainer {
    std::string key_hex; // uppercase
    std::vector<std::uint8_t> container;
};

Result GenerateKey(CipherKey& out);
std::string KeyToHex(const CipherKey& key);
// Wrong length or non-hex input fails with ErrorKind::Crypto.
Result KeyFromHex(std::string_view hex, CipherKey& out);

constexpr std::uint64_t SealedSize(std::uint64_t plaintext_size) {
    return plaintext_size + kContainerOverhead;
}

// Fresh random key and nonce on every call.
Result Encrypt(std::span<const std::uint8_t> plaintext, SealedContainer& out);
// `out` is only assigned when the tag verifies.
Result Decrypt(std::span<const std::uint8_t> container, std::string_view key_hex,
               std::vector<std::uint8_t>& out);

// Streaming forms with bounded memory. A fresh nonce is drawn per call.
Result EncryptStream(IReader& in, IWriter& out, const CipherKey& key, IProgress* progress = nullptr);
// Plaintext reaches `out` before the tag is checked at the end of the
// stream: stage it and discard it unless this returns ok.
Result DecryptStream(IReader& in, IWriter& out, const CipherKey& key, IProgress* progress = nullptr);

} // namespace xfer
