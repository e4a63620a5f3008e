#include "xfer/cipher.hpp"

#include "io/memory_io.hpp"
#include "io/prefixed_reader.hpp"
#include "system/signals.hpp"
#include "util/hex.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <cerrno>
#include <cstring>

namespace xfer {

namespace {

constexpr size_t kChunkSize = 64 * 1024;
constexpr std::string_view kEncryptStage = "encrypt";
constexpr std::string_view kDecryptStage = "decrypt";

class EvpCipherCtx final {
public:
    EvpCipherCtx() : ctx_(EVP_CIPHER_CTX_new()) {}
    EvpCipherCtx(const EvpCipherCtx&) = delete;
    EvpCipherCtx& operator=(const EvpCipherCtx&) = delete;
    ~EvpCipherCtx() {
        if (ctx_) EVP_CIPHER_CTX_free(ctx_);
    }

    EVP_CIPHER_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_CIPHER_CTX* ctx_ = nullptr;
};

Result CryptoFail(const std::string& msg) { return Result::Fail(ErrorKind::Crypto, msg); }

bool InitCipher(EvpCipherCtx& ctx, bool encrypt, const CipherKey& key,
                std::span<const std::uint8_t> nonce) {
    if (!ctx.ok()) return false;
    auto init = encrypt ? EVP_EncryptInit_ex : EVP_DecryptInit_ex;
    if (init(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1) return false;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1) {
        return false;
    }
    return init(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) == 1;
}

void Report(IProgress* progress, std::string_view stage, std::uint64_t done, std::uint64_t total) {
    if (!progress) return;
    ProgressEvent e{};
    e.stage = stage;
    e.done = done;
    e.total = total;
    progress->OnProgress(e);
}

} // namespace

Result GenerateKey(CipherKey& out) {
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
        return CryptoFail("failed to generate random key");
    }
    return Result::Ok();
}

std::string KeyToHex(const CipherKey& key) { return HexEncodeUpper(key); }

Result KeyFromHex(std::string_view hex, CipherKey& out) {
    auto decoded = HexDecode(hex);
    if (!decoded) {
        return CryptoFail("invalid key: " + decoded.error());
    }
    if (decoded->size() != kKeySize) {
        return CryptoFail("invalid key: expected " + std::to_string(kKeySize * 2) + " hex digits, got " +
                          std::to_string(hex.size()));
    }
    std::memcpy(out.data(), decoded->data(), kKeySize);
    OPENSSL_cleanse(decoded->data(), decoded->size());
    return Result::Ok();
}

Result EncryptStream(IReader& in, IWriter& out, const CipherKey& key, IProgress* progress) {
    std::array<std::uint8_t, kNonceSize> nonce{};
    if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
        return CryptoFail("failed to generate random nonce");
    }

    EvpCipherCtx ctx;
    if (!InitCipher(ctx, true, key, nonce)) return CryptoFail("failed to initialise cipher");

    auto wr = out.WriteAll(nonce);
    if (!wr.is_ok()) return wr;

    const std::uint64_t total = in.TotalSize().value_or(0);
    std::uint64_t done = 0;
    std::vector<std::uint8_t> plain(kChunkSize);
    std::vector<std::uint8_t> sealed(kChunkSize);

    while (true) {
        const ssize_t n = in.Read(std::span<std::uint8_t>(plain.data(), plain.size()));
        if (n == 0) break;
        if (n < 0) return Result::Fail(ErrorKind::Io, errno, "read failed while encrypting");
        if (CancelRequested()) return Result::Fail(ErrorKind::Io, EINTR, "interrupted");

        int produced = 0;
        if (EVP_EncryptUpdate(ctx.get(), sealed.data(), &produced, plain.data(), static_cast<int>(n)) != 1) {
            return CryptoFail("failed to encrypt bytes");
        }
        wr = out.WriteAll(std::span<const std::uint8_t>(sealed.data(), static_cast<size_t>(produced)));
        if (!wr.is_ok()) return wr;

        done += static_cast<std::uint64_t>(n);
        Report(progress, kEncryptStage, done, total);
    }
    OPENSSL_cleanse(plain.data(), plain.size());

    int produced = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), sealed.data(), &produced) != 1) {
        return CryptoFail("failed to finalise encryption");
    }
    if (produced > 0) {
        wr = out.WriteAll(std::span<const std::uint8_t>(sealed.data(), static_cast<size_t>(produced)));
        if (!wr.is_ok()) return wr;
    }

    std::array<std::uint8_t, kTagSize> tag{};
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(tag.size()), tag.data()) != 1) {
        return CryptoFail("failed to obtain authentication tag");
    }
    return out.WriteAll(tag);
}

Result DecryptStream(IReader& in, IWriter& out, const CipherKey& key, IProgress* progress) {
    std::vector<std::uint8_t> nonce;
    if (ReadPrefix(in, nonce, kNonceSize) < 0) {
        return Result::Fail(ErrorKind::Io, errno, "read failed while decrypting");
    }
    if (nonce.size() != kNonceSize) return CryptoFail("failed to decrypt bytes: container is truncated");

    EvpCipherCtx ctx;
    if (!InitCipher(ctx, false, key, nonce)) return CryptoFail("failed to initialise cipher");

    const std::uint64_t total = in.TotalSize().value_or(0);
    std::uint64_t done = 0;

    // The last kTagSize bytes of the stream are the tag, so always hold that
    // many back until the reader reports end of stream.
    std::vector<std::uint8_t> window(kChunkSize + kTagSize);
    std::vector<std::uint8_t> plain(kChunkSize + kTagSize);
    size_t have = 0;

    while (true) {
        const ssize_t n = in.Read(std::span<std::uint8_t>(window.data() + have, window.size() - have));
        if (n == 0) break;
        if (n < 0) return Result::Fail(ErrorKind::Io, errno, "read failed while decrypting");
        if (CancelRequested()) return Result::Fail(ErrorKind::Io, EINTR, "interrupted");
        have += static_cast<size_t>(n);
        done += static_cast<std::uint64_t>(n);

        if (have <= kTagSize) continue;
        const size_t ready = have - kTagSize;

        int produced = 0;
        if (EVP_DecryptUpdate(ctx.get(), plain.data(), &produced, window.data(), static_cast<int>(ready)) != 1) {
            return CryptoFail("failed to decrypt bytes");
        }
        auto wr = out.WriteAll(std::span<const std::uint8_t>(plain.data(), static_cast<size_t>(produced)));
        if (!wr.is_ok()) return wr;

        std::memmove(window.data(), window.data() + ready, kTagSize);
        have = kTagSize;
        Report(progress, kDecryptStage, done + kNonceSize, total);
    }
    OPENSSL_cleanse(plain.data(), plain.size());

    if (have < kTagSize) return CryptoFail("failed to decrypt bytes: container is truncated");

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(kTagSize), window.data()) != 1) {
        return CryptoFail("failed to set authentication tag");
    }
    int produced = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plain.data(), &produced) != 1) {
        return CryptoFail("failed to decrypt bytes: authentication failed (wrong key or tampered data)");
    }
    return Result::Ok();
}

Result Encrypt(std::span<const std::uint8_t> plaintext, SealedContainer& out) {
    CipherKey key{};
    auto kr = GenerateKey(key);
    if (!kr.is_ok()) return kr;

    SpanReader reader(plaintext);
    VectorWriter writer;
    writer.Data().reserve(static_cast<size_t>(SealedSize(plaintext.size())));
    auto er = EncryptStream(reader, writer, key);
    if (!er.is_ok()) {
        OPENSSL_cleanse(key.data(), key.size());
        return er;
    }

    out.key_hex = KeyToHex(key);
    out.container = writer.Take();
    OPENSSL_cleanse(key.data(), key.size());
    return Result::Ok();
}

Result Decrypt(std::span<const std::uint8_t> container, std::string_view key_hex,
               std::vector<std::uint8_t>& out) {
    CipherKey key{};
    auto kr = KeyFromHex(key_hex, key);
    if (!kr.is_ok()) return kr;

    SpanReader reader(container);
    VectorWriter writer;
    auto dr = DecryptStream(reader, writer, key);
    OPENSSL_cleanse(key.data(), key.size());
    if (!dr.is_ok()) {
        OPENSSL_cleanse(writer.Data().data(), writer.Data().size());
        return dr;
    }
    out = writer.Take();
    return Result::Ok();
}

} // namespace xfer
