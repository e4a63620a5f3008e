#include "io/memory_io.hpp"
#include "testing.hpp"
#include "xfer/cipher.hpp"

#include <gtest/gtest.h>

namespace {

TEST(CipherTest, EmptyPlaintextRoundTrip) {
    xfer::SealedContainer sealed;
    ASSERT_TRUE(xfer::Encrypt({}, sealed).ok);
    EXPECT_EQ(sealed.container.size(), xfer::kContainerOverhead);
    EXPECT_EQ(sealed.key_hex.size(), 64u);

    std::vector<std::uint8_t> plain{1, 2, 3};
    auto res = xfer::Decrypt(sealed.container, sealed.key_hex, plain);
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_TRUE(plain.empty());
}

TEST(CipherTest, LargePlaintextRoundTrip) {
    const auto data = testutil::PatternBytes(3 * 1024 * 1024 + 11, 9);
    xfer::SealedContainer sealed;
    ASSERT_TRUE(xfer::Encrypt(data, sealed).ok);
    EXPECT_EQ(sealed.container.size(), xfer::SealedSize(data.size()));

    std::vector<std::uint8_t> plain;
    auto res = xfer::Decrypt(sealed.container, sealed.key_hex, plain);
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_EQ(plain, data);
}

TEST(CipherTest, KeyHexIsUppercaseAndAcceptedInLowercase) {
    xfer::SealedContainer sealed;
    ASSERT_TRUE(xfer::Encrypt(testutil::Bytes("hello"), sealed).ok);
    for (char c : sealed.key_hex) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'A' && c <= 'F')) << c;
    }

    std::string lower = sealed.key_hex;
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    std::vector<std::uint8_t> plain;
    ASSERT_TRUE(xfer::Decrypt(sealed.container, lower, plain).ok);
    EXPECT_EQ(plain, testutil::Bytes("hello"));
}

TEST(CipherTest, EncryptingTwiceGivesDifferentContainers) {
    const auto data = testutil::Bytes("same input");
    xfer::CipherKey key{};
    ASSERT_TRUE(xfer::GenerateKey(key).ok);

    xfer::SpanReader in1(data);
    xfer::SpanReader in2(data);
    xfer::VectorWriter out1;
    xfer::VectorWriter out2;
    ASSERT_TRUE(xfer::EncryptStream(in1, out1, key).ok);
    ASSERT_TRUE(xfer::EncryptStream(in2, out2, key).ok);
    EXPECT_NE(out1.Data(), out2.Data());
}

TEST(CipherTest, TamperedByteFailsAuthentication) {
    const auto data = testutil::PatternBytes(1000);
    xfer::SealedContainer sealed;
    ASSERT_TRUE(xfer::Encrypt(data, sealed).ok);

    for (size_t pos : {size_t{0}, xfer::kNonceSize + 10, sealed.container.size() - 1}) {
        auto copy = sealed.container;
        copy[pos] ^= 0x01;
        std::vector<std::uint8_t> plain;
        auto res = xfer::Decrypt(copy, sealed.key_hex, plain);
        ASSERT_FALSE(res.ok) << "flipped byte " << pos;
        EXPECT_EQ(res.kind, xfer::ErrorKind::Crypto);
        EXPECT_TRUE(plain.empty());
    }
}

TEST(CipherTest, WrongKeyFails) {
    xfer::SealedContainer a;
    xfer::SealedContainer b;
    ASSERT_TRUE(xfer::Encrypt(testutil::Bytes("secret"), a).ok);
    ASSERT_TRUE(xfer::Encrypt(testutil::Bytes("other"), b).ok);

    std::vector<std::uint8_t> plain;
    auto res = xfer::Decrypt(a.container, b.key_hex, plain);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, xfer::ErrorKind::Crypto);
}

TEST(CipherTest, MalformedKeyHexIsRejected) {
    xfer::CipherKey key{};
    EXPECT_EQ(xfer::KeyFromHex("ABCD", key).kind, xfer::ErrorKind::Crypto);
    EXPECT_EQ(xfer::KeyFromHex(std::string(64, 'Z'), key).kind, xfer::ErrorKind::Crypto);
    EXPECT_EQ(xfer::KeyFromHex(std::string(66, 'A'), key).kind, xfer::ErrorKind::Crypto);
    EXPECT_TRUE(xfer::KeyFromHex(std::string(64, 'a'), key).ok);
    EXPECT_EQ(key[0], 0xAA);
}

TEST(CipherTest, KeyHexRoundTrip) {
    xfer::CipherKey key{};
    ASSERT_TRUE(xfer::GenerateKey(key).ok);
    xfer::CipherKey parsed{};
    ASSERT_TRUE(xfer::KeyFromHex(xfer::KeyToHex(key), parsed).ok);
    EXPECT_EQ(parsed, key);
}

TEST(CipherTest, TruncatedContainerFails) {
    xfer::SealedContainer sealed;
    ASSERT_TRUE(xfer::Encrypt(testutil::Bytes("x"), sealed).ok);

    for (size_t len : {size_t{0}, size_t{5}, xfer::kNonceSize + 3, sealed.container.size() - 1}) {
        std::vector<std::uint8_t> plain;
        auto res = xfer::Decrypt(std::span(sealed.container).first(len), sealed.key_hex, plain);
        ASSERT_FALSE(res.ok) << "length " << len;
        EXPECT_EQ(res.kind, xfer::ErrorKind::Crypto);
    }
}

TEST(CipherTest, StreamReadFailureIsIoError) {
    xfer::CipherKey key{};
    ASSERT_TRUE(xfer::GenerateKey(key).ok);
    testutil::FailingReader in(100);
    xfer::VectorWriter out;
    auto res = xfer::EncryptStream(in, out, key);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, xfer::ErrorKind::Io);
}

} // namespace
