#include "server/content_sniffer.hpp"
#include "testing.hpp"
#include "xfer/cipher.hpp"

#include <gtest/gtest.h>

namespace {

std::optional<std::string_view> Sniff(std::string_view s) {
    return xfer::SniffContentType(
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(s.data()), s.size()));
}

TEST(ContentSnifferTest, DetectsCommonFormats) {
    using namespace std::string_view_literals;
    EXPECT_EQ(Sniff("\x89PNG\r\n\x1a\n\0\0\0\rIHDR"sv), "image/png");
    EXPECT_EQ(Sniff("\xFF\xD8\xFF\xE0\0\x10JFIF"sv), "image/jpeg");
    EXPECT_EQ(Sniff("%PDF-1.7\n"sv), "application/pdf");
    EXPECT_EQ(Sniff("PK\x03\x04\x14\0"sv), "application/zip");
    EXPECT_EQ(Sniff("\x1F\x8B\x08\0\0\0\0\0"sv), "application/gzip");
    EXPECT_EQ(Sniff("\x7F" "ELF\x02\x01\x01"sv), "application/x-executable");
    EXPECT_EQ(Sniff("RIFF\x24\0\0\0WEBPVP8 "sv), "image/webp");
}

TEST(ContentSnifferTest, DetectsTarAtOffset) {
    std::vector<std::uint8_t> head(xfer::kSniffPrefixSize, 0);
    const std::string_view magic = "ustar";
    std::copy(magic.begin(), magic.end(), head.begin() + 257);
    EXPECT_EQ(xfer::SniffContentType(head), "application/x-tar");
}

TEST(ContentSnifferTest, ShortOrPlainInputIsUnknown) {
    EXPECT_FALSE(Sniff("").has_value());
    EXPECT_FALSE(Sniff("\x89P").has_value());
    EXPECT_FALSE(Sniff("hello world").has_value());
}

TEST(ContentSnifferTest, SealedContainerIsNotRecognised) {
    const auto plaintext = testutil::PatternBytes(4096, 1);
    for (int i = 0; i < 64; ++i) {
        xfer::SealedContainer sealed;
        ASSERT_TRUE(xfer::Encrypt(plaintext, sealed).ok);
        const size_t n = std::min(sealed.container.size(), xfer::kSniffPrefixSize);
        // Three-byte signatures give about 43 * 2^-24 odds per container.
        EXPECT_FALSE(xfer::SniffContentType(std::span(sealed.container).first(n)).has_value());
    }
}

} // namespace
