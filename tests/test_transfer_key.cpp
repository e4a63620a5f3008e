#include "xfer/transfer_key.hpp"

#include <gtest/gtest.h>

namespace {

TEST(TransferKeyTest, ParsesIdentifierAndKey) {
    auto key = xfer::ParseTransferKey("amber-cloud-river-stone/0A1B2C");
    ASSERT_TRUE(key.has_value()) << key.error();
    EXPECT_EQ(key->id, "amber-cloud-river-stone");
    EXPECT_EQ(key->key_hex, "0A1B2C");
    EXPECT_EQ(key->ToString(), "amber-cloud-river-stone/0A1B2C");
}

TEST(TransferKeyTest, TrimsSurroundingWhitespace) {
    auto key = xfer::ParseTransferKey("  a-b-c-d/FF\n");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->id, "a-b-c-d");
    EXPECT_EQ(key->key_hex, "FF");
}

TEST(TransferKeyTest, SplitsOnFirstSlashOnly) {
    auto key = xfer::ParseTransferKey("id/AB/CD");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->id, "id");
    EXPECT_EQ(key->key_hex, "AB/CD");
}

TEST(TransferKeyTest, RejectsMalformedInput) {
    for (const char* bad : {"", "no-slash-here", "/ABCD", "a-b-c-d/", "   "}) {
        auto key = xfer::ParseTransferKey(bad);
        ASSERT_FALSE(key.has_value()) << bad;
        EXPECT_NE(key.error().find("invalid transfer key"), std::string::npos);
    }
}

} // namespace
