#include "util/units.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;

namespace {

TEST(UnitsTest, ParseDurationForms) {
    EXPECT_EQ(xfer::ParseDuration("90s").value(), 90s);
    EXPECT_EQ(xfer::ParseDuration("1h30m").value(), 90min);
    EXPECT_EQ(xfer::ParseDuration("500ms").value(), 500ms);
    EXPECT_EQ(xfer::ParseDuration("7d").value(), 168h);
    EXPECT_EQ(xfer::ParseDuration("1min").value(), 1min);
    EXPECT_EQ(xfer::ParseDuration("45").value(), 45s);
    EXPECT_EQ(xfer::ParseDuration(" 2H ").value(), 2h);
}

TEST(UnitsTest, ParseDurationRejectsGarbage) {
    EXPECT_FALSE(xfer::ParseDuration("").has_value());
    EXPECT_FALSE(xfer::ParseDuration("abc").has_value());
    EXPECT_FALSE(xfer::ParseDuration("5 fortnights").has_value());
    EXPECT_FALSE(xfer::ParseDuration("1h30").has_value());
    EXPECT_FALSE(xfer::ParseDuration("-5s").has_value());
}

TEST(UnitsTest, ParseByteSizeForms) {
    EXPECT_EQ(xfer::ParseByteSize("50MB").value(), 50'000'000u);
    EXPECT_EQ(xfer::ParseByteSize("1024").value(), 1024u);
    EXPECT_EQ(xfer::ParseByteSize("1KiB").value(), 1024u);
    EXPECT_EQ(xfer::ParseByteSize("1.5GiB").value(), 1'610'612'736u);
    EXPECT_EQ(xfer::ParseByteSize("2 kb").value(), 2000u);
}

TEST(UnitsTest, ParseByteSizeRejectsGarbage) {
    EXPECT_FALSE(xfer::ParseByteSize("").has_value());
    EXPECT_FALSE(xfer::ParseByteSize("MB").has_value());
    EXPECT_FALSE(xfer::ParseByteSize("12 parsecs").has_value());
    EXPECT_FALSE(xfer::ParseByteSize("99999999999TB").has_value());
}

TEST(UnitsTest, FormatDecimalBytes) {
    EXPECT_EQ(xfer::FormatDecimalBytes(0), "0 B");
    EXPECT_EQ(xfer::FormatDecimalBytes(999), "999 B");
    EXPECT_EQ(xfer::FormatDecimalBytes(1234567), "1.23 MB");
    EXPECT_EQ(xfer::FormatDecimalBytes(50'000'000), "50.00 MB");
}

TEST(UnitsTest, FormatDuration) {
    EXPECT_EQ(xfer::FormatDuration(250ms), "250ms");
    EXPECT_EQ(xfer::FormatDuration(90min), "1h 30m");
    EXPECT_EQ(xfer::FormatDuration(1h), "1h");
    EXPECT_EQ(xfer::FormatDuration(25h + 5s), "1d 1h 5s");
}

} // namespace
