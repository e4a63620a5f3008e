#include "client/server_url.hpp"

#include <gtest/gtest.h>

namespace {

TEST(ServerUrlTest, ParsesDefaultServer) {
    auto url = xfer::ParseServerUrl(xfer::kDefaultServerUrl);
    ASSERT_TRUE(url.has_value()) << url.error();
    EXPECT_TRUE(url->Tls());
    EXPECT_EQ(url->host, "xfer.blooym.dev");
    EXPECT_EQ(url->port, "443");
    EXPECT_EQ(url->base_path, "");
    EXPECT_EQ(url->HostHeader(), "xfer.blooym.dev");
    EXPECT_EQ(url->Target("/configuration"), "/configuration");
    EXPECT_TRUE(xfer::IsDefaultServer(*url));
}

TEST(ServerUrlTest, ExplicitPortAndBasePath) {
    auto url = xfer::ParseServerUrl("HTTP://Relay.Example:8080/xfer/");
    ASSERT_TRUE(url.has_value()) << url.error();
    EXPECT_FALSE(url->Tls());
    EXPECT_EQ(url->host, "relay.example");
    EXPECT_EQ(url->port, "8080");
    EXPECT_EQ(url->base_path, "/xfer");
    EXPECT_EQ(url->Target("/transfer"), "/xfer/transfer");
    EXPECT_EQ(url->HostHeader(), "relay.example:8080");
    EXPECT_EQ(url->ToString(), "http://relay.example:8080/xfer/");
    EXPECT_FALSE(xfer::IsDefaultServer(*url));
}

TEST(ServerUrlTest, DefaultServerMatchesWithoutTrailingSlash) {
    auto url = xfer::ParseServerUrl("https://xfer.blooym.dev:443");
    ASSERT_TRUE(url.has_value());
    EXPECT_TRUE(xfer::IsDefaultServer(*url));
}

TEST(ServerUrlTest, BracketedIpv6) {
    auto url = xfer::ParseServerUrl("http://[::1]:8255");
    ASSERT_TRUE(url.has_value()) << url.error();
    EXPECT_EQ(url->host, "::1");
    EXPECT_EQ(url->port, "8255");
    EXPECT_EQ(url->HostHeader(), "[::1]:8255");
}

TEST(ServerUrlTest, RejectsUnsupportedInput) {
    for (const char* bad : {"xfer.blooym.dev", "ftp://host/", "http://", "http://user@host/",
                            "http://host:0/", "http://host:99999/", "http://[::1/"}) {
        EXPECT_FALSE(xfer::ParseServerUrl(bad).has_value()) << bad;
    }
}

} // namespace
