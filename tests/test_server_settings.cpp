#include "server/server_settings.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <map>

using namespace std::chrono_literals;
using xfer::config::ServerSettings;

namespace {

xfer::config::EnvLookup FakeEnv(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const char* name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

TEST(ServerSettingsTest, DefaultsFollowXdgDataHome) {
    auto s = ServerSettings::Defaults(FakeEnv({{"XDG_DATA_HOME", "/srv/data"}}));
    EXPECT_EQ(s.host, "127.0.0.1");
    EXPECT_EQ(s.port, 8255);
    EXPECT_EQ(s.data_dir, "/srv/data/xfer-server");
    EXPECT_EQ(s.expire_after, 1h);
    EXPECT_EQ(s.max_size, 50'000'000u);
    EXPECT_TRUE(s.Validate().ok);

    auto home = ServerSettings::Defaults(FakeEnv({{"HOME", "/home/u"}}));
    EXPECT_EQ(home.data_dir, "/home/u/.local/share/xfer-server");
}

TEST(ServerSettingsTest, EnvironmentOverridesDefaults) {
    auto s = ServerSettings::Defaults(FakeEnv({}));
    auto r = s.ApplyEnvironment(FakeEnv({
        {"XFER_SERVER_ADDRESS", "0.0.0.0:9000"},
        {"XFER_SERVER_DATA_DIRECTORY", "/var/lib/xfer"},
        {"XFER_SERVER_TRANSFER_EXPIRE_AFTER", "2h"},
        {"XFER_SERVER_TRANSFER_MAX_SIZE", "1GB"},
        {"XFER_LOG", "debug"},
    }));
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(s.Address(), "0.0.0.0:9000");
    EXPECT_EQ(s.data_dir, "/var/lib/xfer");
    EXPECT_EQ(s.expire_after, 2h);
    EXPECT_EQ(s.max_size, 1'000'000'000u);
    EXPECT_EQ(s.log_level, xfer::LogLevel::Debug);
}

TEST(ServerSettingsTest, BadEnvironmentValueNamesVariable) {
    auto s = ServerSettings::Defaults(FakeEnv({}));
    auto r = s.ApplyEnvironment(FakeEnv({{"XFER_SERVER_TRANSFER_MAX_SIZE", "lots"}}));
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, xfer::ErrorKind::Validation);
    EXPECT_NE(r.msg.find("XFER_SERVER_TRANSFER_MAX_SIZE"), std::string::npos);
}

TEST(ServerSettingsTest, LoadsJsonFile) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.File("server.json");
    testutil::WriteFile(path, R"({
        "Address": "[::1]:8300",
        "TransferExpireAfter": "30m",
        "TransferMaxSize": 1048576,
        "SweepInterval": "15s",
        "Unrelated": true
    })");

    auto s = ServerSettings::Defaults(FakeEnv({}));
    auto r = s.LoadFile(path);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(s.host, "::1");
    EXPECT_EQ(s.port, 8300);
    EXPECT_EQ(s.Address(), "[::1]:8300");
    EXPECT_EQ(s.expire_after, 30min);
    EXPECT_EQ(s.max_size, 1048576u);
    EXPECT_EQ(s.sweep_interval, 15s);
}

TEST(ServerSettingsTest, MalformedJsonFails) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.File("broken.json");
    testutil::WriteFile(path, "{ not json");

    auto s = ServerSettings::Defaults(FakeEnv({}));
    auto r = s.LoadFile(path);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, xfer::ErrorKind::Validation);
}

TEST(ServerSettingsTest, JsonValueOfWrongTypeNamesKey) {
    testutil::TemporaryDirectory tmp;
    for (const char* body : {R"({"TransferMaxSize": -5})", R"({"TransferMaxSize": true})",
                             R"({"TransferMaxSize": [1]})"}) {
        const std::string path = tmp.File("bad.json");
        testutil::WriteFile(path, body);
        auto s = ServerSettings::Defaults(FakeEnv({}));
        auto r = s.LoadFile(path);
        ASSERT_FALSE(r.ok) << body;
        EXPECT_EQ(r.kind, xfer::ErrorKind::Validation);
        EXPECT_NE(r.msg.find("TransferMaxSize"), std::string::npos) << r.msg;
    }
}

TEST(ServerSettingsTest, JsonRootMustBeObject) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.File("list.json");
    testutil::WriteFile(path, "[1, 2]");
    auto s = ServerSettings::Defaults(FakeEnv({}));
    EXPECT_FALSE(s.LoadFile(path).ok);
}

TEST(ServerSettingsTest, ExpiryBounds) {
    auto s = ServerSettings::Defaults(FakeEnv({}));
    ASSERT_TRUE(s.SetExpireAfter("59s").ok);
    EXPECT_FALSE(s.Validate().ok);
    ASSERT_TRUE(s.SetExpireAfter("1min").ok);
    EXPECT_TRUE(s.Validate().ok);
    ASSERT_TRUE(s.SetExpireAfter("31d").ok);
    EXPECT_TRUE(s.Validate().ok);
    ASSERT_TRUE(s.SetExpireAfter("32d").ok);
    EXPECT_FALSE(s.Validate().ok);
}

TEST(ServerSettingsTest, ZeroMaxSizeIsInvalid) {
    auto s = ServerSettings::Defaults(FakeEnv({}));
    ASSERT_TRUE(s.SetMaxSize("0").ok);
    EXPECT_FALSE(s.Validate().ok);
}

TEST(ServerSettingsTest, ParseListenAddressForms) {
    std::string host;
    std::uint16_t port = 0;
    ASSERT_TRUE(xfer::config::ParseListenAddress(":8080", host, port).ok);
    EXPECT_EQ(host, "0.0.0.0");
    EXPECT_EQ(port, 8080);

    EXPECT_FALSE(xfer::config::ParseListenAddress("localhost", host, port).ok);
    EXPECT_FALSE(xfer::config::ParseListenAddress("1.2.3.4:70000", host, port).ok);
    EXPECT_FALSE(xfer::config::ParseListenAddress("::1:80", host, port).ok);
    EXPECT_FALSE(xfer::config::ParseListenAddress("1.2.3.4:", host, port).ok);
}

} // namespace
