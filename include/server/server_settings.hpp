#pragma once

#include "util/env.hpp"
#include "util/logger.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace xfer::config {

inline constexpr std::chrono::milliseconds kMinExpireAfter = std::chrono::minutes(1);
inline constexpr std::chrono::milliseconds kMaxExpireAfter = std::chrono::hours(24 * 31);

// Settings of xfer-server. Later sources override earlier ones: defaults,
// JSON config file, XFER_SERVER_* environment, command line.
struct ServerSettings {
    std::string host = "127.0.0.1";
    std::uint16_t port = 8255;
    std::string data_dir;
    std::chrono::milliseconds expire_after = std::chrono::hours(1);
    std::uint64_t max_size = 50'000'000;
    std::chrono::milliseconds sweep_interval = std::chrono::seconds(60);
    std::optional<LogLevel> log_level;

    static ServerSettings Defaults(const EnvLookup& env = ProcessEnv());

    // Setters shared by every source. Failures are ErrorKind::Validation.
    Result SetAddress(std::string_view v);
    Result SetDataDirectory(std::string_view v);
    Result SetExpireAfter(std::string_view v);
    Result SetMaxSize(std::string_view v);
    Result SetSweepInterval(std::string_view v);
    Result SetLogLevel(std::string_view v);

    // Keys: Address, DataDirectory, TransferExpireAfter, TransferMaxSize,
    // SweepInterval, LogLevel. Unknown keys are ignored.
    Result LoadFile(const std::string& path);
    Result ApplyEnvironment(const EnvLookup& env = ProcessEnv());
    Result Validate() const;

    std::string Address() const;
};

// "host:port", "[v6]:port" or ":port" (all interfaces).
Result ParseListenAddress(std::string_view v, std::string& host, std::uint16_t& port);

// $XDG_DATA_HOME/xfer-server, falling back to ~/.local/share/xfer-server.
std::string DefaultDataDirectory(const EnvLookup& env = ProcessEnv());

} // namespace xfer::config
