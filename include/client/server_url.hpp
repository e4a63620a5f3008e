#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace xfer {

inline constexpr std::string_view kDefaultServerUrl = "https://xfer.blooym.dev/";

// Base URL of a relay server. Only http and https are supported.
struct ServerUrl {
    std::string scheme;     // "http" or "https"
    std::string host;       // without IPv6 brackets
    std::string port;       // explicit or scheme default
    std::string base_path;  // no trailing slash, may be empty

    bool Tls() const { return scheme == "https"; }
    // base_path + path, where path starts with '/'.
    std::string Target(std::string_view path) const;
    // Value for the Host header.
    std::string HostHeader() const;
    // Canonical form, e.g. "https://xfer.blooym.dev/".
    std::string ToString() const;
};

std::expected<ServerUrl, std::string> ParseServerUrl(std::string_view text);

// True when `url` names the built-in default server.
bool IsDefaultServer(const ServerUrl& url);

} // namespace xfer
