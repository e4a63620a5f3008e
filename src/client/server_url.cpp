#include "client/server_url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace xfer {

namespace {

std::string Lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string DefaultPort(std::string_view scheme) { return scheme == "https" ? "443" : "80"; }

bool ValidPort(std::string_view p) {
    unsigned v = 0;
    const auto [ptr, ec] = std::from_chars(p.data(), p.data() + p.size(), v);
    return !p.empty() && ec == std::errc{} && ptr == p.data() + p.size() && v > 0 && v <= 65535;
}

} // namespace

std::string ServerUrl::Target(std::string_view path) const { return base_path + std::string(path); }

std::string ServerUrl::HostHeader() const {
    const std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port == DefaultPort(scheme)) return h;
    return h + ":" + port;
}

std::string ServerUrl::ToString() const { return scheme + "://" + HostHeader() + base_path + "/"; }

std::expected<ServerUrl, std::string> ParseServerUrl(std::string_view text) {
    const auto sep = text.find("://");
    if (sep == std::string_view::npos) {
        return std::unexpected("missing scheme in '" + std::string(text) + "' (expected http:// or https://)");
    }

    ServerUrl url;
    url.scheme = Lower(text.substr(0, sep));
    if (url.scheme != "http" && url.scheme != "https") {
        return std::unexpected("unsupported scheme '" + url.scheme + "'");
    }

    std::string_view rest = text.substr(sep + 3);
    rest = rest.substr(0, rest.find_first_of("?#"));
    const auto slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    std::string_view path = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash);

    if (authority.find('@') != std::string_view::npos) {
        return std::unexpected("credentials in server URL are not supported");
    }

    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos) return std::unexpected("unterminated IPv6 address");
        url.host = std::string(authority.substr(1, close - 1));
        const auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') return std::unexpected("malformed authority");
            port = after.substr(1);
        }
    } else {
        const auto colon = authority.rfind(':');
        url.host = Lower(authority.substr(0, colon));
        if (colon != std::string_view::npos) port = authority.substr(colon + 1);
    }
    if (url.host.empty()) return std::unexpected("missing host in '" + std::string(text) + "'");

    if (port.empty()) {
        url.port = DefaultPort(url.scheme);
    } else if (ValidPort(port)) {
        url.port = std::string(port);
    } else {
        return std::unexpected("invalid port '" + std::string(port) + "'");
    }

    while (!path.empty() && path.back() == '/') path.remove_suffix(1);
    url.base_path = std::string(path);
    return url;
}

bool IsDefaultServer(const ServerUrl& url) {
    auto def = ParseServerUrl(kDefaultServerUrl);
    return def && def->ToString() == url.ToString();
}

} // namespace xfer
