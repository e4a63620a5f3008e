#include "server/server_settings.hpp"

#include "util/config_json_utils.hpp"
#include "util/units.hpp"

#include <charconv>

namespace xfer::config {

namespace {

constexpr const char* kAppDir = "xfer-server";

Result Invalid(const std::string& what, std::string_view value, const std::string& why) {
    return Result::Fail(ErrorKind::Validation, "invalid " + what + " '" + std::string(value) + "': " + why);
}

} // namespace

std::string DefaultDataDirectory(const EnvLookup& env) {
    if (auto xdg = env("XDG_DATA_HOME")) return *xdg + "/" + kAppDir;
    if (auto home = env("HOME")) return *home + "/.local/share/" + kAppDir;
    return std::string("./") + kAppDir;
}

Result ParseListenAddress(std::string_view v, std::string& host, std::uint16_t& port) {
    const auto colon = v.rfind(':');
    if (colon == std::string_view::npos) return Invalid("address", v, "expected host:port");

    std::string_view h = v.substr(0, colon);
    const std::string_view p = v.substr(colon + 1);
    if (h.size() >= 2 && h.front() == '[' && h.back() == ']') {
        h = h.substr(1, h.size() - 2);
    } else if (h.find(':') != std::string_view::npos) {
        return Invalid("address", v, "IPv6 hosts must be bracketed");
    }

    unsigned value = 0;
    const auto [ptr, ec] = std::from_chars(p.data(), p.data() + p.size(), value);
    if (p.empty() || ec != std::errc{} || ptr != p.data() + p.size() || value > 65535) {
        return Invalid("address", v, "bad port");
    }

    host = h.empty() ? "0.0.0.0" : std::string(h);
    port = static_cast<std::uint16_t>(value);
    return Result::Ok();
}

ServerSettings ServerSettings::Defaults(const EnvLookup& env) {
    ServerSettings s;
    s.data_dir = DefaultDataDirectory(env);
    return s;
}

Result ServerSettings::SetAddress(std::string_view v) { return ParseListenAddress(v, host, port); }

Result ServerSettings::SetDataDirectory(std::string_view v) {
    if (v.empty()) return Invalid("data directory", v, "empty");
    data_dir = std::string(v);
    return Result::Ok();
}

Result ServerSettings::SetExpireAfter(std::string_view v) {
    auto d = ParseDuration(v);
    if (!d) return Invalid("transfer expiry", v, d.error());
    expire_after = *d;
    return Result::Ok();
}

Result ServerSettings::SetMaxSize(std::string_view v) {
    auto n = ParseByteSize(v);
    if (!n) return Invalid("transfer max size", v, n.error());
    max_size = *n;
    return Result::Ok();
}

Result ServerSettings::SetSweepInterval(std::string_view v) {
    auto d = ParseDuration(v);
    if (!d) return Invalid("sweep interval", v, d.error());
    sweep_interval = *d;
    return Result::Ok();
}

Result ServerSettings::SetLogLevel(std::string_view v) {
    auto lvl = ParseLogLevel(v);
    if (!lvl) return Invalid("log level", v, "expected debug|info|warn|error|none");
    log_level = *lvl;
    return Result::Ok();
}

Result ServerSettings::LoadFile(const std::string& path) {
    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorKind::Validation, err);
    }

    struct Field {
        const char* key;
        Result (ServerSettings::*set)(std::string_view);
    };
    static constexpr Field kFields[] = {
        {"Address", &ServerSettings::SetAddress},
        {"DataDirectory", &ServerSettings::SetDataDirectory},
        {"TransferExpireAfter", &ServerSettings::SetExpireAfter},
        {"TransferMaxSize", &ServerSettings::SetMaxSize},
        {"SweepInterval", &ServerSettings::SetSweepInterval},
        {"LogLevel", &ServerSettings::SetLogLevel},
    };

    for (const auto& f : kFields) {
        const auto value = detail::ScalarSetting(json, f.key, err);
        if (!err.empty()) return Result::Fail(ErrorKind::Validation, err + " in " + path);
        if (!value) continue;
        auto r = (this->*f.set)(*value);
        if (!r.is_ok()) return r.WithContext(path);
    }
    return Result::Ok();
}

Result ServerSettings::ApplyEnvironment(const EnvLookup& env) {
    struct Var {
        const char* name;
        Result (ServerSettings::*set)(std::string_view);
    };
    static constexpr Var kVars[] = {
        {"XFER_SERVER_ADDRESS", &ServerSettings::SetAddress},
        {"XFER_SERVER_DATA_DIRECTORY", &ServerSettings::SetDataDirectory},
        {"XFER_SERVER_TRANSFER_EXPIRE_AFTER", &ServerSettings::SetExpireAfter},
        {"XFER_SERVER_TRANSFER_MAX_SIZE", &ServerSettings::SetMaxSize},
        {"XFER_LOG", &ServerSettings::SetLogLevel},
    };

    for (const auto& v : kVars) {
        auto value = env(v.name);
        if (!value) continue;
        auto r = (this->*v.set)(*value);
        if (!r.is_ok()) return r.WithContext(v.name);
    }
    return Result::Ok();
}

Result ServerSettings::Validate() const {
    if (expire_after < kMinExpireAfter || expire_after > kMaxExpireAfter) {
        return Result::Fail(ErrorKind::Validation, "transfer expiry " + FormatDuration(expire_after) +
                                                       " is outside [" + FormatDuration(kMinExpireAfter) +
                                                       ", " + FormatDuration(kMaxExpireAfter) + "]");
    }
    if (max_size == 0) {
        return Result::Fail(ErrorKind::Validation, "transfer max size must be greater than zero");
    }
    if (sweep_interval <= std::chrono::milliseconds::zero()) {
        return Result::Fail(ErrorKind::Validation, "sweep interval must be positive");
    }
    if (data_dir.empty()) {
        return Result::Fail(ErrorKind::Validation, "data directory is empty");
    }
    return Result::Ok();
}

std::string ServerSettings::Address() const {
    const bool v6 = host.find(':') != std::string::npos;
    return (v6 ? "[" + host + "]" : host) + ":" + std::to_string(port);
}

} // namespace xfer::config
