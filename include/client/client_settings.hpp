#pragma once

#include "client/server_url.hpp"
#include "util/env.hpp"
#include "util/logger.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>

namespace xfer::config {

// Settings shared by the client commands. Environment first, flags override.
struct ClientSettings {
    std::string server = std::string(kDefaultServerUrl);
    bool no_confirm = false;
    std::string output_dir;
    std::optional<LogLevel> log_level;

    // XFER_CLIENT_RELAY_SERVER, XFER_CLIENT_NOCONFIRM,
    // XFER_CLIENT_DOWNLOAD_DIRECTORY, XFER_LOG.
    Result ApplyEnvironment(const EnvLookup& env = ProcessEnv());
};

} // namespace xfer::config
