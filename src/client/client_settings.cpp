#include "client/client_settings.hpp"

namespace xfer::config {

Result ClientSettings::ApplyEnvironment(const EnvLookup& env) {
    if (auto v = env("XFER_CLIENT_RELAY_SERVER")) server = *v;
    if (auto v = env("XFER_CLIENT_DOWNLOAD_DIRECTORY")) output_dir = *v;
    if (auto v = env("XFER_CLIENT_NOCONFIRM")) {
        auto b = ParseBool(*v);
        if (!b) return Result::Fail(ErrorKind::Validation, "XFER_CLIENT_NOCONFIRM: expected a boolean, got '" + *v + "'");
        no_confirm = *b;
    }
    if (auto v = env("XFER_LOG")) {
        auto lvl = ParseLogLevel(*v);
        if (!lvl) return Result::Fail(ErrorKind::Validation, "XFER_LOG: unknown level '" + *v + "'");
        log_level = *lvl;
    }
    return Result::Ok();
}

} // namespace xfer::config
