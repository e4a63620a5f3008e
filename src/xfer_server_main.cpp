#include "server/expiry_sweeper.hpp"
#include "server/http_server.hpp"
#include "server/server_settings.hpp"
#include "server/transfer_api.hpp"
#include "server/transfer_store.hpp"
#include "util/logger.hpp"
#include "util/units.hpp"

#include <csignal>
#include <cstdio>
#include <getopt.h>
#include <string>
#include <utility>
#include <vector>

namespace {

using xfer::Result;
using xfer::config::ServerSettings;

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
                 "Usage:\n"
                 "   %s [options]\n"
                 "\n"
                 "Options:\n"
                 "  -a, --address <host:port>          Listen address (default 127.0.0.1:8255)\n"
                 "  -d, --data-path <dir>              Data directory, managed exclusively by the server\n"
                 "  -e, --transfer-expire-after <dur>  Lifetime of a transfer, 1min..31d (default 1h)\n"
                 "  -m, --transfer-max-size <size>     Largest accepted transfer (default 50MB)\n"
                 "  -c, --config <file>                JSON config file\n"
                 "      --log-level <level>            debug|info|warn|error|none\n"
                 "  -h, --help                         Show this help\n"
                 "\n"
                 "Environment: XFER_SERVER_ADDRESS, XFER_SERVER_DATA_DIRECTORY,\n"
                 "XFER_SERVER_TRANSFER_EXPIRE_AFTER, XFER_SERVER_TRANSFER_MAX_SIZE, XFER_LOG\n",
                 argv0);
}

int Fail(const Result& r) {
    std::fprintf(stderr, "ERROR: %s\n", r.message().c_str());
    return 1;
}

} // namespace

int main(int argc, char** argv) {
    enum : int { kOptLogLevel = 1000 };

    std::signal(SIGPIPE, SIG_IGN);

    static option long_opts[] = {
        {"address", required_argument, nullptr, 'a'},
        {"data-path", required_argument, nullptr, 'd'},
        {"transfer-expire-after", required_argument, nullptr, 'e'},
        {"transfer-max-size", required_argument, nullptr, 'm'},
        {"config", required_argument, nullptr, 'c'},
        {"log-level", required_argument, nullptr, kOptLogLevel},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    // Flags win over file and environment, so remember them and apply last.
    std::string config_path;
    std::vector<std::pair<int, std::string>> flags;

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "ha:d:e:m:c:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                break;

            case 'a':
            case 'd':
            case 'e':
            case 'm':
            case kOptLogLevel:
                flags.emplace_back(c, optarg);
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }
    if (optind < argc) {
        std::fprintf(stderr, "Unexpected argument: %s\n", argv[optind]);
        PrintUsage(argv[0]);
        return 2;
    }

    ServerSettings settings = ServerSettings::Defaults();
    if (!config_path.empty()) {
        if (auto r = settings.LoadFile(config_path); !r.is_ok()) return Fail(r.WithContext("config"));
    }
    if (auto r = settings.ApplyEnvironment(); !r.is_ok()) return Fail(r);

    for (const auto& [flag, value] : flags) {
        Result r;
        switch (flag) {
            case 'a': r = settings.SetAddress(value); break;
            case 'd': r = settings.SetDataDirectory(value); break;
            case 'e': r = settings.SetExpireAfter(value); break;
            case 'm': r = settings.SetMaxSize(value); break;
            case kOptLogLevel: r = settings.SetLogLevel(value); break;
        }
        if (!r.is_ok()) return Fail(r);
    }
    if (auto r = settings.Validate(); !r.is_ok()) return Fail(r);

    xfer::Logger::Instance().SetLevel(settings.log_level.value_or(xfer::LogLevel::Info));

    std::shared_ptr<xfer::TransferStore> store;
    xfer::TransferStore::Options store_opt{};
    store_opt.data_dir = settings.data_dir;
    store_opt.expire_after = settings.expire_after;
    if (auto r = xfer::TransferStore::Init(store_opt, store); !r.is_ok()) return Fail(r);

    auto api = std::make_shared<xfer::TransferApi>(store, settings.max_size);

    xfer::HttpServer::Options http_opt{};
    http_opt.host = settings.host;
    http_opt.port = settings.port;
    http_opt.handle_signals = true;
    xfer::HttpServer server(api, http_opt);
    if (auto r = server.Listen(); !r.is_ok()) return Fail(r);

    LogInfo("Transfers expire after %s, max size %s", xfer::FormatDuration(settings.expire_after).c_str(),
            xfer::FormatDecimalBytes(settings.max_size).c_str());

    xfer::ExpirySweeper sweeper(store, settings.sweep_interval);
    sweeper.Start();

    server.Run();
    sweeper.Stop();
    return 0;
}
