#include "client/api_client.hpp"
#include "client/client_settings.hpp"
#include "client/confirm.hpp"
#include "client/console_progress.hpp"
#include "client/server_url.hpp"
#include "client/transfer_client.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <cstring>
#include <getopt.h>
#include <string>
#include <unistd.h>

namespace {

using xfer::Result;
using xfer::config::ClientSettings;

enum : int { kOptLogLevel = 1000 };

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
                 "Usage:\n"
                 "   %s upload [-y] [-s <url>] <path>\n"
                 "   %s download [-y] [-s <url>] -o <dir> <transfer-key>\n"
                 "\n"
                 "Options:\n"
                 "  -s, --server <url>      Relay server (default %s)\n"
                 "  -o, --output <dir>      Existing directory to unpack a download into\n"
                 "  -y, --yes               Skip confirmation prompts\n"
                 "      --log-level <lvl>   debug|info|warn|error|none (default warn)\n"
                 "  -h, --help              Show this help\n"
                 "\n"
                 "Environment: XFER_CLIENT_RELAY_SERVER, XFER_CLIENT_NOCONFIRM,\n"
                 "XFER_CLIENT_DOWNLOAD_DIRECTORY, XFER_LOG\n",
                 argv0, argv0, std::string(xfer::kDefaultServerUrl).c_str());
}

int Fail(const Result& r) {
    std::fprintf(stderr, "ERROR: %s\n", r.message().c_str());
    return 1;
}

const char* ProgramName(const char* argv0) {
    const char* slash = std::strrchr(argv0, '/');
    return slash ? slash + 1 : argv0;
}

} // namespace

int main(int argc, char** argv) {
    xfer::InstallSignalHandlers();

    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        PrintUsage(argv[0]);
        return argc < 2 ? 2 : 0;
    }
    const std::string command = argv[1];
    if (command != "upload" && command != "download") {
        std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
        PrintUsage(argv[0]);
        return 2;
    }

    ClientSettings settings;
    if (auto r = settings.ApplyEnvironment(); !r.is_ok()) return Fail(r);

    static option long_opts[] = {
        {"server", required_argument, nullptr, 's'},
        {"output", required_argument, nullptr, 'o'},
        {"yes", no_argument, nullptr, 'y'},
        {"log-level", required_argument, nullptr, kOptLogLevel},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    // Options follow the subcommand.
    const int sub_argc = argc - 1;
    char** sub_argv = argv + 1;
    optind = 1;

    int idx = 0;
    int c;
    while ((c = getopt_long(sub_argc, sub_argv, "hys:o:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 's':
                settings.server = optarg;
                break;

            case 'o':
                settings.output_dir = optarg;
                break;

            case 'y':
                settings.no_confirm = true;
                break;

            case kOptLogLevel: {
                auto lvl = xfer::ParseLogLevel(optarg);
                if (!lvl) {
                    std::fprintf(stderr, "Invalid --log-level: %s\n", optarg);
                    return 2;
                }
                settings.log_level = *lvl;
                break;
            }

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }
    if (optind + 1 != sub_argc) {
        PrintUsage(argv[0]);
        return 2;
    }
    const std::string operand = sub_argv[optind];

    xfer::Logger::Instance().SetFormat(xfer::LogFormat{.utc_timestamp = false, .source_location = false});
    xfer::Logger::Instance().SetLevel(settings.log_level.value_or(xfer::LogLevel::Warn));

    auto server = xfer::ParseServerUrl(settings.server);
    if (!server) {
        return Fail(Result::Fail(xfer::ErrorKind::Validation, "invalid server URL: " + server.error()));
    }

    xfer::ConsoleConfirm console_confirm;
    xfer::ConsoleProgress progress;
    xfer::TransferClient::Options opt{};
    opt.confirm = settings.no_confirm ? nullptr : &console_confirm;
    opt.progress = isatty(STDERR_FILENO) ? &progress : nullptr;
    xfer::TransferClient client(xfer::ApiClient(*server), opt);

    if (command == "upload") {
        xfer::UploadReceipt receipt;
        auto r = client.Upload(operand, receipt);
        progress.Finish();
        if (!r.is_ok()) return Fail(r);
        if (receipt.declined) return 0;
        std::fputs(xfer::FormatUploadSummary(receipt, *server, ProgramName(argv[0])).c_str(), stdout);
        return 0;
    }

    if (settings.output_dir.empty()) {
        std::fprintf(stderr, "download requires -o/--output\n");
        PrintUsage(argv[0]);
        return 2;
    }
    xfer::DownloadReceipt receipt;
    auto r = client.Download(operand, settings.output_dir, receipt);
    progress.Finish();
    if (!r.is_ok()) return Fail(r);
    if (receipt.declined) return 0;
    std::printf("Successfully downloaded transfer to '%s'\n", receipt.extracted_path.c_str());
    return 0;
}
