#pragma once

#include "client/api_client.hpp"
#include "client/confirm.hpp"
#include "util/result.hpp"
#include "xfer/progress.hpp"
#include "xfer/transfer_key.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace xfer {

struct UploadReceipt {
    // The user answered no; nothing was archived or sent.
    bool declined = false;
    std::string source_name;
    TransferKey key;
    std::chrono::system_clock::time_point expires_at;
};

struct DownloadReceipt {
    // The user answered no; nothing was downloaded or written.
    bool declined = false;
    std::optional<std::uint64_t> size;
    std::string output_dir;
    // Path of the extracted file or directory inside output_dir.
    std::string extracted_path;
};

// Upload: confirm, fetch server limits, archive, check size, encrypt, check
// size again, upload. Download: check output dir, parse key, probe size,
// confirm, download, decrypt, unpack. The first failure aborts the whole
// command; intermediate files live in a private temporary directory that is
// removed either way.
class TransferClient {
  public:
    struct Options {
        IConfirm* confirm = nullptr;  // nullptr confirms everything
        IProgress* progress = nullptr;
    };

    TransferClient(ApiClient api, Options opt);

    Result Upload(const std::string& path, UploadReceipt& out) const;
    Result Download(std::string_view transfer_key, const std::string& output_dir, DownloadReceipt& out) const;

  private:
    ApiClient api_;
    Options opt_;
};

// "on 19-10-2026 at 14:03:00 (UTC+02:00)" in local time.
std::string FormatExpiry(std::chrono::system_clock::time_point t);

// What the uploader is told after a successful upload, including the
// command the recipient has to run.
std::string FormatUploadSummary(const UploadReceipt& receipt, const ServerUrl& server, std::string_view program);

} // namespace xfer
