#include "client/transfer_client.hpp"

#include "client/temp_dir.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "util/logger.hpp"
#include "util/units.hpp"
#include "xfer/archiver.hpp"
#include "xfer/cipher.hpp"

#include <openssl/crypto.h>

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <unistd.h>

namespace xfer {

namespace fs = std::filesystem;

namespace {

constexpr const char* kArchiveName = "archive.tar.gz";
constexpr const char* kSealedName = "archive.enc";

// Wipes the key when leaving scope.
struct ScopedKey {
    CipherKey key{};
    ~ScopedKey() { OPENSSL_cleanse(key.data(), key.size()); }
};

void Discard(const std::string& path) {
    if (::unlink(path.c_str()) != 0) LogDebug("Could not remove %s", path.c_str());
}

Result TooLarge(const char* what, std::uint64_t size, std::uint64_t limit) {
    return Result::Fail(ErrorKind::Validation, std::string(what) + " is larger than the server's maximum size of " +
                                                   FormatDecimalBytes(limit) + " (was " + FormatDecimalBytes(size) +
                                                   ")");
}

} // namespace

TransferClient::TransferClient(ApiClient api, Options opt) : api_(std::move(api)), opt_(opt) {
    static AlwaysConfirm always;
    if (!opt_.confirm) opt_.confirm = &always;
}

Result TransferClient::Upload(const std::string& path, UploadReceipt& out) const {
    std::error_code ec;
    const fs::path source = fs::canonical(path, ec);
    if (ec) {
        return Result::Fail(ErrorKind::Validation, "cannot read file or directory '" + path + "': " + ec.message());
    }
    const auto st = fs::status(source, ec);
    if (ec || !(fs::is_regular_file(st) || fs::is_directory(st))) {
        return Result::Fail(ErrorKind::Validation, "'" + source.string() + "' is neither a file nor a directory");
    }

    out = UploadReceipt{};
    out.source_name = source.filename().string();
    if (!opt_.confirm->Ask("Are you sure you want to upload '" + source.string() + "'?")) {
        out.declined = true;
        return Result::Ok();
    }

    ServerConfiguration server_cfg;
    auto r = api_.GetConfiguration(server_cfg);
    if (!r.is_ok()) return r.WithContext("Failed to obtain server configuration, are you using the right server?");

    TempDir tmp;
    r = TempDir::Create(tmp);
    if (!r.is_ok()) return r;

    // Archiving
    LogInfo("Creating transfer archive for '%s'", source.c_str());
    FileWriter archive;
    r = FileWriter::Create(tmp.File(kArchiveName), archive, true);
    if (!r.is_ok()) return r;
    Archiver::Options arch_opt{};
    arch_opt.progress_sink = opt_.progress;
    r = Archiver(arch_opt).Pack(source.string(), archive);
    if (!r.is_ok()) return r.WithContext("Failed to create transfer archive");
    archive.Close();

    if (archive.BytesWritten() > server_cfg.max_size) {
        return TooLarge("Transfer archive", archive.BytesWritten(), server_cfg.max_size);
    }

    // Encrypting
    ScopedKey key;
    r = GenerateKey(key.key);
    if (!r.is_ok()) return r;

    FileWriter sealed;
    {
        FileReader plain;
        r = FileReader::Open(archive.Path(), plain);
        if (!r.is_ok()) return r;
        r = FileWriter::Create(tmp.File(kSealedName), sealed, true);
        if (!r.is_ok()) return r;
        r = EncryptStream(plain, sealed, key.key, opt_.progress);
        if (!r.is_ok()) return r.WithContext("Failed to encrypt transfer archive");
        sealed.Close();
    }
    Discard(archive.Path());

    if (sealed.BytesWritten() > server_cfg.max_size) {
        return TooLarge("Encrypted transfer archive", sealed.BytesWritten(), server_cfg.max_size);
    }

    // Uploading
    LogInfo("Uploading encrypted transfer archive (%s)", FormatDecimalBytes(sealed.BytesWritten()).c_str());
    FileReader upload;
    r = FileReader::Open(sealed.Path(), upload);
    if (!r.is_ok()) return r;
    std::string id;
    r = api_.CreateTransfer(upload, id, opt_.progress);
    if (!r.is_ok()) return r.WithContext("Failed to upload encrypted transfer archive");

    out.key.id = std::move(id);
    out.key.key_hex = KeyToHex(key.key);
    out.expires_at = std::chrono::system_clock::now() + server_cfg.expire_after;
    return Result::Ok();
}

Result TransferClient::Download(std::string_view transfer_key, const std::string& output_dir,
                                DownloadReceipt& out) const {
    std::error_code ec;
    const auto st = fs::status(output_dir, ec);
    if (!fs::exists(st)) {
        return Result::Fail(ErrorKind::Validation, "output directory '" + output_dir + "' does not exist");
    }
    if (!fs::is_directory(st)) {
        return Result::Fail(ErrorKind::Validation, "output '" + output_dir + "' must be a directory, not a file");
    }
    const fs::path dest = fs::canonical(output_dir, ec);
    if (ec) return Result::Fail(ErrorKind::Io, ec.value(), "cannot resolve '" + output_dir + "': " + ec.message());

    const auto parsed = ParseTransferKey(transfer_key);
    if (!parsed) {
        return Result::Fail(ErrorKind::Validation,
                            "invalid transfer key (" + parsed.error() + "), please check it was entered correctly");
    }
    ScopedKey key;
    auto r = KeyFromHex(parsed->key_hex, key.key);
    if (!r.is_ok()) return r.WithContext("Invalid transfer key");

    out = DownloadReceipt{};
    TransferMetadata meta;
    r = api_.GetTransferMetadata(parsed->id, meta);
    if (!r.is_ok()) {
        return r.WithContext("Failed to get transfer, it may have expired or the transfer key may be incorrect");
    }
    out.size = meta.size;

    const std::string size_text = meta.size ? FormatDecimalBytes(*meta.size) : "unknown size";
    if (!opt_.confirm->Ask("Are you sure you want to download this transfer (" + size_text + ")?")) {
        out.declined = true;
        return Result::Ok();
    }

    TempDir tmp;
    r = TempDir::Create(tmp);
    if (!r.is_ok()) return r;

    // Download
    FileWriter sealed;
    r = FileWriter::Create(tmp.File(kSealedName), sealed, true);
    if (!r.is_ok()) return r;
    r = api_.DownloadTransfer(parsed->id, sealed, opt_.progress);
    if (!r.is_ok()) return r.WithContext("Failed to download transfer");
    sealed.Close();

    // Decrypt into a staging file; nothing touches the output directory
    // until the whole container has authenticated.
    FileWriter archive;
    {
        FileReader in;
        r = FileReader::Open(sealed.Path(), in);
        if (!r.is_ok()) return r;
        r = FileWriter::Create(tmp.File(kArchiveName), archive, true);
        if (!r.is_ok()) return r;
        r = DecryptStream(in, archive, key.key, opt_.progress);
        if (!r.is_ok()) return r.WithContext("Failed to decrypt transfer archive, ensure the transfer key is correct");
        archive.Close();
    }
    Discard(sealed.Path());

    // Unpack
    FileReader in;
    r = FileReader::Open(archive.Path(), in);
    if (!r.is_ok()) return r;
    Archiver::Options arch_opt{};
    arch_opt.progress_sink = opt_.progress;
    std::string root;
    r = Archiver(arch_opt).Unpack(in, dest.string(), &root);
    if (!r.is_ok()) return r.WithContext("Failed to unpack transfer archive, it may be malformed");

    out.output_dir = dest.string();
    out.extracted_path = (dest / root).string();
    return Result::Ok();
}

std::string FormatExpiry(std::chrono::system_clock::time_point t) {
    const std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    if (localtime_r(&tt, &tm) == nullptr) return "at an unknown time";

    char when[64];
    std::strftime(when, sizeof(when), "on %d-%m-%Y at %H:%M:%S", &tm);
    const long off = tm.tm_gmtoff;
    const long abs_off = off < 0 ? -off : off;
    char zone[16];
    std::snprintf(zone, sizeof(zone), "UTC%c%02ld:%02ld", off < 0 ? '-' : '+', abs_off / 3600, (abs_off % 3600) / 60);
    return std::string(when) + " (" + zone + ")";
}

std::string FormatUploadSummary(const UploadReceipt& receipt, const ServerUrl& server, std::string_view program) {
    std::string cmd = std::string(program) + " download " + receipt.key.ToString();
    if (!IsDefaultServer(server)) cmd += " -s " + server.ToString();
    cmd += " -o <PATH>";

    return "\nCreated transfer for '" + receipt.source_name + "'\n" + "The recipient should run:\n\n" + cmd +
           "\n\nThis transfer will expire " + FormatExpiry(receipt.expires_at) + "\n";
}

} // namespace xfer
