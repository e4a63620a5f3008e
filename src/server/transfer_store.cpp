#include "server/transfer_store.hpp"

#include "io/file_writer.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

namespace xfer {

namespace fs = std::filesystem;
using Clock = std::chrono::system_clock;

namespace {

constexpr std::string_view kIncomingPrefix = "upload-";

std::string Errno(int e) { return std::string(std::strerror(e)); }

Clock::time_point ToTimePoint(const struct statx_timestamp& ts) {
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(
        std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec)));
}

// statx on `path` relative to `dirfd`, or on `dirfd` itself when `path` is
// empty. Birth time where the filesystem records it, mtime otherwise.
Result StatEntry(int dirfd, const std::string& path, std::chrono::milliseconds ttl,
                 TransferInfo& out) {
    struct statx stx{};
    const int flags = AT_SYMLINK_NOFOLLOW | (path.empty() ? AT_EMPTY_PATH : 0);
    if (::statx(dirfd, path.c_str(), flags, STATX_TYPE | STATX_SIZE | STATX_BTIME | STATX_MTIME, &stx) != 0) {
        const int e = errno;
        return Result::Fail(e == ENOENT ? ErrorKind::NotFound : ErrorKind::Io, e, "statx failed (" + Errno(e) + ")");
    }
    if (!S_ISREG(stx.stx_mode)) {
        return Result::Fail(ErrorKind::Io, "not a regular file");
    }
    out.size = stx.stx_size;
    out.created = (stx.stx_mask & STATX_BTIME) ? ToTimePoint(stx.stx_btime) : ToTimePoint(stx.stx_mtime);
    out.expires = out.created + ttl;
    return Result::Ok();
}

// Well-formed identifiers that cannot be a file name in the transfer
// directory never name a stored transfer.
Result CheckIdentifier(std::string_view id) {
    if (!ValidateIdentifier(id)) {
        return Result::Fail(ErrorKind::Validation, "malformed transfer identifier");
    }
    if (id.find_first_of(std::string_view("/\0", 2)) != std::string_view::npos) {
        return Result::Fail(ErrorKind::NotFound, "transfer not found");
    }
    return Result::Ok();
}

Result EnsureDir(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return Result::Fail(ErrorKind::Io, ec.value(), "create " + path + " failed (" + ec.message() + ")");
    }
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        LogWarn("Could not restrict permissions on %s: %s", path.c_str(), ec.message().c_str());
    }
    return Result::Ok();
}

} // namespace

std::chrono::seconds TransferInfo::Remaining(Clock::time_point now) const {
    if (expires <= now) return std::chrono::seconds(0);
    return std::chrono::duration_cast<std::chrono::seconds>(expires - now);
}

TransferStore::TransferStore(std::string dir, std::chrono::milliseconds expire_after,
                             std::unique_ptr<IIdentifierGenerator> ids)
    : dir_(std::move(dir)), expire_after_(expire_after), ids_(std::move(ids)) {}

Result TransferStore::Init(const Options& opt, std::shared_ptr<TransferStore>& out,
                           std::unique_ptr<IIdentifierGenerator> ids) {
    if (opt.data_dir.empty()) {
        return Result::Fail(ErrorKind::Validation, "data directory is empty");
    }
    if (opt.expire_after <= std::chrono::milliseconds::zero()) {
        return Result::Fail(ErrorKind::Validation, "transfer expiry must be positive");
    }
    if (!ids) ids = std::make_unique<WordlistIdentifierGenerator>();

    const std::string dir = (fs::path(opt.data_dir) / "transfers").string();
    auto r = EnsureDir(dir);
    if (!r.is_ok()) return r.WithContext("Failed to prepare storage");
    r = EnsureDir(dir + "/.incoming");
    if (!r.is_ok()) return r.WithContext("Failed to prepare storage");

    out.reset(new TransferStore(dir, opt.expire_after, std::move(ids)));
    LogInfo("Storing transfers in %s", dir.c_str());
    return Result::Ok();
}

Result TransferStore::Create(IReader& body, std::string& out_id) {
    FileWriter staging;
    auto r = FileWriter::CreateTemp(IncomingDir(), std::string(kIncomingPrefix), staging);
    if (!r.is_ok()) return r.WithContext("Failed to stage transfer");
    const std::string tmp = staging.Path();

    auto discard = [&](const Result& why) {
        staging.Close();
        ::unlink(tmp.c_str());
        return why;
    };

    r = CopyStream(body, staging);
    if (!r.is_ok()) return discard(r.WithContext("Failed to receive transfer"));
    r = staging.FsyncNow();
    if (!r.is_ok()) return discard(r.WithContext("Failed to store transfer"));
    staging.Close();

    std::string id;
    while (true) {
        r = ids_->Generate(id);
        if (!r.is_ok()) return discard(r.WithContext("Failed to pick a transfer identifier"));
        if (::link(tmp.c_str(), PathFor(id).c_str()) == 0) break;
        const int e = errno;
        if (e == EEXIST) {
            LogDebug("Identifier %s already taken, drawing another", id.c_str());
            continue;
        }
        return discard(Result::Fail(ErrorKind::Io, e, "publish transfer failed (" + Errno(e) + ")"));
    }
    if (::unlink(tmp.c_str()) != 0) {
        LogWarn("Could not remove staging file %s: %s", tmp.c_str(), Errno(errno).c_str());
    }

    LogInfo("Stored transfer %s (%llu bytes)", id.c_str(),
            static_cast<unsigned long long>(staging.BytesWritten()));
    out_id = std::move(id);
    return Result::Ok();
}

Result TransferStore::Stat(const std::string& id, TransferInfo& out) const {
    if (auto r = CheckIdentifier(id); !r.is_ok()) return r;
    TransferInfo info;
    auto r = StatEntry(AT_FDCWD, PathFor(id), expire_after_, info);
    if (!r.is_ok()) {
        if (r.kind == ErrorKind::NotFound) return Result::Fail(ErrorKind::NotFound, "transfer not found");
        return r.WithContext("Failed to inspect transfer " + id);
    }
    if (info.expires <= Clock::now()) {
        return Result::Fail(ErrorKind::NotFound, "transfer not found");
    }
    out = info;
    return Result::Ok();
}

Result TransferStore::Exists(const std::string& id, bool& out) const {
    TransferInfo info;
    auto r = Stat(id, info);
    if (r.is_ok()) {
        out = true;
        return r;
    }
    if (r.kind == ErrorKind::NotFound) {
        out = false;
        return Result::Ok();
    }
    return r;
}

Result TransferStore::Read(const std::string& id, FileReader& out, TransferInfo* info) const {
    if (auto r = CheckIdentifier(id); !r.is_ok()) return r;

    Fd fd;
    auto r = Fd::Open(PathFor(id), O_RDONLY | O_NOFOLLOW, 0, fd);
    if (!r.is_ok()) {
        if (r.err == ENOENT) return Result::Fail(ErrorKind::NotFound, "transfer not found");
        return r.WithContext("Failed to open transfer " + id);
    }

    // Stat the descriptor, not the path: a concurrent sweep may unlink the
    // name, but the open file stays intact until it is closed.
    TransferInfo st;
    r = StatEntry(fd.Get(), "", expire_after_, st);
    if (!r.is_ok()) return r.WithContext("Failed to inspect transfer " + id);
    if (st.expires <= Clock::now()) {
        return Result::Fail(ErrorKind::NotFound, "transfer not found");
    }

    out = FileReader::Adopt(std::move(fd), PathFor(id));
    if (info) *info = st;
    return Result::Ok();
}

Result TransferStore::Delete(const std::string& id) {
    if (auto r = CheckIdentifier(id); !r.is_ok()) return r;
    if (::unlink(PathFor(id).c_str()) != 0) {
        const int e = errno;
        if (e == ENOENT) return Result::Fail(ErrorKind::NotFound, "transfer not found");
        return Result::Fail(ErrorKind::Io, e, "delete " + id + " failed (" + Errno(e) + ")");
    }
    LogInfo("Deleted transfer %s", id.c_str());
    return Result::Ok();
}

void TransferStore::RemoveExpired(SweepStats* stats) {
    SweepStats local;
    const auto now = Clock::now();

    std::error_code ec;
    fs::directory_iterator it(dir_, ec);
    if (ec) {
        LogError("Cannot list %s: %s", dir_.c_str(), ec.message().c_str());
        ++local.failed;
    }
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (!ValidateIdentifier(name)) continue;
        ++local.scanned;

        TransferInfo info;
        auto r = StatEntry(AT_FDCWD, it->path().string(), expire_after_, info);
        if (!r.is_ok()) {
            if (r.kind == ErrorKind::NotFound) continue;
            LogWarn("Skipping %s during sweep: %s", name.c_str(), r.message().c_str());
            ++local.failed;
            continue;
        }
        if (info.expires > now) continue;

        if (::unlink(it->path().c_str()) != 0 && errno != ENOENT) {
            LogWarn("Failed to delete expired transfer %s: %s", name.c_str(), Errno(errno).c_str());
            ++local.failed;
            continue;
        }
        LogInfo("Removed expired transfer %s", name.c_str());
        ++local.removed;
    }
    if (ec) {
        LogWarn("Sweep of %s stopped early: %s", dir_.c_str(), ec.message().c_str());
        ++local.failed;
    }

    RemoveStaleIncoming(local);

    LogDebug("Sweep done: scanned=%zu removed=%zu failed=%zu", local.scanned, local.removed, local.failed);
    if (stats) *stats = local;
}

// Staging files are written continuously while an upload is in flight, so
// staleness is judged by mtime: one untouched for a whole TTL was abandoned.
void TransferStore::RemoveStaleIncoming(SweepStats& stats) {
    const auto cutoff = Clock::now() - expire_after_;
    const std::string incoming = IncomingDir();

    std::error_code ec;
    fs::directory_iterator it(incoming, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        struct stat st{};
        if (::lstat(it->path().c_str(), &st) != 0 || !S_ISREG(st.st_mode)) continue;
        const auto mtime = Clock::time_point(std::chrono::duration_cast<Clock::duration>(
            std::chrono::seconds(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec)));
        if (mtime > cutoff) continue;

        if (::unlink(it->path().c_str()) != 0 && errno != ENOENT) {
            LogWarn("Failed to delete stale upload %s: %s", it->path().c_str(), Errno(errno).c_str());
            ++stats.failed;
            continue;
        }
        LogInfo("Removed abandoned upload %s", it->path().filename().c_str());
    }
    if (ec) {
        LogWarn("Cannot list %s: %s", incoming.c_str(), ec.message().c_str());
        ++stats.failed;
    }
}

} // namespace xfer
