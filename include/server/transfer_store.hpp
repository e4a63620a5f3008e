#pragma once

#include "io/file_reader.hpp"
#include "io/io.hpp"
#include "server/identifier.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace xfer {

struct TransferInfo {
    std::uint64_t size = 0;
    std::chrono::system_clock::time_point created;
    std::chrono::system_clock::time_point expires;

    // Whole seconds left, never negative.
    std::chrono::seconds Remaining(std::chrono::system_clock::time_point now) const;
};

struct SweepStats {
    std::size_t scanned = 0;
    std::size_t removed = 0;
    std::size_t failed = 0;
};

// Opaque blobs on the local filesystem, one regular file per transfer under
// <data_dir>/transfers. The file's birth time (mtime where the filesystem
// does not report one) plus the TTL gives the expiry; there is no other
// metadata. Safe to share between threads: published files are never
// modified, so no store-wide lock is taken.
class TransferStore {
  public:
    struct Options {
        std::string data_dir;
        std::chrono::milliseconds expire_after{std::chrono::hours(1)};
    };

    // Creates the directory layout if missing. `ids` defaults to the word
    // list generator.
    static Result Init(const Options& opt, std::shared_ptr<TransferStore>& out,
                       std::unique_ptr<IIdentifierGenerator> ids = nullptr);

    TransferStore(const TransferStore&) = delete;
    TransferStore& operator=(const TransferStore&) = delete;

    // Streams `body` into a staging file and publishes it under a fresh
    // identifier. Nothing is visible under the identifier until the body has
    // been fully written and synced.
    Result Create(IReader& body, std::string& out_id);

    // Per-identifier operations. A malformed identifier fails with
    // ErrorKind::Validation before any filesystem access; an absent or
    // expired one with ErrorKind::NotFound.
    Result Exists(const std::string& id, bool& out) const;
    Result Stat(const std::string& id, TransferInfo& out) const;
    Result Read(const std::string& id, FileReader& out, TransferInfo* info = nullptr) const;
    Result Delete(const std::string& id);

    // Deletes every expired entry and stale staging file. Failures on single
    // entries are logged and counted, never returned.
    void RemoveExpired(SweepStats* stats = nullptr);

    std::chrono::milliseconds ExpireAfter() const { return expire_after_; }
    const std::string& Directory() const { return dir_; }

  private:
    TransferStore(std::string dir, std::chrono::milliseconds expire_after,
                  std::unique_ptr<IIdentifierGenerator> ids);

    std::string PathFor(const std::string& id) const { return dir_ + "/" + id; }
    std::string IncomingDir() const { return dir_ + "/.incoming"; }
    void RemoveStaleIncoming(SweepStats& stats);

    std::string dir_;
    std::chrono::milliseconds expire_after_;
    std::unique_ptr<IIdentifierGenerator> ids_;
};

} // namespace xfer
