#include "xfer/archiver.hpp"

#include "io/file_reader.hpp"
#include "io/gzip_reader.hpp"
#include "io/gzip_writer.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"
#include "xfer/archive_io.hpp"
#include "xfer/archive_path_policy.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <memory>
#include <vector>

namespace xfer {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kPackStage = "archive";
constexpr std::string_view kUnpackStage = "unpack";

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

struct EntryDeleter {
    void operator()(archive_entry* e) const {
        if (e) archive_entry_free(e);
    }
};

struct PackItem {
    fs::path source;
    std::string name; // path inside the archive
};

Result CollectItems(const fs::path& root, const std::string& root_name, std::vector<PackItem>& out,
                    std::uint64_t& total_bytes) {
    std::error_code ec;
    const auto st = fs::status(root, ec);
    if (ec) {
        return Result::Fail(ErrorKind::Io, ec.value(),
                            "failed while trying to read '" + root.string() + "': " + ec.message());
    }

    out.push_back({root, root_name});
    if (fs::is_regular_file(st)) {
        std::error_code size_ec;
        const auto size = fs::file_size(root, size_ec);
        if (!size_ec) total_bytes += size;
        return Result::Ok();
    }
    if (!fs::is_directory(st)) {
        return Result::Fail(ErrorKind::Validation,
                            "could not determine if '" + root.string() + "' is a file or directory");
    }

    std::vector<PackItem> children;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path rel = it->path().lexically_relative(root);
        children.push_back({it->path(), root_name + "/" + rel.generic_string()});
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && !it->is_symlink(entry_ec)) {
            const auto size = it->file_size(entry_ec);
            if (!entry_ec) total_bytes += size;
        }
    }
    if (ec) {
        return Result::Fail(ErrorKind::Io, ec.value(),
                            "failed to walk directory '" + root.string() + "': " + ec.message());
    }

    std::sort(children.begin(), children.end(),
              [](const PackItem& a, const PackItem& b) { return a.name < b.name; });
    out.insert(out.end(), children.begin(), children.end());
    return Result::Ok();
}

Result PackImpl(const Archiver::Options& opt, const std::string& path, IWriter& out) {
    std::error_code ec;
    const fs::path root = fs::canonical(fs::path(path), ec);
    if (ec) {
        return Result::Fail(ErrorKind::Validation, ec.value(),
                            "failed while trying to read file or directory at '" + path + "': " + ec.message());
    }
    const std::string root_name = root.filename().string();
    if (root_name.empty()) {
        return Result::Fail(ErrorKind::Validation, "failed to read file or directory name of '" + path + "'");
    }

    std::vector<PackItem> items;
    std::uint64_t total_bytes = 0;
    auto cr = CollectItems(root, root_name, items, total_bytes);
    if (!cr.is_ok()) return cr;

    GzipWriter gz(out);
    ArchiveWriteSink sink(gz);

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_new());
    if (!aw) return Result::Fail(ErrorKind::Archive, "archive_write_new failed");
    if (archive_write_set_format_pax_restricted(aw.get()) != ARCHIVE_OK) {
        return Result::Fail(ErrorKind::Archive, "archive_write_set_format_pax_restricted: " + ArchiveErr(aw.get()));
    }
    archive_write_set_bytes_in_last_block(aw.get(), 1);
    if (sink.Open(aw.get()) != ARCHIVE_OK) {
        return Result::Fail(ErrorKind::Archive, "archive_write_open: " + ArchiveErr(aw.get()));
    }

    std::unique_ptr<archive, ArchiveReadDeleter> disk(archive_read_disk_new());
    if (!disk) return Result::Fail(ErrorKind::Archive, "archive_read_disk_new failed");
    archive_read_disk_set_standard_lookup(disk.get());
    archive_read_disk_set_symlink_physical(disk.get());

    auto write_failed = [&](const char* what) {
        if (!sink.LastError().is_ok()) return sink.LastError().WithContext(what);
        return Result::Fail(ErrorKind::Archive, std::string(what) + ": " + ArchiveErr(aw.get()));
    };

    std::uint64_t packed = 0;
    std::vector<std::uint8_t> buf(64 * 1024);

    for (const auto& item : items) {
        std::unique_ptr<archive_entry, EntryDeleter> entry(archive_entry_new());
        if (!entry) return Result::Fail(ErrorKind::Archive, "archive_entry_new failed");

        const std::string source = item.source.string();
        archive_entry_copy_sourcepath(entry.get(), source.c_str());
        archive_entry_copy_pathname(entry.get(), item.name.c_str());
        if (archive_read_disk_entry_from_file(disk.get(), entry.get(), -1, nullptr) < ARCHIVE_WARN) {
            return Result::Fail(ErrorKind::Io, "failed to read metadata of '" + source + "': " + ArchiveErr(disk.get()));
        }

        const auto type = archive_entry_filetype(entry.get());
        if (type != AE_IFREG && type != AE_IFDIR && type != AE_IFLNK) {
            LogWarn("Skipping special file '%s'", source.c_str());
            continue;
        }

        LogDebug("pack: %s", item.name.c_str());
        if (archive_write_header(aw.get(), entry.get()) < ARCHIVE_WARN) {
            return write_failed("archive_write_header");
        }

        if (type == AE_IFREG && archive_entry_size(entry.get()) > 0) {
            FileReader reader;
            auto orr = FileReader::Open(source, reader);
            if (!orr.is_ok()) return orr;

            while (true) {
                const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
                if (n == 0) break;
                if (n < 0) return Result::Fail(ErrorKind::Io, errno, "read failed: " + source);
                if (CancelRequested()) return Result::Fail(ErrorKind::Io, EINTR, "interrupted");

                const la_ssize_t w = archive_write_data(aw.get(), buf.data(), static_cast<size_t>(n));
                if (w != n) return write_failed("archive_write_data");

                packed += static_cast<std::uint64_t>(n);
                if (opt.progress_sink) {
                    ProgressEvent e{};
                    e.stage = kPackStage;
                    e.done = packed;
                    e.total = total_bytes;
                    opt.progress_sink->OnProgress(e);
                }
            }
        }
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return write_failed("archive_write_close");
    }
    auto fr = gz.Finish();
    if (!fr.is_ok()) return fr.WithContext("failed to finish compressed stream");

    LogDebug("packed %zu entries (%llu bytes of file data)", items.size(), (unsigned long long)packed);
    return Result::Ok();
}

Result UnpackImpl(const Archiver::Options& opt, IReader& in, const std::string& dst_dir, std::string* root_name) {
    const fs::path base_dir(dst_dir);

    std::error_code ec;
    if (!fs::exists(base_dir, ec) || ec) {
        return Result::Fail(ErrorKind::Validation, "Destination directory does not exist: " + dst_dir);
    }
    if (!fs::is_directory(base_dir, ec) || ec) {
        return Result::Fail(ErrorKind::Validation, "Destination path is not a directory: " + dst_dir);
    }

    GzipReader gz(in);
    ArchiveReadSource source(gz);

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(ErrorKind::Archive, "archive_read_new failed");

    archive_read_support_format_tar(ar.get());

    if (source.Open(ar.get()) != ARCHIVE_OK) {
        return Result::Fail(ErrorKind::Archive, "archive_read_open: " + ArchiveErr(ar.get()));
    }

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Result::Fail(ErrorKind::Archive, "archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_PERM;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    // Entry paths are rewritten to absolute paths under dst_dir, so
    // NOABSOLUTEPATHS would reject every valid extraction target.

    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    ArchivePathPolicy path_policy;
    std::uint64_t extracted = 0;
    archive_entry* entry = nullptr;

    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return Result::Fail(ErrorKind::Archive, "archive_read_next_header: " + ArchiveErr(ar.get()));
        }

        std::string rel;
        auto path_res = path_policy.AcceptEntry(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;
        if (rel.empty()) {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_copy_pathname(entry, target_path.c_str());

        std::string rel_hl;
        auto hl_res = path_policy.AcceptLinkTarget(archive_entry_hardlink(entry), rel_hl);
        if (!hl_res.is_ok()) return hl_res;
        if (!rel_hl.empty()) {
            const std::string hardlink_target = (base_dir / fs::path(rel_hl)).string();
            archive_entry_copy_hardlink(entry, hardlink_target.c_str());
        }

        LogDebug("unpack: %s", target_path.c_str());

        const int wh = archive_write_header(aw.get(), entry);
        if (wh != ARCHIVE_OK && wh != ARCHIVE_WARN) {
            return Result::Fail(ErrorKind::Io, "archive_write_header: " + ArchiveErr(aw.get()));
        }

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) {
                return Result::Fail(ErrorKind::Archive, "archive_read_data_block: " + ArchiveErr(ar.get()));
            }

            const la_ssize_t ww = archive_write_data_block(aw.get(), buff, size, offset);
            if (ww != ARCHIVE_OK) {
                return Result::Fail(ErrorKind::Io, "archive_write_data_block: " + ArchiveErr(aw.get()));
            }

            extracted += static_cast<std::uint64_t>(size);
            if (opt.progress_sink) {
                ProgressEvent e{};
                e.stage = kUnpackStage;
                e.done = extracted;
                opt.progress_sink->OnProgress(e);
            }
        }

        const int wf = archive_write_finish_entry(aw.get());
        if (wf != ARCHIVE_OK && wf != ARCHIVE_WARN) {
            return Result::Fail(ErrorKind::Io, "archive_write_finish_entry: " + ArchiveErr(aw.get()));
        }
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return Result::Fail(ErrorKind::Io, "archive_write_close: " + ArchiveErr(aw.get()));
    }
    if (path_policy.Root().empty()) {
        return Result::Fail(ErrorKind::Archive, "archive contains no entries");
    }
    if (root_name) *root_name = path_policy.Root();
    return Result::Ok();
}

} // namespace

Result Archiver::Pack(const std::string& path, IWriter& out) const {
    try {
        return PackImpl(opt_, path, out);
    } catch (const std::exception& e) {
        return Result::Fail(ErrorKind::Archive, std::string("failed to create archive: ") + e.what());
    }
}

Result Archiver::Unpack(IReader& in, const std::string& dst_dir, std::string* root_name) const {
    try {
        return UnpackImpl(opt_, in, dst_dir, root_name);
    } catch (const std::exception& e) {
        return Result::Fail(ErrorKind::Archive, std::string("failed to unpack archive: ") + e.what());
    }
}

} // namespace xfer
