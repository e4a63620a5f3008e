#include "io/memory_io.hpp"
#include "testing.hpp"
#include "xfer/archiver.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

class RecordingProgress final : public xfer::IProgress {
  public:
    void OnProgress(const xfer::ProgressEvent& e) override {
        stages.emplace_back(e.stage);
        last_done = e.done;
        last_total = e.total;
    }

    std::vector<std::string> stages;
    std::uint64_t last_done = 0;
    std::uint64_t last_total = 0;
};

// tar.gz holding one small regular file per name.
std::vector<std::uint8_t> HandmadeArchive(const std::vector<std::string>& names) {
    std::vector<std::uint8_t> buf(64 * 1024);
    size_t used = 0;
    archive* a = archive_write_new();
    archive_write_add_filter_gzip(a);
    archive_write_set_format_pax_restricted(a);
    EXPECT_EQ(archive_write_open_memory(a, buf.data(), buf.size(), &used), ARCHIVE_OK);
    for (const auto& name : names) {
        archive_entry* e = archive_entry_new();
        archive_entry_set_pathname(e, name.c_str());
        archive_entry_set_filetype(e, AE_IFREG);
        archive_entry_set_perm(e, 0644);
        archive_entry_set_size(e, 2);
        EXPECT_EQ(archive_write_header(a, e), ARCHIVE_OK);
        EXPECT_EQ(archive_write_data(a, "hi", 2), 2);
        archive_entry_free(e);
    }
    archive_write_close(a);
    archive_write_free(a);
    buf.resize(used);
    return buf;
}

std::vector<std::uint8_t> PackToMemory(const std::string& path) {
    xfer::VectorWriter out;
    auto res = xfer::Archiver().Pack(path, out);
    EXPECT_TRUE(res.ok) << res.msg;
    return out.Take();
}

TEST(ArchiverTest, SingleFileRoundTrip) {
    testutil::TemporaryDirectory src;
    testutil::TemporaryDirectory dst;
    testutil::WriteFile(src.File("hello.txt"), "world");

    const auto packed = PackToMemory(src.File("hello.txt"));
    ASSERT_GE(packed.size(), 2u);
    EXPECT_EQ(packed[0], 0x1F);
    EXPECT_EQ(packed[1], 0x8B);

    xfer::SpanReader in(packed);
    auto res = xfer::Archiver().Unpack(in, dst.Path());
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_EQ(testutil::ReadFile(dst.File("hello.txt")), "world");
}

TEST(ArchiverTest, DirectoryRoundTripKeepsTree) {
    testutil::TemporaryDirectory src;
    testutil::TemporaryDirectory dst;
    const fs::path root = fs::path(src.Path()) / "photos";
    fs::create_directories(root / "2024" / "trip");
    fs::create_directories(root / "empty");
    testutil::WriteFile((root / "a.txt").string(), "alpha");
    const auto big = testutil::PatternBytes(300 * 1024, 3);
    testutil::WriteFile((root / "2024" / "trip" / "b.bin").string(), std::string(big.begin(), big.end()));

    RecordingProgress progress;
    xfer::Archiver::Options opt;
    opt.progress_sink = &progress;
    xfer::VectorWriter out;
    auto pr = xfer::Archiver(opt).Pack(root.string(), out);
    ASSERT_TRUE(pr.ok) << pr.msg;
    ASSERT_FALSE(progress.stages.empty());
    EXPECT_EQ(progress.stages.front(), "archive");
    EXPECT_EQ(progress.last_done, 5u + big.size());
    EXPECT_EQ(progress.last_total, 5u + big.size());

    xfer::SpanReader in(out.Data());
    std::string root_name;
    auto ur = xfer::Archiver().Unpack(in, dst.Path(), &root_name);
    ASSERT_TRUE(ur.ok) << ur.msg;
    EXPECT_EQ(root_name, "photos");

    const fs::path got = fs::path(dst.Path()) / "photos";
    EXPECT_EQ(testutil::ReadFile((got / "a.txt").string()), "alpha");
    EXPECT_EQ(testutil::ReadFile((got / "2024" / "trip" / "b.bin").string()),
              std::string(big.begin(), big.end()));
    EXPECT_TRUE(fs::is_directory(got / "empty"));
}

TEST(ArchiverTest, PackMissingPathIsValidationError) {
    testutil::TemporaryDirectory src;
    xfer::VectorWriter out;
    auto res = xfer::Archiver().Pack(src.File("does-not-exist"), out);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, xfer::ErrorKind::Validation);
}

TEST(ArchiverTest, UnpackGarbageIsArchiveError) {
    testutil::TemporaryDirectory dst;
    const auto garbage = testutil::PatternBytes(4096, 77);
    xfer::SpanReader in(garbage);
    auto res = xfer::Archiver().Unpack(in, dst.Path());
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, xfer::ErrorKind::Archive);
}

TEST(ArchiverTest, UnpackIntoMissingDirectoryIsValidationError) {
    testutil::TemporaryDirectory src;
    testutil::WriteFile(src.File("x"), "x");
    const auto packed = PackToMemory(src.File("x"));

    xfer::SpanReader in(packed);
    auto res = xfer::Archiver().Unpack(in, src.File("nowhere"));
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, xfer::ErrorKind::Validation);
}

} // namespace

TEST(ArchiverTest, UnpackRejectsSecondTopLevelEntry) {
    testutil::TemporaryDirectory dst;
    const auto packed = HandmadeArchive({"first.txt", "second.txt"});
    xfer::SpanReader in(packed);
    auto res = xfer::Archiver().Unpack(in, dst.Path());
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, xfer::ErrorKind::Archive);
    EXPECT_FALSE(fs::exists(dst.File("second.txt")));
}

TEST(ArchiverTest, UnpackRejectsTraversalBeforeWriting) {
    testutil::TemporaryDirectory dst;
    const auto packed = HandmadeArchive({"../escape.txt"});
    xfer::SpanReader in(packed);
    auto res = xfer::Archiver().Unpack(in, dst.Path());
    ASSERT_FALSE(res.ok);
    EXPECT_NE(res.msg.find("Unsafe path in archive"), std::string::npos);
    EXPECT_FALSE(fs::exists(fs::path(dst.Path()).parent_path() / "escape.txt"));
}

TEST(ArchiverTest, UnpackEmptyArchiveFails) {
    testutil::TemporaryDirectory dst;
    const auto packed = HandmadeArchive({});
    xfer::SpanReader in(packed);
    auto res = xfer::Archiver().Unpack(in, dst.Path());
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, xfer::ErrorKind::Archive);
}
