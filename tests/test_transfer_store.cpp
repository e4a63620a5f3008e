#include "server/transfer_store.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <deque>
#include <map>
#include <filesystem>
#include <mutex>
#include <set>
#include <thread>

using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

// Hands out a fixed sequence of identifiers.
class ScriptedIdentifiers final : public xfer::IIdentifierGenerator {
  public:
    explicit ScriptedIdentifiers(std::deque<std::string> ids) : ids_(std::move(ids)) {}

    xfer::Result Generate(std::string& out) override {
        std::lock_guard<std::mutex> lk(mu_);
        out = ids_.front();
        if (ids_.size() > 1) ids_.pop_front();
        ++calls;
        return xfer::Result::Ok();
    }

    int calls = 0;

  private:
    std::mutex mu_;
    std::deque<std::string> ids_;
};

class TransferStoreTest : public ::testing::Test {
  protected:
    std::shared_ptr<xfer::TransferStore> Open(std::chrono::milliseconds ttl = 1h,
                                              std::unique_ptr<xfer::IIdentifierGenerator> ids = nullptr) {
        std::shared_ptr<xfer::TransferStore> store;
        auto r = xfer::TransferStore::Init({.data_dir = tmp.Path(), .expire_after = ttl}, store, std::move(ids));
        EXPECT_TRUE(r.ok) << r.msg;
        return store;
    }

    std::string Put(xfer::TransferStore& store, const std::string& body) {
        testutil::MemoryReader in(body);
        std::string id;
        auto r = store.Create(in, id);
        EXPECT_TRUE(r.ok) << r.msg;
        return id;
    }

    testutil::TemporaryDirectory tmp;
};

TEST_F(TransferStoreTest, InitCreatesLayout) {
    auto store = Open();
    ASSERT_TRUE(store);
    EXPECT_EQ(store->Directory(), tmp.Path() + "/transfers");
    EXPECT_TRUE(fs::is_directory(tmp.Path() + "/transfers/.incoming"));
    EXPECT_EQ(fs::status(store->Directory()).permissions() & fs::perms::all, fs::perms::owner_all);
}

TEST_F(TransferStoreTest, InitRejectsBadOptions) {
    std::shared_ptr<xfer::TransferStore> store;
    EXPECT_EQ(xfer::TransferStore::Init({.data_dir = "", .expire_after = 1h}, store).kind,
              xfer::ErrorKind::Validation);
    EXPECT_EQ(xfer::TransferStore::Init({.data_dir = tmp.Path(), .expire_after = 0ms}, store).kind,
              xfer::ErrorKind::Validation);
    EXPECT_FALSE(store);
}

TEST_F(TransferStoreTest, CreateReadDelete) {
    auto store = Open();
    const std::string id = Put(*store, "world");
    ASSERT_TRUE(xfer::ValidateIdentifier(id)) << id;

    bool exists = false;
    ASSERT_TRUE(store->Exists(id, exists).ok);
    EXPECT_TRUE(exists);

    xfer::FileReader reader;
    xfer::TransferInfo info;
    auto r = store->Read(id, reader, &info);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(info.size, 5u);
    EXPECT_EQ(testutil::ReadAll(reader), "world");

    const auto remaining = info.Remaining(std::chrono::system_clock::now());
    EXPECT_GT(remaining, 3590s);
    EXPECT_LE(remaining, 3600s);

    ASSERT_TRUE(store->Delete(id).ok);
    ASSERT_TRUE(store->Exists(id, exists).ok);
    EXPECT_FALSE(exists);
    EXPECT_EQ(store->Delete(id).kind, xfer::ErrorKind::NotFound);
}

TEST_F(TransferStoreTest, EmptyBodyIsStored) {
    auto store = Open();
    const std::string id = Put(*store, "");
    xfer::TransferInfo info;
    ASSERT_TRUE(store->Stat(id, info).ok);
    EXPECT_EQ(info.size, 0u);
}

TEST_F(TransferStoreTest, MalformedIdentifierIsValidationError) {
    auto store = Open();
    xfer::FileReader reader;
    xfer::TransferInfo info;
    bool exists = true;
    for (const char* id : {"../../etc/passwd", "a-b-c", "a--c-d", ".incoming", ""}) {
        EXPECT_EQ(store->Read(id, reader).kind, xfer::ErrorKind::Validation) << id;
        EXPECT_EQ(store->Stat(id, info).kind, xfer::ErrorKind::Validation) << id;
        EXPECT_EQ(store->Exists(id, exists).kind, xfer::ErrorKind::Validation) << id;
        EXPECT_EQ(store->Delete(id).kind, xfer::ErrorKind::Validation) << id;
    }
}

TEST_F(TransferStoreTest, UnknownIdentifierIsNotFound) {
    auto store = Open();
    xfer::FileReader reader;
    EXPECT_EQ(store->Read("alpha-bravo-charlie-delta", reader).kind, xfer::ErrorKind::NotFound);
    EXPECT_EQ(store->Read("Alpha-b1-c2-D", reader).kind, xfer::ErrorKind::NotFound);
}

TEST_F(TransferStoreTest, WellFormedNameOutsideStoreIsNotFound) {
    auto store = Open();
    const fs::path outside = fs::path(store->Directory()).parent_path() / "secret-x-y-z";
    testutil::WriteFile(outside.string(), "do not serve");

    const std::string id = "../secret-x-y-z";
    ASSERT_TRUE(xfer::ValidateIdentifier(id));
    xfer::FileReader reader;
    xfer::TransferInfo info;
    EXPECT_EQ(store->Read(id, reader).kind, xfer::ErrorKind::NotFound);
    EXPECT_EQ(store->Stat(id, info).kind, xfer::ErrorKind::NotFound);
    EXPECT_EQ(store->Delete(id).kind, xfer::ErrorKind::NotFound);
    EXPECT_EQ(store->Read(std::string("a-b-c-d\0", 8), reader).kind, xfer::ErrorKind::NotFound);
    EXPECT_TRUE(fs::exists(outside));
}

// Generator that fails like an exhausted entropy source.
class BrokenIdentifiers final : public xfer::IIdentifierGenerator {
  public:
    xfer::Result Generate(std::string&) override {
        return xfer::Result::Fail(xfer::ErrorKind::Crypto, "no randomness");
    }
};

TEST_F(TransferStoreTest, GeneratorFailureIsReportedAndCleanedUp) {
    auto store = Open(1h, std::make_unique<BrokenIdentifiers>());
    ASSERT_TRUE(store);
    testutil::MemoryReader in(testutil::Bytes("payload"));
    std::string id;
    auto r = store->Create(in, id);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, xfer::ErrorKind::Crypto);
    EXPECT_NE(r.msg.find("Failed to pick a transfer identifier"), std::string::npos) << r.msg;
    EXPECT_TRUE(id.empty());
    EXPECT_TRUE(fs::is_empty(store->Directory() + "/.incoming"));
}

TEST_F(TransferStoreTest, FailedBodyLeavesNothingBehind) {
    auto store = Open();
    testutil::FailingReader in(10000);
    std::string id;
    auto r = store->Create(in, id);
    ASSERT_FALSE(r.ok);
    EXPECT_TRUE(id.empty());
    EXPECT_TRUE(fs::is_empty(store->Directory() + "/.incoming"));

    size_t entries = 0;
    for (const auto& e : fs::directory_iterator(store->Directory())) {
        if (e.path().filename() != ".incoming") ++entries;
    }
    EXPECT_EQ(entries, 0u);
}

TEST_F(TransferStoreTest, CollisionDrawsAnotherIdentifier) {
    auto ids = std::make_unique<ScriptedIdentifiers>(
        std::deque<std::string>{"aa-bb-cc-dd", "aa-bb-cc-dd", "ee-ff-gg-hh"});
    auto* script = ids.get();
    auto store = Open(1h, std::move(ids));

    EXPECT_EQ(Put(*store, "first"), "aa-bb-cc-dd");
    EXPECT_EQ(Put(*store, "second"), "ee-ff-gg-hh");
    EXPECT_EQ(script->calls, 3);

    xfer::FileReader reader;
    ASSERT_TRUE(store->Read("aa-bb-cc-dd", reader).ok);
    EXPECT_EQ(testutil::ReadAll(reader), "first");
}

TEST_F(TransferStoreTest, ConcurrentCreatesGetDistinctIdentifiers) {
    auto store = Open();
    constexpr int kThreads = 8;
    constexpr int kPerThread = 6;

    std::mutex mu;
    std::map<std::string, std::string> created;
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                const std::string body = "payload-" + std::to_string(t) + "-" + std::to_string(i);
                testutil::MemoryReader in(body);
                in.SetMaxChunk(3);
                std::string id;
                if (!store->Create(in, id).ok) continue;
                std::lock_guard<std::mutex> lk(mu);
                created.emplace(id, body);
            }
        });
    }
    for (auto& w : workers) w.join();

    ASSERT_EQ(created.size(), static_cast<size_t>(kThreads * kPerThread));
    for (const auto& [id, body] : created) {
        xfer::FileReader reader;
        ASSERT_TRUE(store->Read(id, reader).ok) << id;
        EXPECT_EQ(testutil::ReadAll(reader), body);
    }
}

TEST_F(TransferStoreTest, EntryExpiresAfterTtl) {
    auto store = Open(1s);
    const std::string id = Put(*store, "short lived");

    xfer::TransferInfo info;
    ASSERT_TRUE(store->Stat(id, info).ok);

    xfer::SweepStats early;
    store->RemoveExpired(&early);
    EXPECT_EQ(early.scanned, 1u);
    EXPECT_EQ(early.removed, 0u);

    std::this_thread::sleep_until(info.expires + 100ms);

    xfer::FileReader reader;
    EXPECT_EQ(store->Read(id, reader).kind, xfer::ErrorKind::NotFound);
    EXPECT_EQ(store->Stat(id, info).kind, xfer::ErrorKind::NotFound);

    xfer::SweepStats late;
    store->RemoveExpired(&late);
    EXPECT_EQ(late.removed, 1u);
    EXPECT_EQ(late.failed, 0u);
    EXPECT_FALSE(fs::exists(store->Directory() + "/" + id));
}

TEST_F(TransferStoreTest, SweepRemovesAbandonedStagingFiles) {
    auto store = Open(1min);
    const std::string stale = store->Directory() + "/.incoming/upload-old";
    const std::string fresh = store->Directory() + "/.incoming/upload-new";
    testutil::WriteFile(stale, "partial");
    testutil::WriteFile(fresh, "in flight");
    fs::last_write_time(stale, fs::file_time_type::clock::now() - 2min);

    store->RemoveExpired();
    EXPECT_FALSE(fs::exists(stale));
    EXPECT_TRUE(fs::exists(fresh));
}

TEST_F(TransferStoreTest, SweepIgnoresForeignNames) {
    auto store = Open(1s);
    const std::string foreign = store->Directory() + "/README";
    testutil::WriteFile(foreign, "keep me");

    std::this_thread::sleep_for(1100ms);
    xfer::SweepStats stats;
    store->RemoveExpired(&stats);
    EXPECT_EQ(stats.scanned, 0u);
    EXPECT_TRUE(fs::exists(foreign));
}

} // namespace
