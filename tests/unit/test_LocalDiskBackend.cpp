#include <gtest/gtest.h>
#include "storage/LocalDiskBackend.hpp"
#include "storage/StorageError.hpp"
#include "crypto/Hash.hpp"
#include "crypto/IdGenerator.hpp"

#include <filesystem>
#include <functional>
#include <sstream>

using namespace cf::storage;
using namespace cf::concurrency;

class LocalDiskBackendTest : public ::testing::Test {
protected:
    std::filesystem::path root_;
    std::unique_ptr<LocalDiskBackend> backend_;

    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / ("coffer_local_" + cf::crypto::uuid4());
        cf::config::LocalStorageConfig cfg;
        cfg.root = root_;
        cfg.min_part_size = 4;
        backend_ = std::make_unique<LocalDiskBackend>(cfg);
    }

    void TearDown() override { std::filesystem::remove_all(root_); }

    void put(const std::string& key, const std::string& data) const {
        std::istringstream in(data);
        backend_->save(key, in, data.size(), {});
    }

    [[nodiscard]] std::string read(const std::string& key) const {
        const auto in = backend_->get(key, {});
        std::ostringstream out;
        out << in->rdbuf();
        return out.str();
    }

    static ErrorCode codeOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const StorageError& e) {
            return e.code();
        }
        ADD_FAILURE() << "expected a StorageError";
        return ErrorCode::InvalidOperation;
    }
};

TEST_F(LocalDiskBackendTest, SaveThenGetRoundTrips) {
    const std::string data = "hello coffer";
    put("alice/docs/a.txt", data);

    EXPECT_EQ(read("alice/docs/a.txt"), data);
    EXPECT_EQ(backend_->stat("alice/docs/a.txt", {}).size, data.size());
}

TEST_F(LocalDiskBackendTest, SaveIsAnUpsert) {
    put("alice/a.txt", "first version");
    put("alice/a.txt", "second");

    EXPECT_EQ(read("alice/a.txt"), "second");
    EXPECT_EQ(backend_->stat("alice/a.txt", {}).size, 6u);
}

TEST_F(LocalDiskBackendTest, SaveLeavesNoTempFiles) {
    put("alice/a.txt", "data");
    for (const auto& e : std::filesystem::recursive_directory_iterator(root_))
        EXPECT_EQ(e.path().filename().string().find(".coffer-tmp-"), std::string::npos) << e.path();
}

TEST_F(LocalDiskBackendTest, ShortStreamFailsAndKeepsOldContent) {
    put("alice/a.txt", "original");

    std::istringstream in("abc");
    EXPECT_EQ(codeOf([&] { backend_->save("alice/a.txt", in, 10, {}); }), ErrorCode::UploadFailed);
    EXPECT_EQ(read("alice/a.txt"), "original");
}

TEST_F(LocalDiskBackendTest, GetMissingIsNotFound) {
    EXPECT_EQ(codeOf([&] { (void)backend_->get("alice/missing", {}); }), ErrorCode::NotFound);
    EXPECT_EQ(codeOf([&] { (void)backend_->stat("alice/missing", {}); }), ErrorCode::NotFound);
}

TEST_F(LocalDiskBackendTest, DeleteIsIdempotent) {
    put("alice/a.txt", "x");
    EXPECT_NO_THROW(backend_->remove("alice/a.txt", {}));
    EXPECT_NO_THROW(backend_->remove("alice/a.txt", {}));
    EXPECT_FALSE(backend_->exists("alice/a.txt", {}));
}

TEST_F(LocalDiskBackendTest, DeletePrunesEmptyParents) {
    put("alice/deep/nested/a.txt", "x");
    backend_->remove("alice/deep/nested/a.txt", {});

    EXPECT_FALSE(std::filesystem::exists(root_ / "alice"));
    EXPECT_TRUE(std::filesystem::exists(root_));
}

TEST_F(LocalDiskBackendTest, UnsafeKeysAreRejectedBeforeTouchingDisk) {
    const std::string outside = (root_.parent_path() / "escape.txt").string();

    EXPECT_EQ(codeOf([&] { put("../escape.txt", "x"); }), ErrorCode::InvalidKey);
    EXPECT_EQ(codeOf([&] { put("/etc/passwd", "x"); }), ErrorCode::InvalidKey);
    EXPECT_EQ(codeOf([&] { put("alice/%2e%2e/%2e%2e/escape.txt", "x"); }), ErrorCode::InvalidKey);
    EXPECT_EQ(codeOf([&] { (void)backend_->get("a/../../escape.txt", {}); }), ErrorCode::InvalidKey);
    EXPECT_EQ(codeOf([&] { backend_->remove("../escape.txt", {}); }), ErrorCode::InvalidKey);
    EXPECT_EQ(codeOf([&] { put(".multipart/x", "x"); }), ErrorCode::InvalidKey);
    EXPECT_FALSE(std::filesystem::exists(outside));
}

TEST_F(LocalDiskBackendTest, StatHashMatchesContent) {
    put("alice/a.txt", "integrity");
    const auto info = backend_->stat("alice/a.txt", {});

    EXPECT_FALSE(info.is_dir);
    EXPECT_EQ(info.content_hash, cf::crypto::Hash::blake2b(backend_->root() / "alice/a.txt"));
    EXPECT_EQ(info.integrityTag(), info.content_hash);
    EXPECT_EQ(info.mime_type, "text/plain");
}

TEST_F(LocalDiskBackendTest, CopyAndMove) {
    put("alice/a.txt", "payload");

    backend_->copy("alice/a.txt", "alice/b.txt", {});
    EXPECT_EQ(read("alice/b.txt"), "payload");
    EXPECT_TRUE(backend_->exists("alice/a.txt", {}));

    backend_->move("alice/a.txt", "alice/sub/c.txt", {});
    EXPECT_FALSE(backend_->exists("alice/a.txt", {}));
    EXPECT_EQ(read("alice/sub/c.txt"), "payload");

    EXPECT_EQ(codeOf([&] { backend_->copy("alice/missing", "alice/x", {}); }), ErrorCode::NotFound);
    EXPECT_EQ(codeOf([&] { backend_->move("alice/missing", "alice/x", {}); }), ErrorCode::NotFound);
}

TEST_F(LocalDiskBackendTest, ListReturnsImmediateChildrenSorted) {
    put("alice/b.txt", "bb");
    put("alice/a.txt", "a");
    put("alice/sub/c.txt", "c");

    const auto entries = backend_->list("alice", {});
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].key, "alice/a.txt");
    EXPECT_EQ(entries[1].key, "alice/b.txt");
    EXPECT_EQ(entries[1].size, 2u);
    EXPECT_EQ(entries[2].key, "alice/sub");
    EXPECT_TRUE(entries[2].is_dir);
}

TEST_F(LocalDiskBackendTest, ListRootHidesMultipartArea) {
    put("alice/a.txt", "a");
    (void)backend_->initiateMultipart("alice/big.bin", {});

    const auto entries = backend_->list("", {});
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].key, "alice");
}

TEST_F(LocalDiskBackendTest, DirectoryLifecycle) {
    backend_->createDir("alice/photos", {});
    EXPECT_TRUE(backend_->stat("alice/photos", {}).is_dir);

    put("alice/photos/1.jpg", "12345");
    put("alice/photos/2.jpg", "123");
    EXPECT_EQ(backend_->diskUsage("alice", {}), 8u);

    backend_->deleteDir("alice/photos", {});
    EXPECT_FALSE(backend_->exists("alice/photos", {}));
    EXPECT_NO_THROW(backend_->deleteDir("alice/photos", {}));
    EXPECT_EQ(codeOf([&] { backend_->deleteDir(".", {}); }), ErrorCode::InvalidKey);
}

TEST_F(LocalDiskBackendTest, CancelledSaveFails) {
    CancelToken cancel;
    cancel.cancel();

    std::istringstream in("data");
    EXPECT_EQ(codeOf([&] { backend_->save("alice/a.txt", in, 4, cancel); }), ErrorCode::Cancelled);
    EXPECT_FALSE(backend_->exists("alice/a.txt", {}));
}

TEST_F(LocalDiskBackendTest, MultipartAssemblesPartsInOrder) {
    const auto id = backend_->initiateMultipart("alice/big.bin", {});

    std::istringstream p2("5678"), p1("1234"), p3("9");
    const auto id2 = backend_->uploadPart("alice/big.bin", id, 2, p2, 4, {});
    const auto id1 = backend_->uploadPart("alice/big.bin", id, 1, p1, 4, {});
    const auto id3 = backend_->uploadPart("alice/big.bin", id, 3, p3, 1, {});

    backend_->completeMultipart("alice/big.bin", id, {id1, id2, id3}, {});
    EXPECT_EQ(read("alice/big.bin"), "123456789");
    EXPECT_FALSE(std::filesystem::exists(root_ / ".multipart" / id));
}

TEST_F(LocalDiskBackendTest, MultipartRejectsWrongIdentifiers) {
    const auto id = backend_->initiateMultipart("alice/big.bin", {});
    std::istringstream p1("1234");
    const auto id1 = backend_->uploadPart("alice/big.bin", id, 1, p1, 4, {});

    EXPECT_EQ(codeOf([&] { backend_->completeMultipart("alice/big.bin", id, {"bogus"}, {}); }), ErrorCode::UploadFailed);
    EXPECT_EQ(codeOf([&] { backend_->completeMultipart("alice/big.bin", id, {id1, id1}, {}); }), ErrorCode::UploadFailed);
    EXPECT_FALSE(backend_->exists("alice/big.bin", {}));
}

TEST_F(LocalDiskBackendTest, MultipartAbortIsIdempotent) {
    const auto id = backend_->initiateMultipart("alice/big.bin", {});
    backend_->abortMultipart("alice/big.bin", id, {});
    EXPECT_NO_THROW(backend_->abortMultipart("alice/big.bin", id, {}));

    std::istringstream p1("1234");
    EXPECT_EQ(codeOf([&] { (void)backend_->uploadPart("alice/big.bin", id, 1, p1, 4, {}); }), ErrorCode::NotFound);
}

TEST_F(LocalDiskBackendTest, URLsPointIntoTheRoot) {
    put("alice/a.txt", "x");
    EXPECT_EQ(backend_->getURL("alice/a.txt"), "file://" + (backend_->root() / "alice/a.txt").string());
}
