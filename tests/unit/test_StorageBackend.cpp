#include <gtest/gtest.h>
#include "storage/StorageBackend.hpp"
#include "storage/StorageError.hpp"
#include "crypto/IdGenerator.hpp"

#include <filesystem>
#include <sstream>

using namespace cf::storage;
using namespace cf::config;

class StorageBackendTest : public ::testing::Test {
protected:
    std::filesystem::path root_;

    void SetUp() override { root_ = std::filesystem::temp_directory_path() / ("coffer_backend_" + cf::crypto::uuid4()); }
    void TearDown() override { std::filesystem::remove_all(root_); }

    [[nodiscard]] StorageConfig localConfig() const {
        StorageConfig cfg;
        cfg.backend = "local";
        cfg.local.root = root_;
        cfg.local.min_part_size = 16;
        return cfg;
    }
};

TEST_F(StorageBackendTest, CreatesLocalBackend) {
    const auto backend = StorageBackend::create(localConfig());

    ASSERT_NE(backend, nullptr);
    EXPECT_EQ(backend->type(), BackendType::Local);
    EXPECT_TRUE(std::holds_alternative<LocalDiskBackend>(backend->impl()));
    EXPECT_EQ(backend->minPartSize(), 16u);
}

TEST_F(StorageBackendTest, BackendNameIsCaseInsensitive) {
    auto cfg = localConfig();
    cfg.backend = "LOCAL";
    EXPECT_EQ(StorageBackend::create(cfg)->type(), BackendType::Local);
}

TEST_F(StorageBackendTest, UnknownBackendIsUnsupported) {
    auto cfg = localConfig();
    cfg.backend = "ftp";

    try {
        (void)StorageBackend::create(cfg);
        FAIL() << "expected UnsupportedBackend";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UnsupportedBackend);
    }
}

TEST_F(StorageBackendTest, MinioRequiresEndpoint) {
    auto cfg = localConfig();
    cfg.backend = "minio";
    cfg.s3.bucket = "coffer";

    try {
        (void)StorageBackend::create(cfg);
        FAIL() << "expected UnsupportedBackend";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UnsupportedBackend);
    }
}

TEST_F(StorageBackendTest, FacadeForwardsToSelectedBackend) {
    const auto backend = StorageBackend::create(localConfig());

    std::istringstream in("forwarded");
    backend->save("alice/a.txt", in, 9);
    EXPECT_TRUE(backend->exists("alice/a.txt"));
    EXPECT_EQ(backend->stat("alice/a.txt").size, 9u);
    EXPECT_TRUE(std::filesystem::exists(root_ / "alice" / "a.txt"));

    backend->remove("alice/a.txt");
    EXPECT_FALSE(backend->exists("alice/a.txt"));
}
