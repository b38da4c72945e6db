#include <gtest/gtest.h>
#include "storage/StorageBackend.hpp"
#include "storage/StorageError.hpp"
#include "crypto/IdGenerator.hpp"

#include <cstdlib>
#include <sstream>

using namespace cf::storage;

namespace {

std::string env(const char* name) {
    const auto* v = std::getenv(name);
    return v ? v : "";
}

}

// Runs against a real bucket when COFFER_TEST_S3_BUCKET and credentials are set.
class S3BackendIntegrationTest : public ::testing::Test {
protected:
    std::shared_ptr<StorageBackend> backend_;
    std::string prefix_;

    void SetUp() override {
        if (env("COFFER_TEST_S3_BUCKET").empty() || env("COFFER_TEST_S3_ACCESS_KEY").empty())
            GTEST_SKIP() << "COFFER_TEST_S3_* not set";

        cf::config::StorageConfig cfg;
        cfg.backend = env("COFFER_TEST_S3_ENDPOINT").empty() ? "s3" : "minio";
        cfg.s3.bucket = env("COFFER_TEST_S3_BUCKET");
        cfg.s3.endpoint = env("COFFER_TEST_S3_ENDPOINT");
        cfg.s3.access_key = env("COFFER_TEST_S3_ACCESS_KEY");
        cfg.s3.secret_key = env("COFFER_TEST_S3_SECRET_KEY");
        if (!env("COFFER_TEST_S3_REGION").empty()) cfg.s3.region = env("COFFER_TEST_S3_REGION");

        backend_ = StorageBackend::create(cfg);
        prefix_ = "coffer-it-" + cf::crypto::uuid4();
    }

    void TearDown() override {
        if (backend_) backend_->deleteDir(prefix_);
    }

    void put(const std::string& key, const std::string& data) const {
        std::istringstream in(data);
        backend_->save(key, in, data.size());
    }

    [[nodiscard]] std::string read(const std::string& key) const {
        const auto in = backend_->get(key);
        std::ostringstream out;
        out << in->rdbuf();
        return out.str();
    }
};

TEST_F(S3BackendIntegrationTest, SimpleRoundTrip) {
    const auto key = prefix_ + "/simple.txt";
    put(key, "object store round trip");

    EXPECT_TRUE(backend_->exists(key));
    EXPECT_EQ(read(key), "object store round trip");
    EXPECT_EQ(backend_->stat(key).size, 23u);

    backend_->remove(key);
    EXPECT_FALSE(backend_->exists(key));
    EXPECT_NO_THROW(backend_->remove(key));
}

TEST_F(S3BackendIntegrationTest, MissingObjectIsNotFound) {
    try {
        (void)backend_->get(prefix_ + "/missing");
        FAIL() << "expected NotFound";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
}

TEST_F(S3BackendIntegrationTest, ListAndCopy) {
    put(prefix_ + "/dir/a.txt", "a");
    backend_->copy(prefix_ + "/dir/a.txt", prefix_ + "/dir/b.txt");

    const auto entries = backend_->list(prefix_ + "/dir");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].key, prefix_ + "/dir/a.txt");
    EXPECT_EQ(entries[1].key, prefix_ + "/dir/b.txt");
}

TEST_F(S3BackendIntegrationTest, MultipartRoundTrip) {
    const auto key = prefix_ + "/multipart.bin";
    const std::string part(static_cast<size_t>(backend_->minPartSize()), 'x');

    const auto id = backend_->initiateMultipart(key);
    std::vector<std::string> ids;
    for (unsigned int n = 1; n <= 2; ++n) {
        std::istringstream in(part);
        ids.push_back(backend_->uploadPart(key, id, n, in, part.size()));
    }
    std::istringstream tail("tail");
    ids.push_back(backend_->uploadPart(key, id, 3, tail, 4));

    backend_->completeMultipart(key, id, ids);
    EXPECT_EQ(backend_->stat(key).size, part.size() * 2 + 4);
}

TEST_F(S3BackendIntegrationTest, PresignedUrlNamesTheObject) {
    const auto key = prefix_ + "/url.txt";
    const auto url = backend_->getDownloadURL(key, "url.txt");
    EXPECT_NE(url.find("X-Amz-Signature="), std::string::npos);
    EXPECT_NE(url.find("url.txt"), std::string::npos);
}
