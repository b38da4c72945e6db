#include <gtest/gtest.h>
#include "share/ShareTokenManager.hpp"
#include "fs/FileTree.hpp"
#include "store/MemoryStores.hpp"
#include "storage/StorageError.hpp"

#include <atomic>
#include <ctime>
#include <functional>
#include <set>
#include <thread>
#include <nlohmann/json.hpp>

using namespace cf::share;
using namespace cf::types;
using namespace cf::storage;

class ShareTokenManagerTest : public ::testing::Test {
protected:
    std::shared_ptr<cf::store::MemoryFileStore> files_ = std::make_shared<cf::store::MemoryFileStore>();
    std::shared_ptr<cf::store::MemoryShareStore> shares_ = std::make_shared<cf::store::MemoryShareStore>();
    cf::fs::FileTree tree_{files_};
    ShareTokenManager manager_{shares_, files_, cf::config::SharingConfig{}};
    File file_;

    void SetUp() override { file_ = tree_.createFile("alice", std::nullopt, "report.pdf", "application/pdf"); }

    [[nodiscard]] ShareRequest request(const ShareAccess access = ShareAccess::Download) const {
        ShareRequest req;
        req.file_id = file_.id;
        req.issuer_id = "alice";
        req.access = access;
        return req;
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

TEST_F(ShareTokenManagerTest, IssuedShareValidates) {
    const auto share = manager_.issue(request());

    EXPECT_EQ(share.token.size(), 32u);
    EXPECT_TRUE(share.is_active);
    EXPECT_EQ(share.download_count, 0u);
    EXPECT_EQ(manager_.validate(share.token), ShareAccess::Download);
}

TEST_F(ShareTokenManagerTest, TokensAreUnique) {
    std::set<std::string> tokens;
    for (int i = 0; i < 200; ++i) tokens.insert(manager_.issue(request()).token);
    EXPECT_EQ(tokens.size(), 200u);
}

TEST_F(ShareTokenManagerTest, IssueChecksOwnershipAndLimits) {
    auto req = request();
    req.issuer_id = "mallory";
    EXPECT_EQ(codeOf([&] { (void)manager_.issue(req); }), ErrorCode::PermissionDenied);

    req = request();
    req.max_downloads = 0u;
    EXPECT_EQ(codeOf([&] { (void)manager_.issue(req); }), ErrorCode::InvalidOperation);

    req = request();
    req.file_id = "missing";
    EXPECT_EQ(codeOf([&] { (void)manager_.issue(req); }), ErrorCode::NotFound);
}

TEST_F(ShareTokenManagerTest, UnknownTokenIsNotFound) {
    EXPECT_EQ(codeOf([&] { (void)manager_.validate("NOPE"); }), ErrorCode::NotFound);
    EXPECT_EQ(codeOf([&] { manager_.recordDownload("NOPE"); }), ErrorCode::NotFound);
}

TEST_F(ShareTokenManagerTest, PastExpiryIsExpired) {
    auto req = request();
    req.expires_at = std::time(nullptr) - 60;
    const auto share = manager_.issue(req);

    EXPECT_EQ(codeOf([&] { (void)manager_.validate(share.token); }), ErrorCode::ShareExpired);
}

TEST_F(ShareTokenManagerTest, ExhaustedIsReportedBeforeExpiryAndRevocation) {
    auto req = request();
    req.max_downloads = 1u;
    const auto share = manager_.issue(req);
    manager_.recordDownload(share.token);
    manager_.revoke(share.id, "alice");

    EXPECT_EQ(codeOf([&] { (void)manager_.validate(share.token); }), ErrorCode::ShareExhausted);
}

TEST_F(ShareTokenManagerTest, ExpiryIsReportedBeforeRevocation) {
    auto req = request();
    req.expires_at = std::time(nullptr) - 60;
    const auto share = manager_.issue(req);
    manager_.revoke(share.id, "alice");

    EXPECT_EQ(codeOf([&] { (void)manager_.validate(share.token); }), ErrorCode::ShareExpired);
}

TEST_F(ShareTokenManagerTest, RevokedShareIsRejected) {
    const auto share = manager_.issue(request());

    EXPECT_EQ(codeOf([&] { manager_.revoke(share.id, "mallory"); }), ErrorCode::PermissionDenied);
    manager_.revoke(share.id, "alice");
    EXPECT_NO_THROW(manager_.revoke(share.id, "alice"));

    EXPECT_EQ(codeOf([&] { (void)manager_.validate(share.token); }), ErrorCode::ShareRevoked);
    EXPECT_EQ(codeOf([&] { manager_.recordDownload(share.token); }), ErrorCode::ShareRevoked);
}

TEST_F(ShareTokenManagerTest, TombstonedFileIsNotFound) {
    const auto share = manager_.issue(request());
    (void)tree_.tombstone(file_.id);

    EXPECT_EQ(codeOf([&] { (void)manager_.validate(share.token); }), ErrorCode::NotFound);
}

TEST_F(ShareTokenManagerTest, PasswordIsRequiredAndVerified) {
    auto req = request();
    req.password = "hunter22";
    const auto share = manager_.issue(req);

    ASSERT_TRUE(share.password_hash);
    EXPECT_NE(*share.password_hash, "hunter22");

    EXPECT_EQ(codeOf([&] { (void)manager_.validate(share.token); }), ErrorCode::ShareForbidden);
    EXPECT_EQ(codeOf([&] { (void)manager_.validate(share.token, std::string("wrong")); }), ErrorCode::ShareForbidden);
    EXPECT_EQ(manager_.validate(share.token, std::string("hunter22")), ShareAccess::Download);
}

TEST_F(ShareTokenManagerTest, JsonNeverCarriesPasswordHash) {
    auto req = request();
    req.password = "hunter22";
    const nlohmann::json j = manager_.issue(req);

    EXPECT_FALSE(j.contains("password_hash"));
    EXPECT_EQ(j.dump().find(*shares_->listForFile(file_.id).front().password_hash), std::string::npos);
}

TEST_F(ShareTokenManagerTest, ViewShareCannotDownload) {
    const auto share = manager_.issue(request(ShareAccess::View));

    EXPECT_EQ(manager_.validate(share.token), ShareAccess::View);
    EXPECT_EQ(codeOf([&] { (void)manager_.authorizeDownload(share.token); }), ErrorCode::PermissionDenied);
}

TEST_F(ShareTokenManagerTest, UpdateChangesAndClearsSettings) {
    auto req = request(ShareAccess::View);
    req.password = "hunter22";
    req.expires_at = std::time(nullptr) + 3600;
    const auto share = manager_.issue(req);

    ShareUpdate changes;
    changes.password = "correct horse";
    changes.access = ShareAccess::Download;
    changes.max_downloads = 3u;
    auto updated = manager_.update(share.id, "alice", changes);

    EXPECT_EQ(updated.access, ShareAccess::Download);
    EXPECT_EQ(updated.max_downloads, 3u);
    EXPECT_EQ(updated.expires_at, req.expires_at);
    EXPECT_EQ(updated.token, share.token);
    EXPECT_EQ(codeOf([&] { (void)manager_.validate(share.token, std::string("hunter22")); }), ErrorCode::ShareForbidden);
    EXPECT_EQ(manager_.validate(share.token, std::string("correct horse")), ShareAccess::Download);

    changes = {};
    changes.password = "";
    changes.expires_at = std::optional<std::time_t>{};
    changes.max_downloads = std::optional<unsigned int>{};
    updated = manager_.update(share.id, "alice", changes);

    EXPECT_FALSE(updated.password_hash);
    EXPECT_FALSE(updated.expires_at);
    EXPECT_FALSE(updated.max_downloads);
    EXPECT_EQ(manager_.validate(share.token), ShareAccess::Download);
}

TEST_F(ShareTokenManagerTest, UpdateCanExtendAnExpiredShare) {
    auto req = request();
    req.expires_at = std::time(nullptr) - 60;
    const auto share = manager_.issue(req);

    ShareUpdate changes;
    changes.expires_at = std::optional<std::time_t>{std::time(nullptr) + 3600};
    (void)manager_.update(share.id, "alice", changes);

    EXPECT_EQ(manager_.validate(share.token), ShareAccess::Download);
}

TEST_F(ShareTokenManagerTest, UpdateRejectsBadRequests) {
    auto req = request();
    req.max_downloads = 2u;
    const auto share = manager_.issue(req);
    manager_.recordDownload(share.token);
    manager_.recordDownload(share.token);

    ShareUpdate changes;
    changes.access = ShareAccess::Edit;
    EXPECT_EQ(codeOf([&] { (void)manager_.update(share.id, "mallory", changes); }), ErrorCode::PermissionDenied);
    EXPECT_EQ(codeOf([&] { (void)manager_.update("missing", "alice", changes); }), ErrorCode::NotFound);

    changes = {};
    changes.max_downloads = 0u;
    EXPECT_EQ(codeOf([&] { (void)manager_.update(share.id, "alice", changes); }), ErrorCode::InvalidOperation);

    changes.max_downloads = 1u;
    EXPECT_EQ(codeOf([&] { (void)manager_.update(share.id, "alice", changes); }), ErrorCode::InvalidOperation);

    changes.max_downloads = 5u;
    (void)manager_.update(share.id, "alice", changes);
    EXPECT_NO_THROW(manager_.recordDownload(share.token));
    EXPECT_EQ(shares_->get(share.id)->download_count, 3u);
}

TEST_F(ShareTokenManagerTest, UpdateNeverRevivesRevokedShare) {
    const auto share = manager_.issue(request());
    manager_.revoke(share.id, "alice");

    ShareUpdate changes;
    changes.access = ShareAccess::Edit;
    changes.max_downloads = std::optional<unsigned int>{};
    EXPECT_EQ(codeOf([&] { (void)manager_.update(share.id, "alice", changes); }), ErrorCode::ShareRevoked);

    EXPECT_EQ(shares_->get(share.id)->access, ShareAccess::Download);
    EXPECT_EQ(codeOf([&] { (void)manager_.validate(share.token); }), ErrorCode::ShareRevoked);
}

TEST_F(ShareTokenManagerTest, ConcurrentDownloadsNeverExceedLimit) {
    constexpr unsigned int LIMIT = 5;
    constexpr int ATTEMPTS = 40;

    auto req = request();
    req.max_downloads = LIMIT;
    const auto share = manager_.issue(req);

    std::atomic<int> succeeded{0}, exhausted{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < ATTEMPTS; ++i)
        threads.emplace_back([&] {
            try {
                manager_.recordDownload(share.token);
                ++succeeded;
            } catch (const StorageError& e) {
                if (e.code() == ErrorCode::ShareExhausted) ++exhausted;
            }
        });
    for (auto& t : threads) t.join();

    EXPECT_EQ(succeeded.load(), static_cast<int>(LIMIT));
    EXPECT_EQ(exhausted.load(), ATTEMPTS - static_cast<int>(LIMIT));
    EXPECT_EQ(shares_->get(share.id)->download_count, LIMIT);
}

TEST_F(ShareTokenManagerTest, RevokeAllForFile) {
    (void)manager_.issue(request());
    (void)manager_.issue(request());
    const auto revoked = manager_.issue(request());
    manager_.revoke(revoked.id, "alice");

    EXPECT_EQ(manager_.revokeAllForFile(file_.id), 2u);
    for (const auto& s : manager_.listForFile(file_.id)) EXPECT_FALSE(s.is_active);
    EXPECT_EQ(manager_.listForUser("alice").size(), 3u);
}

TEST(ShareTokenManagerConfigTest, RejectsShortTokens) {
    auto files = std::make_shared<cf::store::MemoryFileStore>();
    auto shares = std::make_shared<cf::store::MemoryShareStore>();
    EXPECT_THROW((void)ShareTokenManager(shares, files, cf::config::SharingConfig{8, 8}), std::invalid_argument);
    EXPECT_THROW((void)ShareTokenManager(shares, files, cf::config::SharingConfig{32, 0}), std::invalid_argument);
}
