#include <gtest/gtest.h>
#include "upload/MultipartCoordinator.hpp"
#include "services/UploadSweeper.hpp"
#include "quota/QuotaTracker.hpp"
#include "store/MemoryStores.hpp"
#include "storage/StorageError.hpp"
#include "storage/KeyScheme.hpp"
#include "crypto/IdGenerator.hpp"

#include <filesystem>
#include <functional>
#include <sstream>
#include <thread>

using namespace cf::upload;
using namespace cf::storage;
using namespace cf::quota;
using namespace cf::types;

namespace {

// Runs a callback the first time the stream is read, then serves `data`.
class InterruptingBuf : public std::streambuf {
public:
    InterruptingBuf(std::string data, std::function<void()> onFirstRead)
        : data_(std::move(data)), onFirstRead_(std::move(onFirstRead)) {}

protected:
    int_type underflow() override {
        if (served_) return traits_type::eof();
        served_ = true;
        onFirstRead_();
        setg(data_.data(), data_.data(), data_.data() + data_.size());
        return traits_type::to_int_type(*gptr());
    }

private:
    std::string data_;
    std::function<void()> onFirstRead_;
    bool served_ = false;
};

}

class MultipartCoordinatorTest : public ::testing::Test {
protected:
    static constexpr uintmax_t MIN_PART = 8;

    std::filesystem::path root_;
    std::shared_ptr<StorageBackend> backend_;
    std::shared_ptr<MultipartCoordinator> coordinator_;
    std::shared_ptr<QuotaTracker> quota_;
    UserIdentity alice_{"alice", 1000};

    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / ("coffer_multipart_" + cf::crypto::uuid4());

        cf::config::StorageConfig cfg;
        cfg.local.root = root_;
        cfg.local.min_part_size = MIN_PART;
        backend_ = StorageBackend::create(cfg);

        cf::config::MultipartConfig mp;
        mp.session_ttl = std::chrono::minutes(30);
        coordinator_ = std::make_shared<MultipartCoordinator>(backend_, mp);
        quota_ = std::make_shared<QuotaTracker>(std::make_shared<cf::store::MemoryQuotaStore>(), cf::config::QuotaConfig{});
    }

    void TearDown() override {
        coordinator_.reset();
        std::filesystem::remove_all(root_);
    }

    std::string part(const std::string& uploadId, const unsigned int n, const std::string& data) const {
        std::istringstream in(data);
        return coordinator_->uploadPart(uploadId, n, in, data.size());
    }

    [[nodiscard]] std::string read(const std::string& key) const {
        const auto in = backend_->get(key);
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

TEST_F(MultipartCoordinatorTest, OutOfOrderPartsAssembleInPartOrder) {
    const auto id = coordinator_->initiate("alice/video.bin");

    const auto p3 = part(id, 3, "CC");
    const auto p1 = part(id, 1, "AAAAAAAA");
    const auto p2 = part(id, 2, "BBBBBBBB");

    coordinator_->complete(id, {p1, p2, p3});
    EXPECT_EQ(read("alice/video.bin"), "AAAAAAAABBBBBBBBCC");
    EXPECT_EQ(coordinator_->activeSessions(), 0u);
}

TEST_F(MultipartCoordinatorTest, ConcurrentPartsAreAllRecorded) {
    const auto id = coordinator_->initiate("alice/big.bin");
    constexpr unsigned int PARTS = 8;

    std::vector<std::string> ids(PARTS);
    std::vector<std::thread> threads;
    for (unsigned int n = 1; n <= PARTS; ++n)
        threads.emplace_back([&, n] { ids[n - 1] = part(id, n, std::string(MIN_PART, static_cast<char>('a' + n))); });
    for (auto& t : threads) t.join();

    const auto info = coordinator_->describe(id);
    ASSERT_TRUE(info);
    EXPECT_EQ(info->parts.size(), PARTS);
    EXPECT_EQ(info->parts_in_flight, 0u);

    coordinator_->complete(id, ids);
    EXPECT_EQ(backend_->stat("alice/big.bin").size, PARTS * MIN_PART);
}

TEST_F(MultipartCoordinatorTest, GapInPartsFailsAndKeepsSessionOpen) {
    const auto id = coordinator_->initiate("alice/gap.bin");
    const auto p1 = part(id, 1, "AAAAAAAA");
    const auto p3 = part(id, 3, "CC");

    EXPECT_EQ(codeOf([&] { coordinator_->complete(id, {p1, p3}); }), ErrorCode::UploadFailed);
    EXPECT_FALSE(backend_->exists("alice/gap.bin"));

    const auto p2 = part(id, 2, "BBBBBBBB");
    coordinator_->complete(id, {p1, p2, p3});
    EXPECT_EQ(read("alice/gap.bin"), "AAAAAAAABBBBBBBBCC");
}

TEST_F(MultipartCoordinatorTest, MismatchedIdentifiersFail) {
    const auto id = coordinator_->initiate("alice/x.bin");
    const auto p1 = part(id, 1, "AAAAAAAA");
    const auto p2 = part(id, 2, "BB");

    EXPECT_EQ(codeOf([&] { coordinator_->complete(id, {p2, p1}); }), ErrorCode::UploadFailed);
    EXPECT_EQ(codeOf([&] { coordinator_->complete(id, {}); }), ErrorCode::UploadFailed);
    EXPECT_TRUE(coordinator_->describe(id));
}

TEST_F(MultipartCoordinatorTest, SmallNonLastPartFails) {
    const auto id = coordinator_->initiate("alice/x.bin");
    const auto p1 = part(id, 1, "tiny");
    const auto p2 = part(id, 2, "BBBBBBBB");

    EXPECT_EQ(codeOf([&] { coordinator_->complete(id, {p1, p2}); }), ErrorCode::UploadFailed);
}

TEST_F(MultipartCoordinatorTest, ReuploadReplacesPart) {
    const auto id = coordinator_->initiate("alice/x.bin");
    const auto stale = part(id, 1, "XXXXXXXX");
    const auto fresh = part(id, 1, "AAAAAAAA");

    EXPECT_EQ(codeOf([&] { coordinator_->complete(id, {stale}); }), ErrorCode::UploadFailed);
    coordinator_->complete(id, {fresh});
    EXPECT_EQ(read("alice/x.bin"), "AAAAAAAA");
}

TEST_F(MultipartCoordinatorTest, PartNumberBounds) {
    const auto id = coordinator_->initiate("alice/x.bin");
    EXPECT_EQ(codeOf([&] { (void)part(id, 0, "a"); }), ErrorCode::UploadFailed);
    EXPECT_EQ(codeOf([&] { (void)part(id, MultipartCoordinator::MAX_PART_NUMBER + 1, "a"); }), ErrorCode::UploadFailed);
}

TEST_F(MultipartCoordinatorTest, UnknownSessionIsNotFound) {
    EXPECT_EQ(codeOf([&] { (void)part("nope", 1, "a"); }), ErrorCode::NotFound);
    EXPECT_EQ(codeOf([&] { coordinator_->complete("nope", {"x"}); }), ErrorCode::NotFound);
    EXPECT_NO_THROW(coordinator_->abort("nope"));
}

TEST_F(MultipartCoordinatorTest, AbortIsIdempotentAndClosesSession) {
    const auto id = coordinator_->initiate("alice/x.bin");
    const auto p1 = part(id, 1, "AAAAAAAA");

    coordinator_->abort(id);
    EXPECT_NO_THROW(coordinator_->abort(id));
    EXPECT_FALSE(coordinator_->describe(id));
    EXPECT_EQ(codeOf([&] { coordinator_->complete(id, {p1}); }), ErrorCode::NotFound);
    EXPECT_EQ(codeOf([&] { (void)part(id, 2, "B"); }), ErrorCode::NotFound);
    EXPECT_FALSE(backend_->exists("alice/x.bin"));
}

TEST_F(MultipartCoordinatorTest, CompletedSessionCannotBeCompletedAgain) {
    const auto id = coordinator_->initiate("alice/x.bin");
    const auto p1 = part(id, 1, "AAAAAAAA");
    coordinator_->complete(id, {p1});

    EXPECT_EQ(codeOf([&] { coordinator_->complete(id, {p1}); }), ErrorCode::NotFound);
    EXPECT_NO_THROW(coordinator_->abort(id));
    EXPECT_EQ(read("alice/x.bin"), "AAAAAAAA");
}

TEST_F(MultipartCoordinatorTest, CancelledPartAbortsSession) {
    const auto id = coordinator_->initiate("alice/x.bin", quota_->reserve(alice_, 100));
    EXPECT_EQ(quota_->usage(alice_).reserved, 100u);

    cf::concurrency::CancelToken cancel;
    cancel.cancel();
    std::istringstream in("AAAAAAAA");

    EXPECT_EQ(codeOf([&] { (void)coordinator_->uploadPart(id, 1, in, 8, cancel); }), ErrorCode::Cancelled);
    EXPECT_FALSE(coordinator_->describe(id));
    EXPECT_EQ(quota_->usage(alice_).reserved, 0u);
}

TEST_F(MultipartCoordinatorTest, CancelledCompleteAbortsSession) {
    const auto id = coordinator_->initiate("alice/x.bin", quota_->reserve(alice_, 100));
    const auto p1 = part(id, 1, "AAAAAAAA");
    const auto p2 = part(id, 2, "BB");

    cf::concurrency::CancelToken cancel;
    cancel.cancel();

    EXPECT_EQ(codeOf([&] { coordinator_->complete(id, {p1, p2}, cancel); }), ErrorCode::Cancelled);
    EXPECT_FALSE(coordinator_->describe(id));
    EXPECT_EQ(quota_->usage(alice_).reserved, 0u);
    EXPECT_EQ(quota_->usage(alice_).consumed, 0u);
    EXPECT_FALSE(backend_->exists("alice/x.bin"));
    EXPECT_TRUE(std::filesystem::is_empty(root_ / KeyScheme::MULTIPART_PREFIX));
}

TEST_F(MultipartCoordinatorTest, AbortDuringPartUploadLeavesNoPartData) {
    const auto id = coordinator_->initiate("alice/x.bin", quota_->reserve(alice_, 100));

    InterruptingBuf buf("AAAAAAAA", [&] { coordinator_->abort(id); });
    std::istream in(&buf);

    EXPECT_EQ(codeOf([&] { (void)coordinator_->uploadPart(id, 1, in, 8); }), ErrorCode::NotFound);
    EXPECT_FALSE(coordinator_->describe(id));
    EXPECT_EQ(quota_->usage(alice_).reserved, 0u);
    EXPECT_TRUE(std::filesystem::is_empty(root_ / KeyScheme::MULTIPART_PREFIX));
}

TEST_F(MultipartCoordinatorTest, CompletionCommitsActualBytes) {
    const auto id = coordinator_->initiate("alice/x.bin", quota_->reserve(alice_, 100));
    const auto p1 = part(id, 1, "AAAAAAAA");
    const auto p2 = part(id, 2, "BB");
    coordinator_->complete(id, {p1, p2});

    const auto usage = quota_->usage(alice_);
    EXPECT_EQ(usage.consumed, 10u);
    EXPECT_EQ(usage.reserved, 0u);
}

TEST_F(MultipartCoordinatorTest, CompletionBeyondReservationIsStorageFull) {
    const auto id = coordinator_->initiate("alice/x.bin", quota_->reserve(alice_, 9));
    const auto p1 = part(id, 1, "AAAAAAAA");
    const auto p2 = part(id, 2, "BB");

    EXPECT_EQ(codeOf([&] { coordinator_->complete(id, {p1, p2}); }), ErrorCode::StorageFull);
    EXPECT_EQ(quota_->usage(alice_).consumed, 0u);
}

TEST_F(MultipartCoordinatorTest, AbortReleasesReservation) {
    const auto id = coordinator_->initiate("alice/x.bin", quota_->reserve(alice_, 600));
    EXPECT_EQ(quota_->usage(alice_).available(), 400u);

    coordinator_->abort(id);
    const auto usage = quota_->usage(alice_);
    EXPECT_EQ(usage.reserved, 0u);
    EXPECT_EQ(usage.consumed, 0u);
}

TEST_F(MultipartCoordinatorTest, StaleSessionsAreReaped) {
    const auto fresh = coordinator_->initiate("alice/fresh.bin");
    const auto later = std::chrono::system_clock::now() + std::chrono::minutes(31);

    EXPECT_TRUE(coordinator_->listStaleSessions(std::chrono::system_clock::now()).empty());
    ASSERT_EQ(coordinator_->listStaleSessions(later).size(), 1u);

    EXPECT_EQ(coordinator_->reapStaleSessions(later), 1u);
    EXPECT_FALSE(coordinator_->describe(fresh));
    EXPECT_EQ(coordinator_->reapStaleSessions(later), 0u);
}

TEST_F(MultipartCoordinatorTest, SweeperLeavesLiveSessionsAlone) {
    const auto id = coordinator_->initiate("alice/x.bin");

    cf::services::UploadSweeper sweeper(coordinator_, std::chrono::milliseconds(10));
    EXPECT_EQ(sweeper.sweepOnce(), 0u);
    EXPECT_TRUE(coordinator_->describe(id));

    sweeper.start();
    EXPECT_TRUE(sweeper.isRunning());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    sweeper.stop();

    EXPECT_FALSE(sweeper.isRunning());
    EXPECT_TRUE(coordinator_->describe(id));
}
