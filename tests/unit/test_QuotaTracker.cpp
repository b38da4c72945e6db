#include <gtest/gtest.h>
#include "quota/QuotaTracker.hpp"
#include "store/MemoryStores.hpp"
#include "storage/StorageError.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace cf::quota;
using namespace cf::types;
using namespace cf::storage;

class QuotaTrackerTest : public ::testing::Test {
protected:
    std::shared_ptr<cf::store::MemoryQuotaStore> store_ = std::make_shared<cf::store::MemoryQuotaStore>();
    QuotaTracker tracker_{store_, cf::config::QuotaConfig{5000}};
    UserIdentity alice_{"alice", 1000};
};

TEST_F(QuotaTrackerTest, SecondReservationBeyondCeilingIsRejected) {
    auto first = tracker_.reserve(alice_, 600);

    try {
        (void)tracker_.reserve(alice_, 500);
        FAIL() << "expected StorageFull";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code(), ErrorCode::StorageFull);
        EXPECT_EQ(e.key(), "alice");
    }

    first.commit();
    const auto usage = tracker_.usage(alice_);
    EXPECT_EQ(usage.consumed, 600u);
    EXPECT_EQ(usage.reserved, 0u);
    EXPECT_EQ(usage.available(), 400u);
}

TEST_F(QuotaTrackerTest, ExactFitIsAdmitted) {
    auto r = tracker_.reserve(alice_, 1000);
    EXPECT_EQ(tracker_.usage(alice_).available(), 0u);
    EXPECT_THROW((void)tracker_.reserve(alice_, 1), StorageError);
}

TEST_F(QuotaTrackerTest, OversizedRequestDoesNotWrap) {
    EXPECT_THROW((void)tracker_.reserve(alice_, UINTMAX_MAX), StorageError);
}

TEST_F(QuotaTrackerTest, DroppedReservationIsReleased) {
    {
        auto r = tracker_.reserve(alice_, 900);
        EXPECT_EQ(tracker_.usage(alice_).reserved, 900u);
    }
    EXPECT_EQ(tracker_.usage(alice_).reserved, 0u);
    EXPECT_NO_THROW((void)tracker_.reserve(alice_, 900));
}

TEST_F(QuotaTrackerTest, MovedReservationIsSettledOnce) {
    auto a = tracker_.reserve(alice_, 300);
    QuotaReservation b = std::move(a);

    EXPECT_FALSE(a.active());
    EXPECT_TRUE(b.active());

    b.commit();
    EXPECT_FALSE(b.active());
    EXPECT_THROW(b.commit(), StorageError);
    EXPECT_EQ(tracker_.usage(alice_).consumed, 300u);
}

TEST_F(QuotaTrackerTest, PartialCommit) {
    auto r = tracker_.reserve(alice_, 500);
    EXPECT_THROW(r.commit(501), StorageError);

    r.commit(120);
    const auto usage = tracker_.usage(alice_);
    EXPECT_EQ(usage.consumed, 120u);
    EXPECT_EQ(usage.reserved, 0u);
}

TEST_F(QuotaTrackerTest, ConcurrentReservationsNeverOvercommit) {
    constexpr int THREADS = 32;

    std::atomic<int> admitted{0}, rejected{0};
    std::vector<QuotaReservation> held(THREADS);
    std::vector<std::thread> threads;

    for (int i = 0; i < THREADS; ++i)
        threads.emplace_back([&, i] {
            try {
                held[i] = tracker_.reserve(alice_, 100);
                ++admitted;
            } catch (const StorageError&) {
                ++rejected;
            }
        });
    for (auto& t : threads) t.join();

    EXPECT_EQ(admitted.load(), 10);
    EXPECT_EQ(rejected.load(), THREADS - 10);
    EXPECT_EQ(tracker_.usage(alice_).reserved, 1000u);
}

TEST_F(QuotaTrackerTest, ReleaseBytesClampsAtZero) {
    tracker_.reserve(alice_, 200).commit();
    tracker_.releaseBytes("alice", 150);
    EXPECT_EQ(tracker_.usage(alice_).consumed, 50u);

    tracker_.releaseBytes("alice", 10'000);
    EXPECT_EQ(tracker_.usage(alice_).consumed, 0u);
}

TEST_F(QuotaTrackerTest, DefaultCeilingAppliesWithoutOverride) {
    const UserIdentity bob{"bob", 0};
    EXPECT_EQ(tracker_.usage(bob).ceiling, 5000u);
    EXPECT_NO_THROW((void)tracker_.reserve(bob, 4000));
}

TEST_F(QuotaTrackerTest, UsersAreIndependent) {
    auto a = tracker_.reserve(alice_, 1000);
    EXPECT_NO_THROW((void)tracker_.reserve({"bob", 1000}, 1000));
}

TEST_F(QuotaTrackerTest, RecalculateOverwritesConsumed) {
    tracker_.reserve(alice_, 700).commit();
    tracker_.recalculate(alice_, 250);
    EXPECT_EQ(tracker_.usage(alice_).consumed, 250u);
}

TEST_F(QuotaTrackerTest, EmptyUserIsRejected) {
    EXPECT_THROW((void)tracker_.reserve({"", 100}, 1), StorageError);
}
