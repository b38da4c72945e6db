#pragma once

#include "config/Config.hpp"
#include "concurrency/KeyedMutex.hpp"
#include "store/QuotaStore.hpp"
#include "types/UserQuota.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cf::quota {

class QuotaTracker;

// Bytes admitted against a user's ceiling but not yet written. Dropping an
// unsettled reservation releases it. Must not outlive its tracker.
class QuotaReservation {
public:
    QuotaReservation() = default;
    ~QuotaReservation();

    QuotaReservation(QuotaReservation&& other) noexcept;
    QuotaReservation& operator=(QuotaReservation&& other) noexcept;

    QuotaReservation(const QuotaReservation&) = delete;
    QuotaReservation& operator=(const QuotaReservation&) = delete;

    // Converts the reservation into consumption.
    void commit();

    // Commits only `actual` bytes; actual may not exceed bytes().
    void commit(uintmax_t actual);

    void release();

    [[nodiscard]] bool active() const { return tracker_ != nullptr; }
    [[nodiscard]] uintmax_t bytes() const { return bytes_; }
    [[nodiscard]] const std::string& userId() const { return userId_; }

private:
    friend class QuotaTracker;

    QuotaReservation(QuotaTracker* tracker, std::string userId, uint64_t id, uintmax_t bytes);

    QuotaTracker* tracker_ = nullptr;
    std::string userId_;
    uint64_t id_ = 0;
    uintmax_t bytes_ = 0;
};

class QuotaTracker {
public:
    QuotaTracker(std::shared_ptr<store::QuotaStore> store, config::QuotaConfig config);

    // Admits `bytes` iff consumed + outstanding reservations + bytes <= ceiling,
    // otherwise throws StorageError(StorageFull). Serialized per user.
    [[nodiscard]] QuotaReservation reserve(const types::UserIdentity& user, uintmax_t bytes);

    // Permanent delete or version pruning. Clamped at zero.
    void releaseBytes(const std::string& userId, uintmax_t bytes);

    [[nodiscard]] types::QuotaUsage usage(const types::UserIdentity& user);

    // Administrative resync of the consumed counter with what is actually stored.
    void recalculate(const types::UserIdentity& user, uintmax_t consumedBytes);

private:
    friend class QuotaReservation;

    std::shared_ptr<store::QuotaStore> store_;
    config::QuotaConfig config_;
    concurrency::KeyedMutex<std::string> locks_;

    std::mutex pendingMutex_;
    std::unordered_map<std::string, std::unordered_map<uint64_t, uintmax_t>> pending_;
    std::atomic<uint64_t> nextId_{1};

    // Caller holds the user's lock.
    types::UserQuota loadLocked(const types::UserIdentity& user);
    uintmax_t pendingTotal(const std::string& userId);
    void erasePending(const std::string& userId, uint64_t id);

    void commitReservation(const std::string& userId, uint64_t id, uintmax_t actual);
    void releaseReservation(const std::string& userId, uint64_t id);
};

}
