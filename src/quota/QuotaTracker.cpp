#include "quota/QuotaTracker.hpp"
#include "storage/StorageError.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <utility>

using namespace cf::quota;
using namespace cf::types;
using namespace cf::storage;
using namespace cf::logging;

// #########################################################################
// ############################ RESERVATION ################################
// #########################################################################

QuotaReservation::QuotaReservation(QuotaTracker* tracker, std::string userId, const uint64_t id, const uintmax_t bytes)
    : tracker_(tracker), userId_(std::move(userId)), id_(id), bytes_(bytes) {}

QuotaReservation::~QuotaReservation() {
    try {
        release();
    } catch (const std::exception& e) {
        LogRegistry::quota()->error("[QuotaReservation] Failed to release reservation {} for user {}: {}", id_, userId_, e.what());
    }
}

QuotaReservation::QuotaReservation(QuotaReservation&& other) noexcept
    : tracker_(std::exchange(other.tracker_, nullptr)), userId_(std::move(other.userId_)),
      id_(other.id_), bytes_(other.bytes_) {}

QuotaReservation& QuotaReservation::operator=(QuotaReservation&& other) noexcept {
    if (this != &other) {
        try {
            release();
        } catch (const std::exception& e) {
            LogRegistry::quota()->error("[QuotaReservation] Failed to release reservation {} for user {}: {}", id_, userId_, e.what());
        }
        tracker_ = std::exchange(other.tracker_, nullptr);
        userId_ = std::move(other.userId_);
        id_ = other.id_;
        bytes_ = other.bytes_;
    }
    return *this;
}

void QuotaReservation::commit() { commit(bytes_); }

void QuotaReservation::commit(const uintmax_t actual) {
    if (!tracker_) throw StorageError(ErrorCode::InvalidOperation, "commit", userId_, "reservation already settled");
    if (actual > bytes_)
        throw StorageError(ErrorCode::InvalidOperation, "commit", userId_,
                           fmt::format("cannot commit {} bytes against a reservation of {}", actual, bytes_));

    tracker_->commitReservation(userId_, id_, actual);
    tracker_ = nullptr;
}

void QuotaReservation::release() {
    if (!tracker_) return;
    tracker_->releaseReservation(userId_, id_);
    tracker_ = nullptr;
}

// #########################################################################
// ############################### TRACKER #################################
// #########################################################################

QuotaTracker::QuotaTracker(std::shared_ptr<store::QuotaStore> store, config::QuotaConfig config)
    : store_(std::move(store)), config_(config) {
    if (!store_) throw std::invalid_argument("[QuotaTracker] quota store is required");
}

UserQuota QuotaTracker::loadLocked(const UserIdentity& user) {
    const auto ceiling = user.storage_ceiling ? user.storage_ceiling : config_.default_ceiling_bytes;

    auto quota = store_->get(user.id);
    if (!quota) {
        UserQuota fresh(user.id, ceiling, 0);
        store_->upsert(fresh);
        return fresh;
    }

    if (user.storage_ceiling && quota->ceiling != user.storage_ceiling) {
        quota->ceiling = user.storage_ceiling;
        store_->upsert(*quota);
    }
    return *quota;
}

uintmax_t QuotaTracker::pendingTotal(const std::string& userId) {
    std::lock_guard lock(pendingMutex_);
    const auto it = pending_.find(userId);
    if (it == pending_.end()) return 0;

    uintmax_t total = 0;
    for (const auto& [_, bytes] : it->second) total += bytes;
    return total;
}

void QuotaTracker::erasePending(const std::string& userId, const uint64_t id) {
    std::lock_guard lock(pendingMutex_);
    const auto it = pending_.find(userId);
    if (it == pending_.end()) return;
    it->second.erase(id);
    if (it->second.empty()) pending_.erase(it);
}

QuotaReservation QuotaTracker::reserve(const UserIdentity& user, const uintmax_t bytes) {
    if (user.id.empty()) throw StorageError(ErrorCode::InvalidOperation, "reserve", "", "reservation without a user id");

    auto guard = locks_.lock(user.id);

    const auto quota = loadLocked(user);
    const auto reserved = pendingTotal(user.id);
    const auto used = quota.consumed + reserved;

    if (bytes > quota.ceiling || used > quota.ceiling - bytes) {
        LogRegistry::quota()->warn("[QuotaTracker] Rejected {} bytes for user {}: consumed={} reserved={} ceiling={}",
                                   bytes, user.id, quota.consumed, reserved, quota.ceiling);
        throw StorageError(ErrorCode::StorageFull, "reserve", user.id,
                           fmt::format("{} bytes requested, {} available", bytes,
                                       used >= quota.ceiling ? 0 : quota.ceiling - used));
    }

    const auto id = nextId_.fetch_add(1);
    {
        std::lock_guard lock(pendingMutex_);
        pending_[user.id][id] = bytes;
    }

    LogRegistry::quota()->debug("[QuotaTracker] Reserved {} bytes for user {} (reservation {})", bytes, user.id, id);
    return {this, user.id, id, bytes};
}

void QuotaTracker::commitReservation(const std::string& userId, const uint64_t id, const uintmax_t actual) {
    auto guard = locks_.lock(userId);

    auto quota = store_->get(userId);
    if (!quota) throw StorageError(ErrorCode::NotFound, "commit", userId, "no quota record for user");

    quota->consumed += actual;
    store_->upsert(*quota);
    erasePending(userId, id);

    LogRegistry::quota()->debug("[QuotaTracker] Committed {} bytes for user {}, consumed={}", actual, userId, quota->consumed);
}

void QuotaTracker::releaseReservation(const std::string& userId, const uint64_t id) {
    auto guard = locks_.lock(userId);
    erasePending(userId, id);
    LogRegistry::quota()->debug("[QuotaTracker] Released reservation {} for user {}", id, userId);
}

void QuotaTracker::releaseBytes(const std::string& userId, const uintmax_t bytes) {
    auto guard = locks_.lock(userId);

    auto quota = store_->get(userId);
    if (!quota) return;

    quota->consumed = bytes > quota->consumed ? 0 : quota->consumed - bytes;
    store_->upsert(*quota);
}

QuotaUsage QuotaTracker::usage(const UserIdentity& user) {
    auto guard = locks_.lock(user.id);
    const auto quota = loadLocked(user);
    return {quota.ceiling, quota.consumed, pendingTotal(user.id)};
}

void QuotaTracker::recalculate(const UserIdentity& user, const uintmax_t consumedBytes) {
    auto guard = locks_.lock(user.id);
    auto quota = loadLocked(user);

    LogRegistry::quota()->info("[QuotaTracker] Recalculated user {}: consumed {} -> {}", user.id, quota.consumed, consumedBytes);
    quota.consumed = consumedBytes;
    store_->upsert(quota);
}
