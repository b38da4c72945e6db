#include "upload/MultipartCoordinator.hpp"
#include "storage/StorageError.hpp"
#include "crypto/IdGenerator.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>

using namespace cf::upload;
using namespace cf::storage;
using namespace cf::concurrency;
using namespace cf::logging;

MultipartCoordinator::MultipartCoordinator(std::shared_ptr<StorageBackend> backend, config::MultipartConfig config)
    : backend_(std::move(backend)), config_(config) {
    if (!backend_) throw std::invalid_argument("[MultipartCoordinator] storage backend is required");
}

MultipartCoordinator::~MultipartCoordinator() {
    std::lock_guard lock(sessionsMutex_);
    if (!sessions_.empty())
        LogRegistry::upload()->warn("[MultipartCoordinator] Shutting down with {} open upload sessions", sessions_.size());
}

// #########################################################################
// ############################## LIFECYCLE ################################
// #########################################################################

std::string MultipartCoordinator::initiate(const std::string& key, quota::QuotaReservation reservation,
                                           const CancelToken& cancel) {
    auto session = std::make_shared<UploadSession>();
    session->upload_id = crypto::uuid4();
    session->key = key;
    session->backend_upload_id = backend_->initiateMultipart(key, cancel);
    session->reservation = std::move(reservation);
    session->created_at = Clock::now();
    session->expires_at = session->created_at + config_.session_ttl;

    {
        std::lock_guard lock(sessionsMutex_);
        sessions_.emplace(session->upload_id, session);
    }

    LogRegistry::upload()->debug("[MultipartCoordinator] Initiated upload {} for {}", session->upload_id, key);
    return session->upload_id;
}

std::string MultipartCoordinator::uploadPart(const std::string& uploadId, const unsigned int partNumber,
                                             std::istream& in, const uintmax_t size, const CancelToken& cancel) {
    if (partNumber < 1 || partNumber > MAX_PART_NUMBER)
        throw StorageError(ErrorCode::UploadFailed, "uploadPart", uploadId,
                           fmt::format("part number {} outside 1..{}", partNumber, MAX_PART_NUMBER));

    const auto session = requireOpen(uploadId, "uploadPart");

    std::string key, backendId;
    {
        std::lock_guard lock(session->mutex);
        if (session->terminal())
            throw StorageError(ErrorCode::NotFound, "uploadPart", uploadId, "upload session is closed");
        if (session->state == SessionState::Completing)
            throw StorageError(ErrorCode::UploadFailed, "uploadPart", uploadId, "upload session is completing");

        session->state = SessionState::Uploading;
        ++session->parts_in_flight;
        key = session->key;
        backendId = session->backend_upload_id;
    }

    std::string partId;
    try {
        partId = backend_->uploadPart(key, backendId, partNumber, in, size, cancel);
    } catch (const StorageError& e) {
        bool closed;
        {
            std::lock_guard lock(session->mutex);
            --session->parts_in_flight;
            closed = session->terminal();
        }

        if (closed) {
            discardOrphanedPart(key, backendId, uploadId, partNumber);
            throw StorageError(ErrorCode::NotFound, "uploadPart", uploadId, "upload session closed during part upload");
        }

        if (e.code() == ErrorCode::Cancelled) {
            LogRegistry::upload()->debug("[MultipartCoordinator] Part {} of upload {} cancelled, aborting session",
                                         partNumber, uploadId);
            try {
                abortSession(session, {});
            } catch (const std::exception& abortErr) {
                LogRegistry::upload()->error("[MultipartCoordinator] Failed to abort cancelled upload {}: {}",
                                             uploadId, abortErr.what());
            }
        }
        throw;
    } catch (const std::exception&) {
        std::lock_guard lock(session->mutex);
        --session->parts_in_flight;
        throw;
    }

    {
        std::lock_guard lock(session->mutex);
        --session->parts_in_flight;
        if (!session->terminal()) {
            session->parts[partNumber] = {partId, size};
            return partId;
        }
    }

    discardOrphanedPart(key, backendId, uploadId, partNumber);
    throw StorageError(ErrorCode::NotFound, "uploadPart", uploadId, "upload session closed during part upload");
}

// The session was aborted while this part was in flight, so its data may
// have landed after the backend cleanup ran.
void MultipartCoordinator::discardOrphanedPart(const std::string& key, const std::string& backendId,
                                               const std::string& uploadId, const unsigned int partNumber) const {
    try {
        backend_->abortMultipart(key, backendId, {});
    } catch (const std::exception& e) {
        LogRegistry::upload()->error("[MultipartCoordinator] Failed to discard part {} of closed upload {}: {}",
                                     partNumber, uploadId, e.what());
    }
}

void MultipartCoordinator::validateParts(const UploadSession& session, const std::vector<std::string>& orderedPartIds) const {
    if (orderedPartIds.empty())
        throw StorageError(ErrorCode::UploadFailed, "complete", session.upload_id, "no parts supplied");

    const auto minPartSize = backend_->minPartSize();
    const auto count = static_cast<unsigned int>(orderedPartIds.size());

    for (unsigned int n = 1; n <= count; ++n) {
        const auto it = session.parts.find(n);
        if (it == session.parts.end())
            throw StorageError(ErrorCode::UploadFailed, "complete", session.upload_id,
                               fmt::format("part {} was never uploaded", n));

        if (it->second.id != orderedPartIds[n - 1])
            throw StorageError(ErrorCode::UploadFailed, "complete", session.upload_id,
                               fmt::format("identifier at position {} does not match part {}", n, n));

        if (n < count && it->second.size < minPartSize)
            throw StorageError(ErrorCode::UploadFailed, "complete", session.upload_id,
                               fmt::format("part {} is {} bytes, below the {} byte minimum", n,
                                           it->second.size, minPartSize));
    }
}

void MultipartCoordinator::complete(const std::string& uploadId, const std::vector<std::string>& orderedPartIds,
                                    const CancelToken& cancel) {
    const auto session = requireOpen(uploadId, "complete");

    std::string key, backendId;
    uintmax_t total = 0;
    SessionState previous;
    {
        std::lock_guard lock(session->mutex);
        if (session->terminal())
            throw StorageError(ErrorCode::NotFound, "complete", uploadId, "upload session is closed");
        if (session->state == SessionState::Completing)
            throw StorageError(ErrorCode::UploadFailed, "complete", uploadId, "upload session is already completing");
        if (session->parts_in_flight > 0)
            throw StorageError(ErrorCode::UploadFailed, "complete", uploadId,
                               fmt::format("{} part uploads still in flight", session->parts_in_flight));

        validateParts(*session, orderedPartIds);

        for (unsigned int n = 1; n <= orderedPartIds.size(); ++n) total += session->parts.at(n).size;
        if (session->reservation.active() && total > session->reservation.bytes())
            throw StorageError(ErrorCode::StorageFull, "complete", uploadId,
                               fmt::format("{} bytes uploaded against a reservation of {}", total,
                                           session->reservation.bytes()));

        previous = session->state;
        session->state = SessionState::Completing;
        key = session->key;
        backendId = session->backend_upload_id;
    }

    try {
        backend_->completeMultipart(key, backendId, orderedPartIds, cancel);
    } catch (const StorageError& e) {
        {
            std::lock_guard lock(session->mutex);
            session->state = previous;
        }

        if (e.code() == ErrorCode::Cancelled) {
            LogRegistry::upload()->debug("[MultipartCoordinator] Completion of upload {} cancelled, aborting session",
                                         uploadId);
            try {
                abortSession(session, {});
            } catch (const std::exception& abortErr) {
                LogRegistry::upload()->error("[MultipartCoordinator] Failed to abort cancelled upload {}: {}",
                                             uploadId, abortErr.what());
            }
        }
        throw;
    }

    quota::QuotaReservation reservation;
    {
        std::lock_guard lock(session->mutex);
        session->state = SessionState::Completed;
        reservation = std::move(session->reservation);
    }
    forget(uploadId);

    if (reservation.active()) reservation.commit(total);

    LogRegistry::upload()->debug("[MultipartCoordinator] Completed upload {} ({} parts, {} bytes) at {}",
                                 uploadId, orderedPartIds.size(), total, key);
}

void MultipartCoordinator::abort(const std::string& uploadId, const CancelToken& cancel) {
    const auto session = find(uploadId);
    if (!session) {
        LogRegistry::upload()->debug("[MultipartCoordinator] Abort of unknown or closed upload {} ignored", uploadId);
        return;
    }

    {
        std::lock_guard lock(session->mutex);
        if (session->state == SessionState::Completing)
            throw StorageError(ErrorCode::InvalidOperation, "abort", uploadId, "upload session is completing");
    }

    abortSession(session, cancel);
}

void MultipartCoordinator::abortSession(const std::shared_ptr<UploadSession>& session, const CancelToken& cancel) {
    std::string key, backendId;
    quota::QuotaReservation reservation;
    {
        std::lock_guard lock(session->mutex);
        if (session->terminal()) return;
        session->state = SessionState::Aborted;
        key = session->key;
        backendId = session->backend_upload_id;
        reservation = std::move(session->reservation);
    }

    forget(session->upload_id);
    reservation.release();

    backend_->abortMultipart(key, backendId, cancel);
    LogRegistry::upload()->debug("[MultipartCoordinator] Aborted upload {} for {}", session->upload_id, key);
}

// #########################################################################
// ############################# INSPECTION ################################
// #########################################################################

std::optional<SessionInfo> MultipartCoordinator::describe(const std::string& uploadId) const {
    const auto session = find(uploadId);
    if (!session) return std::nullopt;
    std::lock_guard lock(session->mutex);
    return session->snapshot();
}

std::vector<SessionInfo> MultipartCoordinator::listStaleSessions(const Clock::time_point now) const {
    std::vector<std::shared_ptr<UploadSession>> open;
    {
        std::lock_guard lock(sessionsMutex_);
        open.reserve(sessions_.size());
        for (const auto& [_, s] : sessions_) open.push_back(s);
    }

    std::vector<SessionInfo> stale;
    for (const auto& s : open) {
        std::lock_guard lock(s->mutex);
        if (s->stale(now)) stale.push_back(s->snapshot());
    }
    return stale;
}

size_t MultipartCoordinator::reapStaleSessions(const Clock::time_point now) {
    size_t reaped = 0;
    for (const auto& info : listStaleSessions(now)) {
        if (info.state == SessionState::Completing) continue;

        const auto session = find(info.upload_id);
        if (!session) continue;

        try {
            abortSession(session, {});
            ++reaped;
        } catch (const std::exception& e) {
            LogRegistry::upload()->error("[MultipartCoordinator] Failed to reap stale upload {} for {}: {}",
                                         info.upload_id, info.key, e.what());
        }
    }

    if (reaped) LogRegistry::upload()->info("[MultipartCoordinator] Reaped {} stale upload sessions", reaped);
    return reaped;
}

size_t MultipartCoordinator::activeSessions() const {
    std::lock_guard lock(sessionsMutex_);
    return sessions_.size();
}

// #########################################################################
// ############################### HELPERS #################################
// #########################################################################

std::shared_ptr<UploadSession> MultipartCoordinator::find(const std::string& uploadId) const {
    std::lock_guard lock(sessionsMutex_);
    const auto it = sessions_.find(uploadId);
    return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<UploadSession> MultipartCoordinator::requireOpen(const std::string& uploadId, const std::string& operation) const {
    auto session = find(uploadId);
    if (!session) throw StorageError(ErrorCode::NotFound, operation, uploadId, "no open upload session with this id");
    return session;
}

void MultipartCoordinator::forget(const std::string& uploadId) {
    std::lock_guard lock(sessionsMutex_);
    sessions_.erase(uploadId);
}
