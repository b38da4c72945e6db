#pragma once

#include "config/Config.hpp"
#include "concurrency/CancelToken.hpp"
#include "quota/QuotaTracker.hpp"
#include "storage/StorageBackend.hpp"
#include "upload/UploadSession.hpp"

#include <chrono>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cf::upload {

// Drives chunked uploads against the configured backend. Sessions live in
// memory only and are destroyed on completion, abort or reclamation.
class MultipartCoordinator {
public:
    using Clock = std::chrono::system_clock;

    static constexpr unsigned int MAX_PART_NUMBER = 10000;

    MultipartCoordinator(std::shared_ptr<storage::StorageBackend> backend, config::MultipartConfig config);
    ~MultipartCoordinator();

    MultipartCoordinator(const MultipartCoordinator&) = delete;
    MultipartCoordinator& operator=(const MultipartCoordinator&) = delete;

    // The session takes ownership of `reservation`: committed on completion,
    // released on abort, cancellation or reclamation.
    [[nodiscard]] std::string initiate(const std::string& key,
                                       quota::QuotaReservation reservation = {},
                                       const concurrency::CancelToken& cancel = {});

    // Re-uploading a part number replaces its identifier. Parts may arrive
    // concurrently and out of order. A cancelled transfer aborts the session.
    [[nodiscard]] std::string uploadPart(const std::string& uploadId, unsigned int partNumber,
                                         std::istream& in, uintmax_t size,
                                         const concurrency::CancelToken& cancel = {});

    // orderedPartIds[i] must be the identifier returned for part i + 1.
    // Throws UploadFailed and leaves the session open on any mismatch.
    void complete(const std::string& uploadId, const std::vector<std::string>& orderedPartIds,
                  const concurrency::CancelToken& cancel = {});

    // Unknown, aborted and completed sessions are ignored.
    void abort(const std::string& uploadId, const concurrency::CancelToken& cancel = {});

    [[nodiscard]] std::optional<SessionInfo> describe(const std::string& uploadId) const;

    [[nodiscard]] std::vector<SessionInfo> listStaleSessions(Clock::time_point now) const;

    // Aborts every stale session not currently completing. Returns the count.
    size_t reapStaleSessions(Clock::time_point now);

    [[nodiscard]] size_t activeSessions() const;

    [[nodiscard]] const config::MultipartConfig& config() const { return config_; }

private:
    std::shared_ptr<storage::StorageBackend> backend_;
    config::MultipartConfig config_;

    mutable std::mutex sessionsMutex_;
    std::unordered_map<std::string, std::shared_ptr<UploadSession>> sessions_;

    [[nodiscard]] std::shared_ptr<UploadSession> find(const std::string& uploadId) const;
    [[nodiscard]] std::shared_ptr<UploadSession> requireOpen(const std::string& uploadId, const std::string& operation) const;

    void forget(const std::string& uploadId);

    // Marks the session aborted, drops it and releases its backend data and
    // reservation. No-op when the session already reached a terminal state.
    void abortSession(const std::shared_ptr<UploadSession>& session, const concurrency::CancelToken& cancel);

    void discardOrphanedPart(const std::string& key, const std::string& backendId,
                             const std::string& uploadId, unsigned int partNumber) const;

    void validateParts(const UploadSession& session, const std::vector<std::string>& orderedPartIds) const;
};

}
