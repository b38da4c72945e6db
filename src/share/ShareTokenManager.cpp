#include "share/ShareTokenManager.hpp"
#include "storage/StorageError.hpp"
#include "crypto/IdGenerator.hpp"
#include "crypto/PasswordHash.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>

using namespace cf::share;
using namespace cf::types;
using namespace cf::storage;
using namespace cf::logging;

namespace {

// Enough to correlate log lines without making the token usable.
std::string redact(const std::string& token) {
    return token.size() <= 6 ? std::string("***") : token.substr(0, 6) + "***";
}

}

ShareTokenManager::ShareTokenManager(std::shared_ptr<store::ShareStore> shares,
                                     std::shared_ptr<store::FileStore> files,
                                     config::SharingConfig config)
    : shares_(std::move(shares)), files_(std::move(files)), config_(config) {
    if (!shares_ || !files_) throw std::invalid_argument("[ShareTokenManager] share and file stores are required");
    if (config_.token_length < 16) throw std::invalid_argument("[ShareTokenManager] token_length must be at least 16");
    if (config_.max_token_attempts == 0) throw std::invalid_argument("[ShareTokenManager] max_token_attempts must be positive");
}

// #########################################################################
// ################################ ISSUE ##################################
// #########################################################################

std::string ShareTokenManager::uniqueToken() const {
    for (unsigned int attempt = 1; attempt <= config_.max_token_attempts; ++attempt) {
        auto token = crypto::randomToken(config_.token_length);
        if (!shares_->tokenExists(token)) return token;
        LogRegistry::share()->warn("[ShareTokenManager] Share token collision on attempt {}", attempt);
    }
    throw std::runtime_error(fmt::format("[ShareTokenManager] No unique share token after {} attempts",
                                         config_.max_token_attempts));
}

Share ShareTokenManager::issue(const ShareRequest& req) {
    const auto file = files_->get(req.file_id, Include::ActiveOnly);
    if (!file) throw StorageError(ErrorCode::NotFound, "issueShare", req.file_id, "no active file with this id");
    if (file->owner_id != req.issuer_id)
        throw StorageError(ErrorCode::PermissionDenied, "issueShare", req.file_id, "only the owner may share a file");
    if (req.max_downloads && *req.max_downloads == 0)
        throw StorageError(ErrorCode::InvalidOperation, "issueShare", req.file_id, "max_downloads must be positive");

    Share share;
    share.id = crypto::uuid4();
    share.file_id = req.file_id;
    share.issued_by = req.issuer_id;
    share.access = req.access;
    share.expires_at = req.expires_at;
    share.max_downloads = req.max_downloads;
    share.download_count = 0;
    share.is_active = true;
    share.created_at = std::time(nullptr);
    if (req.password && !req.password->empty()) share.password_hash = crypto::hashPassword(*req.password);

    // tokenExists() and insert() are not atomic, so a concurrent issuer may
    // still win the token; the store's uniqueness check catches that.
    for (unsigned int attempt = 1;; ++attempt) {
        share.token = uniqueToken();
        try {
            shares_->insert(share);
            break;
        } catch (const std::runtime_error& e) {
            if (attempt >= config_.max_token_attempts) throw;
            LogRegistry::share()->warn("[ShareTokenManager] Insert of share {} failed, retrying with a new token: {}",
                                       share.id, e.what());
        }
    }

    LogRegistry::share()->debug("[ShareTokenManager] Issued {} share {} on file {} ({})",
                                to_string(share.access), share.id, share.file_id, redact(share.token));
    return share;
}

// #########################################################################
// ############################## VALIDATION ###############################
// #########################################################################

Share ShareTokenManager::check(const std::string& token, const std::optional<std::string>& password) const {
    const auto share = shares_->getByToken(token);
    if (!share) {
        LogRegistry::share()->debug("[ShareTokenManager] Unknown share token {}", redact(token));
        throw StorageError(ErrorCode::NotFound, "validateShare", "", "unknown share token");
    }

    if (share->exhausted()) {
        LogRegistry::share()->debug("[ShareTokenManager] Share {} exhausted ({}/{})",
                                    share->id, share->download_count, *share->max_downloads);
        throw StorageError(ErrorCode::ShareExhausted, "validateShare", share->id, "share download limit reached");
    }

    if (share->expired(std::time(nullptr))) {
        LogRegistry::share()->debug("[ShareTokenManager] Share {} expired", share->id);
        throw StorageError(ErrorCode::ShareExpired, "validateShare", share->id, "share has expired");
    }

    if (!share->is_active) {
        LogRegistry::share()->debug("[ShareTokenManager] Share {} revoked", share->id);
        throw StorageError(ErrorCode::ShareRevoked, "validateShare", share->id, "share has been revoked");
    }

    if (!files_->get(share->file_id, Include::ActiveOnly))
        throw StorageError(ErrorCode::NotFound, "validateShare", share->id, "shared file no longer exists");

    if (share->password_hash && (!password || !crypto::verifyPassword(*password, *share->password_hash))) {
        LogRegistry::share()->warn("[ShareTokenManager] Password rejected for share {}", share->id);
        throw StorageError(ErrorCode::ShareForbidden, "validateShare", share->id, "share password does not match");
    }

    return *share;
}

ShareAccess ShareTokenManager::validate(const std::string& token, const std::optional<std::string>& password) const {
    return check(token, password).access;
}

Share ShareTokenManager::authorizeDownload(const std::string& token, const std::optional<std::string>& password) const {
    auto share = check(token, password);
    if (share.access == ShareAccess::View)
        throw StorageError(ErrorCode::PermissionDenied, "authorizeDownload", share.id, "share only grants view access");
    return share;
}

void ShareTokenManager::recordDownload(const std::string& token) {
    const auto share = shares_->getByToken(token);
    if (!share) throw StorageError(ErrorCode::NotFound, "recordDownload", "", "unknown share token");

    auto guard = locks_.lock(share->id);

    if (shares_->tryIncrementDownloads(share->id)) return;

    const auto current = shares_->get(share->id);
    if (!current) throw StorageError(ErrorCode::NotFound, "recordDownload", share->id, "share no longer exists");
    if (current->exhausted())
        throw StorageError(ErrorCode::ShareExhausted, "recordDownload", share->id, "share download limit reached");
    throw StorageError(ErrorCode::ShareRevoked, "recordDownload", share->id, "share has been revoked");
}

// #########################################################################
// ############################### UPDATING ################################
// #########################################################################

Share ShareTokenManager::update(const std::string& shareId, const std::string& actorId, const ShareUpdate& changes) {
    auto guard = locks_.lock(shareId);

    auto share = shares_->get(shareId);
    if (!share) throw StorageError(ErrorCode::NotFound, "updateShare", shareId, "no share with this id");
    if (share->issued_by != actorId)
        throw StorageError(ErrorCode::PermissionDenied, "updateShare", shareId, "only the issuer may update a share");
    if (!share->is_active)
        throw StorageError(ErrorCode::ShareRevoked, "updateShare", shareId, "share has been revoked");

    if (changes.max_downloads && *changes.max_downloads) {
        const auto max = **changes.max_downloads;
        if (max == 0)
            throw StorageError(ErrorCode::InvalidOperation, "updateShare", shareId, "max_downloads must be positive");
        if (max < share->download_count)
            throw StorageError(ErrorCode::InvalidOperation, "updateShare", shareId,
                               fmt::format("max_downloads {} is below the {} downloads already served",
                                           max, share->download_count));
    }

    if (changes.password) {
        if (changes.password->empty()) share->password_hash.reset();
        else share->password_hash = crypto::hashPassword(*changes.password);
    }
    if (changes.access) share->access = *changes.access;
    if (changes.expires_at) share->expires_at = *changes.expires_at;
    if (changes.max_downloads) share->max_downloads = *changes.max_downloads;

    if (!shares_->update(*share))
        throw StorageError(ErrorCode::ShareRevoked, "updateShare", shareId, "share was revoked during the update");

    LogRegistry::share()->debug("[ShareTokenManager] Share {} updated by {}", shareId, actorId);
    return *share;
}

// #########################################################################
// ############################### REVOKING ################################
// #########################################################################

void ShareTokenManager::revoke(const std::string& shareId, const std::string& actorId) {
    auto guard = locks_.lock(shareId);

    const auto share = shares_->get(shareId);
    if (!share) throw StorageError(ErrorCode::NotFound, "revokeShare", shareId, "no share with this id");
    if (share->issued_by != actorId)
        throw StorageError(ErrorCode::PermissionDenied, "revokeShare", shareId, "only the issuer may revoke a share");

    shares_->setActive(shareId, false);
    LogRegistry::share()->debug("[ShareTokenManager] Share {} revoked by {}", shareId, actorId);
}

size_t ShareTokenManager::revokeAllForFile(const std::string& fileId) {
    size_t revoked = 0;
    for (const auto& s : shares_->listForFile(fileId)) {
        if (!s.is_active) continue;
        auto guard = locks_.lock(s.id);
        shares_->setActive(s.id, false);
        ++revoked;
    }

    if (revoked) LogRegistry::share()->debug("[ShareTokenManager] Revoked {} shares on file {}", revoked, fileId);
    return revoked;
}

std::vector<Share> ShareTokenManager::listForFile(const std::string& fileId) const {
    return shares_->listForFile(fileId);
}

std::vector<Share> ShareTokenManager::listForUser(const std::string& userId) const {
    return shares_->listForUser(userId);
}
