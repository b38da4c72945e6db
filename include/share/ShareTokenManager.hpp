#pragma once

#include "config/Config.hpp"
#include "concurrency/KeyedMutex.hpp"
#include "store/FileStore.hpp"
#include "store/ShareStore.hpp"
#include "types/Share.hpp"

#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cf::share {

struct ShareRequest {
    std::string file_id;
    std::string issuer_id;
    types::ShareAccess access = types::ShareAccess::View;
    std::optional<std::string> password;     // plaintext, hashed before the record is built
    std::optional<std::time_t> expires_at;
    std::optional<unsigned int> max_downloads;
};

// Unset fields are left alone. An empty password removes the password, and
// an engaged nullopt clears expires_at or max_downloads.
struct ShareUpdate {
    std::optional<std::string> password;
    std::optional<types::ShareAccess> access;
    std::optional<std::optional<std::time_t>> expires_at;
    std::optional<std::optional<unsigned int>> max_downloads;
};

class ShareTokenManager {
public:
    ShareTokenManager(std::shared_ptr<store::ShareStore> shares,
                      std::shared_ptr<store::FileStore> files,
                      config::SharingConfig config);

    // Returns the stored share, token included.
    types::Share issue(const ShareRequest& req);

    // Checks, in order: unknown token (NotFound), exhausted, expired, revoked,
    // target file gone (NotFound), password (ShareForbidden).
    [[nodiscard]] types::ShareAccess validate(const std::string& token,
                                              const std::optional<std::string>& password = std::nullopt) const;

    // validate() plus a capability check; view-only shares are PermissionDenied.
    [[nodiscard]] types::Share authorizeDownload(const std::string& token,
                                                 const std::optional<std::string>& password = std::nullopt) const;

    // Counts one finished transfer. Never lets download_count pass max_downloads.
    void recordDownload(const std::string& token);

    // Only the issuer may update. A revoked share stays revoked (ShareRevoked).
    types::Share update(const std::string& shareId, const std::string& actorId, const ShareUpdate& changes);

    // Only the issuer may revoke. Revoking twice is harmless.
    void revoke(const std::string& shareId, const std::string& actorId);

    // Returns how many shares were deactivated.
    size_t revokeAllForFile(const std::string& fileId);

    [[nodiscard]] std::vector<types::Share> listForFile(const std::string& fileId) const;
    [[nodiscard]] std::vector<types::Share> listForUser(const std::string& userId) const;

private:
    std::shared_ptr<store::ShareStore> shares_;
    std::shared_ptr<store::FileStore> files_;
    config::SharingConfig config_;
    concurrency::KeyedMutex<std::string> locks_;

    [[nodiscard]] types::Share check(const std::string& token, const std::optional<std::string>& password) const;
    [[nodiscard]] std::string uniqueToken() const;
};

}
