#pragma once

#include "types/Share.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cf::store {

class ShareStore {
public:
    virtual ~ShareStore() = default;

    [[nodiscard]] virtual std::optional<types::Share> get(const std::string& id) const = 0;
    [[nodiscard]] virtual std::optional<types::Share> getByToken(const std::string& token) const = 0;
    [[nodiscard]] virtual bool tokenExists(const std::string& token) const = 0;

    // Throws std::runtime_error on a duplicate token.
    virtual void insert(const types::Share& share) = 0;

    virtual void setActive(const std::string& id, bool active) = 0;

    // Rewrites password_hash, access, expires_at and max_downloads of an
    // active share. Returns false when the share is missing or inactive.
    [[nodiscard]] virtual bool update(const types::Share& share) = 0;

    // Increments download_count unless the share is inactive or already at
    // max_downloads. Returns whether the increment happened.
    [[nodiscard]] virtual bool tryIncrementDownloads(const std::string& id) = 0;

    [[nodiscard]] virtual std::vector<types::Share> listForFile(const std::string& fileId) const = 0;
    [[nodiscard]] virtual std::vector<types::Share> listForUser(const std::string& userId) const = 0;
};

}
