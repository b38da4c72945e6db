#pragma once

#include "types/UserQuota.hpp"

#include <optional>
#include <string>

namespace cf::store {

class QuotaStore {
public:
    virtual ~QuotaStore() = default;

    [[nodiscard]] virtual std::optional<types::UserQuota> get(const std::string& userId) const = 0;
    virtual void upsert(const types::UserQuota& quota) = 0;
};

}
