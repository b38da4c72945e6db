#pragma once

#include "store/QuotaStore.hpp"

namespace cf::database {

class PgQuotaStore final : public store::QuotaStore {
public:
    [[nodiscard]] std::optional<types::UserQuota> get(const std::string& userId) const override;
    void upsert(const types::UserQuota& quota) override;
};

}
