#pragma once

#include "store/VersionStore.hpp"

namespace cf::database {

class PgVersionStore final : public store::VersionStore {
public:
    [[nodiscard]] std::optional<unsigned int> latestNumber(const std::string& fileId) const override;
    void insert(const types::FileVersion& version) override;
    [[nodiscard]] std::optional<types::FileVersion> get(const std::string& fileId, unsigned int number) const override;
    [[nodiscard]] std::vector<types::FileVersion> list(const std::string& fileId) const override;
    void remove(const std::string& fileId, unsigned int number) override;
    void removeAll(const std::string& fileId) override;
};

}
