#pragma once

#include "store/ShareStore.hpp"

namespace cf::database {

class PgShareStore final : public store::ShareStore {
public:
    [[nodiscard]] std::optional<types::Share> get(const std::string& id) const override;
    [[nodiscard]] std::optional<types::Share> getByToken(const std::string& token) const override;
    [[nodiscard]] bool tokenExists(const std::string& token) const override;
    void insert(const types::Share& share) override;
    void setActive(const std::string& id, bool active) override;
    [[nodiscard]] bool update(const types::Share& share) override;
    [[nodiscard]] bool tryIncrementDownloads(const std::string& id) override;
    [[nodiscard]] std::vector<types::Share> listForFile(const std::string& fileId) const override;
    [[nodiscard]] std::vector<types::Share> listForUser(const std::string& userId) const override;
};

}
