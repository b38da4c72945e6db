#pragma once

#include "store/FileStore.hpp"

namespace cf::database {

class PgFileStore final : public store::FileStore {
public:
    [[nodiscard]] std::optional<types::File> get(const std::string& id, types::Include include) const override;

    [[nodiscard]] std::vector<types::File> children(const std::string& ownerId,
                                                    const std::optional<std::string>& parentId,
                                                    types::Include include) const override;

    [[nodiscard]] std::optional<types::File> findChild(const std::string& ownerId,
                                                       const std::optional<std::string>& parentId,
                                                       const std::string& name,
                                                       types::Include include) const override;

    void insert(const types::File& file) override;
    void update(const types::File& file) override;
    void remove(const std::string& id) override;
};

}
