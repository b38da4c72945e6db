#pragma once

#include "types/File.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cf::store {

// Row access only. FileTree owns every invariant over these rows.
class FileStore {
public:
    virtual ~FileStore() = default;

    [[nodiscard]] virtual std::optional<types::File> get(const std::string& id, types::Include include) const = 0;

    [[nodiscard]] virtual std::vector<types::File> children(const std::string& ownerId,
                                                            const std::optional<std::string>& parentId,
                                                            types::Include include) const = 0;

    [[nodiscard]] virtual std::optional<types::File> findChild(const std::string& ownerId,
                                                               const std::optional<std::string>& parentId,
                                                               const std::string& name,
                                                               types::Include include) const = 0;

    virtual void insert(const types::File& file) = 0;

    // Rewrites the whole row; throws if no row has file.id.
    virtual void update(const types::File& file) = 0;

    // Hard delete. Missing ids are ignored.
    virtual void remove(const std::string& id) = 0;
};

}
