#pragma once

#include "types/FileVersion.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cf::store {

class VersionStore {
public:
    virtual ~VersionStore() = default;

    // Highest recorded number for the file, nullopt if it has none.
    [[nodiscard]] virtual std::optional<unsigned int> latestNumber(const std::string& fileId) const = 0;

    // Throws std::runtime_error if (file_id, version_number) already exists.
    virtual void insert(const types::FileVersion& version) = 0;

    [[nodiscard]] virtual std::optional<types::FileVersion> get(const std::string& fileId, unsigned int number) const = 0;

    // Ascending by version number.
    [[nodiscard]] virtual std::vector<types::FileVersion> list(const std::string& fileId) const = 0;

    virtual void remove(const std::string& fileId, unsigned int number) = 0;
    virtual void removeAll(const std::string& fileId) = 0;
};

}
