#pragma once

#include <string>

namespace cf::storage {

struct MimeTypes {
    static constexpr auto DEFAULT = "application/octet-stream";

    // Extension lookup, case-insensitive; unknown extensions map to DEFAULT.
    [[nodiscard]] static std::string fromPath(const std::string& path);
};

}
