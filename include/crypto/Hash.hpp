#pragma once

#include <sodium.h>

#include <filesystem>
#include <istream>
#include <string>

namespace cf::crypto {

class Hash {
public:
    static std::string blake2b(const std::filesystem::path& filepath);
    static std::string blake2b(std::istream& in);
    static std::string blake2b(const std::string& data);

    // Incremental form for callers that already read the bytes in chunks.
    class Blake2b {
    public:
        Blake2b();

        void update(const char* data, size_t len);
        [[nodiscard]] std::string finalHex();

    private:
        crypto_generichash_state state_{};
        bool finished_ = false;
    };
};

}
