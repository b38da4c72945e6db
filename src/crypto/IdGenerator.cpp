#include "crypto/IdGenerator.hpp"

#include <sodium.h>
#include <array>
#include <cstdio>
#include <stdexcept>
#include <vector>

namespace cf::crypto {

void ensureSodiumInit() {
    static const int init = [] {
        if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
        return 1;
    }();
    (void)init;
}

std::string b32CrockfordEncode(const uint8_t* data, const size_t len) {
    if (len == 0) return {};

    std::string out;
    out.reserve((len * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;

    for (size_t i = 0; i < len; ++i) {
        buffer = (buffer << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(kBase32Crockford[(buffer >> bits) & 0x1F]);
        }
    }
    if (bits > 0) out.push_back(kBase32Crockford[(buffer << (5 - bits)) & 0x1F]);

    return out;
}

std::string uuid4() {
    ensureSodiumInit();
    std::array<uint8_t, 16> b{};
    randombytes_buf(b.data(), b.size());
    b[6] = (b[6] & 0x0F) | 0x40; // version 4
    b[8] = (b[8] & 0x3F) | 0x80; // variant

    char s[37];
    std::snprintf(s, sizeof s,
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
        b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return {s};
}

std::string randomToken(const size_t length) {
    if (length == 0) throw std::invalid_argument("[IdGenerator] token length must be positive");
    ensureSodiumInit();

    // Every 5 random bytes yield 8 characters.
    std::vector<uint8_t> bytes((length * 5 + 7) / 8);
    randombytes_buf(bytes.data(), bytes.size());

    auto token = b32CrockfordEncode(bytes.data(), bytes.size());
    sodium_memzero(bytes.data(), bytes.size());
    token.resize(length);
    return token;
}

}
