#include "crypto/Hash.hpp"
#include "crypto/IdGenerator.hpp"

#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>

using namespace cf::crypto;

Hash::Blake2b::Blake2b() {
    ensureSodiumInit();
    crypto_generichash_init(&state_, nullptr, 0, crypto_generichash_BYTES);
}

void Hash::Blake2b::update(const char* data, const size_t len) {
    if (finished_) throw std::logic_error("[Hash] update() after finalHex()");
    crypto_generichash_update(&state_, reinterpret_cast<const unsigned char*>(data), len);
}

std::string Hash::Blake2b::finalHex() {
    if (finished_) throw std::logic_error("[Hash] finalHex() called twice");
    finished_ = true;

    unsigned char hash[crypto_generichash_BYTES];
    crypto_generichash_final(&state_, hash, sizeof(hash));

    std::ostringstream result;
    for (const unsigned char c : hash)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);

    return result.str();
}

std::string Hash::blake2b(std::istream& in) {
    Blake2b hasher;
    char buffer[8192];
    while (in.good()) {
        in.read(buffer, sizeof(buffer));
        hasher.update(buffer, static_cast<size_t>(in.gcount()));
    }
    if (in.bad()) throw std::runtime_error("[Hash] Stream read failed while hashing");
    return hasher.finalHex();
}

std::string Hash::blake2b(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + filepath.string());
    return blake2b(file);
}

std::string Hash::blake2b(const std::string& data) {
    Blake2b hasher;
    hasher.update(data.data(), data.size());
    return hasher.finalHex();
}
