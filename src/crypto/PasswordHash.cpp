#include "crypto/PasswordHash.hpp"
#include "crypto/IdGenerator.hpp"

#include <sodium.h>
#include <stdexcept>

namespace cf::crypto {

// Share passwords are checked on every download, so the interactive limits apply.
constexpr unsigned long long OPSLIMIT = crypto_pwhash_OPSLIMIT_INTERACTIVE;
constexpr std::size_t MEMLIMIT = crypto_pwhash_MEMLIMIT_INTERACTIVE;

std::string hashPassword(const std::string& password) {
    ensureSodiumInit();
    char hashed[crypto_pwhash_STRBYTES];

    if (crypto_pwhash_str(hashed, password.c_str(), password.size(), OPSLIMIT, MEMLIMIT) != 0)
        throw std::runtime_error("Password hashing failed (out of memory?)");

    return {hashed};
}

bool verifyPassword(const std::string& password, const std::string& hash) {
    ensureSodiumInit();
    return crypto_pwhash_str_verify(hash.c_str(), password.c_str(), password.size()) == 0;
}

}
