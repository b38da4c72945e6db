#pragma once

#include <cstdint>
#include <string>

namespace cf::crypto {

// Crockford Base32 (no I, L, O, U), safe in URLs and file names
inline constexpr char kBase32Crockford[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

// Thread-safe and idempotent.
void ensureSodiumInit();

std::string b32CrockfordEncode(const uint8_t* data, size_t len);

// RFC 4122 v4 UUID, lowercase hex with dashes
std::string uuid4();

// `length` characters of Crockford base32 drawn from randombytes_buf.
std::string randomToken(size_t length);

}
