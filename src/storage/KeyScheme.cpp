#include "storage/KeyScheme.hpp"
#include "storage/StorageError.hpp"
#include "crypto/IdGenerator.hpp"

#include <fmt/format.h>
#include <cctype>
#include <vector>

using namespace cf::storage;

namespace {

int hexValue(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    const auto lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower >= 'a' && lower <= 'f') return lower - 'a' + 10;
    return -1;
}

// Only the characters that can change how a key splits into segments.
std::string decodeStructural(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '\0') continue;
        if (in[i] == '%' && i + 2 < in.size()) {
            const int hi = hexValue(in[i + 1]), lo = hexValue(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                const auto decoded = static_cast<char>(hi * 16 + lo);
                if (decoded == '.' || decoded == '/' || decoded == '\\') {
                    out.push_back(decoded);
                    i += 2;
                    continue;
                }
            }
        }
        out.push_back(in[i]);
    }
    return out;
}

}

std::string KeyScheme::canonicalize(const std::string& key) {
    const auto decoded = decodeStructural(key);
    const bool rooted = !decoded.empty() && decoded.front() == '/';

    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= decoded.size()) {
        auto end = decoded.find('/', start);
        if (end == std::string::npos) end = decoded.size();
        const auto seg = decoded.substr(start, end - start);
        start = end + 1;

        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            if (!segments.empty() && segments.back() != "..") segments.pop_back();
            else if (!rooted) segments.emplace_back("..");
            continue;
        }
        segments.push_back(seg);
    }

    std::string out = rooted ? "/" : "";
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i) out += '/';
        out += segments[i];
    }
    if (out.empty()) return ".";
    return out;
}

bool KeyScheme::isSafe(const std::string& key) {
    if (key.empty() || key.front() == '/') return false;
    if (canonicalize(key) != key) return false;

    size_t start = 0;
    while (start <= key.size()) {
        auto end = key.find('/', start);
        if (end == std::string::npos) end = key.size();
        if (key.compare(start, end - start, "..") == 0 && end - start == 2) return false;
        start = end + 1;
    }
    return true;
}

void KeyScheme::requireSafe(const std::string& key, const std::string& operation) {
    if (!isSafe(key)) throw StorageError(ErrorCode::InvalidKey, operation, key, "key rejected by path-safety check");
}

std::string KeyScheme::firstSegment(const std::string& key) {
    return key.substr(0, key.find('/'));
}

void KeyScheme::requireSegment(const std::string& value, const char* what) {
    if (value.empty() || value == "." || value == ".." || value.find('/') != std::string::npos
        || value.find('\\') != std::string::npos || value.find('\0') != std::string::npos)
        throw StorageError(ErrorCode::InvalidKey, fmt::format("invalid {} '{}'", what, value));

    if (value == VERSIONS_PREFIX || value == TEMP_PREFIX || value == MULTIPART_PREFIX)
        throw StorageError(ErrorCode::InvalidKey, fmt::format("{} '{}' collides with a reserved namespace", what, value));
}

std::string KeyScheme::fileKey(const std::string& userId, const std::string& logicalPath) {
    requireSegment(userId, "user id");

    auto relative = logicalPath;
    while (!relative.empty() && relative.front() == '/') relative.erase(relative.begin());

    auto key = userId + "/" + relative;
    if (relative.empty() || !isSafe(key))
        throw StorageError(ErrorCode::InvalidKey, "fileKey", logicalPath, "logical path is not a safe relative path");
    return key;
}

std::string KeyScheme::versionKey(const std::string& userId, const std::string& fileId, const unsigned int versionNumber) {
    requireSegment(userId, "user id");
    requireSegment(fileId, "file id");
    if (versionNumber == 0) throw StorageError(ErrorCode::InvalidKey, "version numbers start at 1");

    return fmt::format("{}/{}/{}/v{}", VERSIONS_PREFIX, userId, fileId, versionNumber);
}

std::string KeyScheme::tempKey(const std::string& userId, const std::string& filename) {
    requireSegment(userId, "user id");

    const auto sep = filename.find_last_of("/\\");
    auto base = sep == std::string::npos ? filename : filename.substr(sep + 1);
    if (base.empty() || base == "." || base == ".." || !isSafe(base)) base = "upload";

    return fmt::format("{}/{}/{}/{}", TEMP_PREFIX, userId, crypto::uuid4(), base);
}
