#pragma once

#include <string>

namespace cf::storage {

// Backend key layout:
//   <user>/<logical path>                  current content
//   versions/<user>/<file id>/v<number>    immutable version objects
//   temp/<user>/<random>/<file name>       staging area for uploads
struct KeyScheme {
    static constexpr auto VERSIONS_PREFIX = "versions";
    static constexpr auto TEMP_PREFIX = "temp";
    static constexpr auto MULTIPART_PREFIX = ".multipart"; // local backend part staging

    static std::string fileKey(const std::string& userId, const std::string& logicalPath);
    static std::string versionKey(const std::string& userId, const std::string& fileId, unsigned int versionNumber);
    static std::string tempKey(const std::string& userId, const std::string& filename);

    // True iff the key is relative, already canonical and has no ".." segment.
    [[nodiscard]] static bool isSafe(const std::string& key);

    // Lexical normalization: decodes percent-encoded '.', '/' and '\',
    // drops NUL bytes, collapses separators and resolves "." and "..".
    // The empty key canonicalizes to ".".
    [[nodiscard]] static std::string canonicalize(const std::string& key);

    // Throws StorageError(InvalidKey) unless isSafe(key).
    static void requireSafe(const std::string& key, const std::string& operation);

    // The key addresses the backend root itself ("." once canonical).
    [[nodiscard]] static bool isRoot(const std::string& key) { return key == "."; }

    [[nodiscard]] static std::string firstSegment(const std::string& key);

private:
    static void requireSegment(const std::string& value, const char* what);
};

}
