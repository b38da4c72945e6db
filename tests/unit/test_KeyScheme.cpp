#include <gtest/gtest.h>
#include "storage/KeyScheme.hpp"
#include "storage/StorageError.hpp"

#include <string>

using namespace cf::storage;

TEST(KeySchemeTest, FileKeyStartsWithUser) {
    EXPECT_EQ(KeyScheme::fileKey("alice", "/docs/report.pdf"), "alice/docs/report.pdf");
    EXPECT_EQ(KeyScheme::fileKey("alice", "docs/report.pdf"), "alice/docs/report.pdf");
}

TEST(KeySchemeTest, FileKeysNeverCollideAcrossUsers) {
    EXPECT_NE(KeyScheme::fileKey("alice", "a/b"), KeyScheme::fileKey("bob", "a/b"));
    EXPECT_NE(KeyScheme::fileKey("ab", "c"), KeyScheme::fileKey("a", "bc"));
}

TEST(KeySchemeTest, FileKeyRejectsTraversal) {
    EXPECT_THROW((void)KeyScheme::fileKey("alice", "../bob/secret"), StorageError);
    EXPECT_THROW((void)KeyScheme::fileKey("alice", "docs/../../bob"), StorageError);
    EXPECT_THROW((void)KeyScheme::fileKey("alice", "/"), StorageError);
    EXPECT_THROW((void)KeyScheme::fileKey("../alice", "x"), StorageError);
}

TEST(KeySchemeTest, ReservedNamespacesAreNotUserIds) {
    EXPECT_THROW((void)KeyScheme::fileKey("versions", "x"), StorageError);
    EXPECT_THROW((void)KeyScheme::fileKey("temp", "x"), StorageError);
    EXPECT_THROW((void)KeyScheme::fileKey(".multipart", "x"), StorageError);
}

TEST(KeySchemeTest, VersionKeyLayout) {
    EXPECT_EQ(KeyScheme::versionKey("alice", "f1", 3), "versions/alice/f1/v3");
    EXPECT_THROW((void)KeyScheme::versionKey("alice", "f1", 0), StorageError);
    EXPECT_THROW((void)KeyScheme::versionKey("alice", "../f1", 1), StorageError);
}

TEST(KeySchemeTest, TempKeysAreUniqueAndSafe) {
    const auto a = KeyScheme::tempKey("alice", "photo.jpg");
    const auto b = KeyScheme::tempKey("alice", "photo.jpg");

    EXPECT_NE(a, b);
    EXPECT_EQ(a.rfind("temp/alice/", 0), 0u);
    EXPECT_TRUE(a.ends_with("/photo.jpg"));
    EXPECT_TRUE(KeyScheme::isSafe(a));
}

TEST(KeySchemeTest, TempKeyDropsDirectoryPartOfFilename) {
    const auto k = KeyScheme::tempKey("alice", "../../etc/passwd");
    EXPECT_TRUE(k.ends_with("/passwd"));
    EXPECT_TRUE(KeyScheme::isSafe(k));
}

TEST(KeySchemeTest, IsSafeAcceptsCanonicalRelativeKeys) {
    EXPECT_TRUE(KeyScheme::isSafe("alice/docs/a.txt"));
    EXPECT_TRUE(KeyScheme::isSafe("a"));
    EXPECT_TRUE(KeyScheme::isSafe("a..b/c"));
}

TEST(KeySchemeTest, IsSafeRejectsUnsafeKeys) {
    EXPECT_FALSE(KeyScheme::isSafe(""));
    EXPECT_FALSE(KeyScheme::isSafe("/etc/passwd"));
    EXPECT_FALSE(KeyScheme::isSafe(".."));
    EXPECT_FALSE(KeyScheme::isSafe("../a"));
    EXPECT_FALSE(KeyScheme::isSafe("a/../b"));
    EXPECT_FALSE(KeyScheme::isSafe("a//b"));
    EXPECT_FALSE(KeyScheme::isSafe("a/./b"));
    EXPECT_FALSE(KeyScheme::isSafe("a/b/"));
    EXPECT_FALSE(KeyScheme::isSafe("a/%2e%2e/b"));
    EXPECT_FALSE(KeyScheme::isSafe("a%2fb"));
    EXPECT_FALSE(KeyScheme::isSafe(std::string("a\0b", 3)));
}

TEST(KeySchemeTest, IsSafeMatchesItsDefinition) {
    const std::string samples[] = {
        "a", "a/b", "/a", "a/../b", "..", "../x", "x/..", "a//b", "./a", "a/.", "%2e%2e/x", "a%2Fb", "a%20b", "..a", "a/b..",
    };

    for (const auto& k : samples) {
        bool hasDotDot = false;
        size_t start = 0;
        while (start <= k.size()) {
            auto end = k.find('/', start);
            if (end == std::string::npos) end = k.size();
            if (k.substr(start, end - start) == "..") hasDotDot = true;
            start = end + 1;
        }
        const bool expected = !k.empty() && k.front() != '/' && KeyScheme::canonicalize(k) == k && !hasDotDot;
        EXPECT_EQ(KeyScheme::isSafe(k), expected) << k;
    }
}

TEST(KeySchemeTest, CanonicalizeNormalizes) {
    EXPECT_EQ(KeyScheme::canonicalize("a//b/./c"), "a/b/c");
    EXPECT_EQ(KeyScheme::canonicalize("a/b/../c"), "a/c");
    EXPECT_EQ(KeyScheme::canonicalize("a/%2E%2E/c"), "c");
    EXPECT_EQ(KeyScheme::canonicalize(""), ".");
    EXPECT_EQ(KeyScheme::canonicalize("/../a"), "/a");
    EXPECT_EQ(KeyScheme::canonicalize("../a"), "../a");
}

TEST(KeySchemeTest, RequireSafeThrowsInvalidKey) {
    try {
        KeyScheme::requireSafe("../x", "save");
        FAIL() << "expected InvalidKey";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidKey);
        EXPECT_EQ(e.operation(), "save");
        EXPECT_EQ(e.key(), "../x");
    }
}
