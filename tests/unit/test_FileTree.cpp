#include <gtest/gtest.h>
#include "fs/FileTree.hpp"
#include "store/MemoryStores.hpp"
#include "storage/StorageError.hpp"

#include <functional>

using namespace cf::fs;
using namespace cf::types;
using namespace cf::storage;

class FileTreeTest : public ::testing::Test {
protected:
    std::shared_ptr<cf::store::MemoryFileStore> files_ = std::make_shared<cf::store::MemoryFileStore>();
    FileTree tree_{files_};

    [[nodiscard]] File fetch(const std::string& id) const {
        const auto f = files_->get(id, Include::WithTombstoned);
        if (!f) throw std::runtime_error("missing file " + id);
        return *f;
    }

    static ErrorCode codeOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const StorageError& e) {
            return e.code();
        }
        ADD_FAILURE() << "expected a StorageError";
        return ErrorCode::NotFound;
    }
};

TEST_F(FileTreeTest, PathsFollowParents) {
    const auto docs = tree_.createDirectory("alice", std::nullopt, "docs");
    const auto work = tree_.createDirectory("alice", docs.id, "work");
    const auto file = tree_.createFile("alice", work.id, "plan.md", "text/markdown");

    EXPECT_EQ(docs.path, "/docs");
    EXPECT_EQ(file.path, "/docs/work/plan.md");

    const auto chain = tree_.ancestors(file.id);
    ASSERT_EQ(chain.size(), 2u);
    EXPECT_EQ(chain[0].id, docs.id);
    EXPECT_EQ(chain[1].id, work.id);
}

TEST_F(FileTreeTest, ActiveSiblingNamesAreUnique) {
    const auto docs = tree_.createDirectory("alice", std::nullopt, "docs");
    (void)tree_.createFile("alice", docs.id, "a.txt", "text/plain");

    EXPECT_EQ(codeOf([&] { (void)tree_.createFile("alice", docs.id, "a.txt", "text/plain"); }),
              ErrorCode::InvalidOperation);
    EXPECT_NO_THROW((void)tree_.createFile("bob", std::nullopt, "docs", ""));
}

TEST_F(FileTreeTest, InvalidNamesAndParents) {
    const auto file = tree_.createFile("alice", std::nullopt, "a.txt", "text/plain");
    const auto bobDir = tree_.createDirectory("bob", std::nullopt, "shared");

    EXPECT_EQ(codeOf([&] { (void)tree_.createFile("alice", std::nullopt, "..", ""); }), ErrorCode::InvalidOperation);
    EXPECT_EQ(codeOf([&] { (void)tree_.createFile("alice", std::nullopt, "a/b", ""); }), ErrorCode::InvalidOperation);
    EXPECT_EQ(codeOf([&] { (void)tree_.createFile("alice", file.id, "child", ""); }), ErrorCode::InvalidOperation);
    EXPECT_EQ(codeOf([&] { (void)tree_.createFile("alice", bobDir.id, "x", ""); }), ErrorCode::InvalidOperation);
    EXPECT_EQ(codeOf([&] { (void)tree_.createFile("alice", std::string("missing"), "x", ""); }), ErrorCode::NotFound);
}

TEST_F(FileTreeTest, MoveIntoOwnDescendantIsRejected) {
    const auto a = tree_.createDirectory("alice", std::nullopt, "a");
    const auto b = tree_.createDirectory("alice", a.id, "b");
    const auto c = tree_.createDirectory("alice", b.id, "c");

    EXPECT_EQ(codeOf([&] { (void)tree_.move(a.id, c.id); }), ErrorCode::InvalidOperation);
    EXPECT_EQ(codeOf([&] { (void)tree_.move(a.id, a.id); }), ErrorCode::InvalidOperation);
    EXPECT_FALSE(fetch(a.id).parent_id);
}

TEST_F(FileTreeTest, MoveRewritesDescendantPaths) {
    const auto a = tree_.createDirectory("alice", std::nullopt, "a");
    const auto b = tree_.createDirectory("alice", a.id, "b");
    const auto f = tree_.createFile("alice", b.id, "f.txt", "text/plain");
    const auto dest = tree_.createDirectory("alice", std::nullopt, "dest");

    const auto moved = tree_.move(b.id, dest.id);
    EXPECT_EQ(moved.path, "/dest/b");
    EXPECT_EQ(fetch(f.id).path, "/dest/b/f.txt");

    (void)tree_.move(b.id, std::nullopt);
    EXPECT_EQ(fetch(f.id).path, "/b/f.txt");
}

TEST_F(FileTreeTest, MoveOntoTakenNameIsRejected) {
    const auto a = tree_.createDirectory("alice", std::nullopt, "a");
    (void)tree_.createFile("alice", a.id, "x", "");
    const auto x = tree_.createFile("alice", std::nullopt, "x", "");

    EXPECT_EQ(codeOf([&] { (void)tree_.move(x.id, a.id); }), ErrorCode::InvalidOperation);
}

TEST_F(FileTreeTest, RenameRewritesPaths) {
    const auto a = tree_.createDirectory("alice", std::nullopt, "a");
    const auto f = tree_.createFile("alice", a.id, "f.txt", "");
    (void)tree_.createDirectory("alice", std::nullopt, "taken");

    (void)tree_.rename(a.id, "renamed");
    EXPECT_EQ(fetch(f.id).path, "/renamed/f.txt");
    EXPECT_EQ(codeOf([&] { (void)tree_.rename(a.id, "taken"); }), ErrorCode::InvalidOperation);
}

TEST_F(FileTreeTest, TombstoneHidesSubtreeAndFreesName) {
    const auto a = tree_.createDirectory("alice", std::nullopt, "a");
    const auto f = tree_.createFile("alice", a.id, "f.txt", "");

    const auto affected = tree_.tombstone(a.id);
    ASSERT_EQ(affected.size(), 2u);
    EXPECT_EQ(affected.front().id, a.id);

    EXPECT_FALSE(files_->get(f.id, Include::ActiveOnly));
    EXPECT_TRUE(files_->get(f.id, Include::WithTombstoned));
    EXPECT_TRUE(tree_.children("alice", std::nullopt).empty());
    EXPECT_EQ(tree_.children("alice", std::nullopt, Include::WithTombstoned).size(), 1u);

    EXPECT_NO_THROW((void)tree_.createDirectory("alice", std::nullopt, "a"));
}

TEST_F(FileTreeTest, RestoreRevivesSubtree) {
    const auto a = tree_.createDirectory("alice", std::nullopt, "a");
    const auto f = tree_.createFile("alice", a.id, "f.txt", "");
    (void)tree_.tombstone(a.id);

    const auto restored = tree_.restore(a.id);
    EXPECT_TRUE(restored.isActive());
    EXPECT_TRUE(fetch(f.id).isActive());
    EXPECT_FALSE(fetch(f.id).tombstoned_at);
}

TEST_F(FileTreeTest, RestoreLeavesSeparatelyTombstonedChildAlone) {
    const auto a = tree_.createDirectory("alice", std::nullopt, "a");
    const auto kept = tree_.createFile("alice", a.id, "kept.txt", "");
    const auto gone = tree_.createFile("alice", a.id, "gone.txt", "");

    // Both tombstones normally land within the same second.
    (void)tree_.tombstone(gone.id);
    (void)tree_.tombstone(a.id);
    ASSERT_NE(fetch(gone.id).tombstone_batch, fetch(a.id).tombstone_batch);
    EXPECT_EQ(fetch(kept.id).tombstone_batch, fetch(a.id).tombstone_batch);

    (void)tree_.restore(a.id);
    EXPECT_TRUE(fetch(kept.id).isActive());
    EXPECT_FALSE(fetch(gone.id).isActive());
    EXPECT_FALSE(fetch(a.id).tombstone_batch);
}

TEST_F(FileTreeTest, RestoreRejectsTakenNameAndInactiveParent) {
    const auto a = tree_.createDirectory("alice", std::nullopt, "a");
    const auto f = tree_.createFile("alice", a.id, "f.txt", "");
    (void)tree_.tombstone(a.id);

    EXPECT_EQ(codeOf([&] { (void)tree_.restore(f.id); }), ErrorCode::InvalidOperation);

    (void)tree_.createDirectory("alice", std::nullopt, "a");
    EXPECT_EQ(codeOf([&] { (void)tree_.restore(a.id); }), ErrorCode::InvalidOperation);
    EXPECT_EQ(codeOf([&] { (void)tree_.restore("missing"); }), ErrorCode::NotFound);
}
