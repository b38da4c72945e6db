#pragma once

#include "concurrency/KeyedMutex.hpp"
#include "store/FileStore.hpp"
#include "types/File.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cf::fs {

// Structural mutations of one owner's namespace. Keeps the parent relation
// acyclic and active sibling names unique; all mutations of one owner are
// serialized.
class FileTree {
public:
    explicit FileTree(std::shared_ptr<store::FileStore> files);

    types::File createDirectory(const std::string& ownerId, const std::optional<std::string>& parentId,
                                const std::string& name);

    types::File createFile(const std::string& ownerId, const std::optional<std::string>& parentId,
                           const std::string& name, const std::string& mimeType);

    // nullopt moves the node to the owner's root. Rejects moving a directory
    // into itself or one of its descendants.
    types::File move(const std::string& fileId, const std::optional<std::string>& newParentId);

    types::File rename(const std::string& fileId, const std::string& newName);

    // Tombstones the node and every active descendant. Returns them, node first.
    std::vector<types::File> tombstone(const std::string& fileId);

    // Restores the node and the descendants tombstoned along with it.
    types::File restore(const std::string& fileId);

    // Root first, excluding the node itself.
    [[nodiscard]] std::vector<types::File> ancestors(const std::string& fileId) const;

    [[nodiscard]] std::vector<types::File> children(const std::string& ownerId,
                                                    const std::optional<std::string>& parentId,
                                                    types::Include include = types::Include::ActiveOnly) const;

    [[nodiscard]] static std::string joinPath(const std::optional<types::File>& parent, const std::string& name);

private:
    std::shared_ptr<store::FileStore> files_;
    concurrency::KeyedMutex<std::string> ownerLocks_;

    [[nodiscard]] types::File requireActive(const std::string& fileId, const std::string& operation) const;

    // Resolves the target parent; must be an active directory of ownerId.
    [[nodiscard]] std::optional<types::File> requireParent(const std::string& ownerId,
                                                           const std::optional<std::string>& parentId,
                                                           const std::string& operation) const;

    void requireFreeName(const std::string& ownerId, const std::optional<std::string>& parentId,
                         const std::string& name, const std::string& selfId, const std::string& operation) const;

    void requireAcyclic(const types::File& node, const types::File& newParent) const;

    types::File insertNode(const std::string& ownerId, const std::optional<std::string>& parentId,
                           const std::string& name, types::FileKind kind, const std::string& mimeType);

    // Rewrites the logical path of every descendant of node.
    void rewriteDescendantPaths(const types::File& node);

    [[nodiscard]] std::vector<types::File> descendants(const types::File& node, types::Include include) const;

    static void validateName(const std::string& name, const std::string& operation);
};

}
