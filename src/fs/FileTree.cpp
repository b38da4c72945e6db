#include "fs/FileTree.hpp"
#include "storage/StorageError.hpp"
#include "crypto/IdGenerator.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <ctime>
#include <deque>
#include <unordered_set>
#include <fmt/format.h>

using namespace cf::fs;
using namespace cf::types;
using namespace cf::storage;
using namespace cf::logging;

FileTree::FileTree(std::shared_ptr<store::FileStore> files) : files_(std::move(files)) {
    if (!files_) throw std::invalid_argument("[FileTree] file store is required");
}

// #########################################################################
// ############################## CHECKS ###################################
// #########################################################################

void FileTree::validateName(const std::string& name, const std::string& operation) {
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos ||
        name.find('\0') != std::string::npos)
        throw StorageError(ErrorCode::InvalidOperation, operation, name, "invalid file name");
}

std::string FileTree::joinPath(const std::optional<File>& parent, const std::string& name) {
    if (!parent) return "/" + name;
    return parent->path + "/" + name;
}

File FileTree::requireActive(const std::string& fileId, const std::string& operation) const {
    auto file = files_->get(fileId, Include::ActiveOnly);
    if (!file) throw StorageError(ErrorCode::NotFound, operation, fileId, "no active file with this id");
    return *file;
}

std::optional<File> FileTree::requireParent(const std::string& ownerId, const std::optional<std::string>& parentId,
                                            const std::string& operation) const {
    if (!parentId) return std::nullopt;

    auto parent = files_->get(*parentId, Include::ActiveOnly);
    if (!parent) throw StorageError(ErrorCode::NotFound, operation, *parentId, "parent does not exist");
    if (parent->owner_id != ownerId)
        throw StorageError(ErrorCode::InvalidOperation, operation, *parentId, "parent belongs to another user");
    if (!parent->isDirectory())
        throw StorageError(ErrorCode::InvalidOperation, operation, *parentId, "parent is not a directory");
    return parent;
}

void FileTree::requireFreeName(const std::string& ownerId, const std::optional<std::string>& parentId,
                               const std::string& name, const std::string& selfId, const std::string& operation) const {
    const auto sibling = files_->findChild(ownerId, parentId, name, Include::ActiveOnly);
    if (sibling && sibling->id != selfId) {
        LogRegistry::fs()->warn("[FileTree] {} rejected: '{}' already exists under {}", operation, name,
                                parentId.value_or("<root>"));
        throw StorageError(ErrorCode::InvalidOperation, operation, name, "an active sibling already has this name");
    }
}

void FileTree::requireAcyclic(const File& node, const File& newParent) const {
    std::unordered_set<std::string> visited;
    std::optional<File> cur = newParent;

    while (cur) {
        if (cur->id == node.id) {
            LogRegistry::fs()->warn("[FileTree] Refusing to move {} under its own descendant {}", node.id, newParent.id);
            throw StorageError(ErrorCode::InvalidOperation, "move", node.id,
                               "cannot move a directory into itself or one of its descendants");
        }
        if (!visited.insert(cur->id).second)
            throw StorageError(ErrorCode::InvalidOperation, "move", cur->id, "parent chain already contains a cycle");

        cur = cur->parent_id ? files_->get(*cur->parent_id, Include::WithTombstoned) : std::nullopt;
    }
}

// #########################################################################
// ############################## CREATION #################################
// #########################################################################

File FileTree::insertNode(const std::string& ownerId, const std::optional<std::string>& parentId,
                          const std::string& name, const FileKind kind, const std::string& mimeType) {
    validateName(name, "create");

    auto guard = ownerLocks_.lock(ownerId);
    const auto parent = requireParent(ownerId, parentId, "create");
    requireFreeName(ownerId, parentId, name, "", "create");

    File f;
    f.id = crypto::uuid4();
    f.owner_id = ownerId;
    f.parent_id = parentId;
    f.name = name;
    f.path = joinPath(parent, name);
    f.kind = kind;
    f.mime_type = mimeType;
    f.created_at = f.updated_at = std::time(nullptr);

    files_->insert(f);
    return f;
}

File FileTree::createDirectory(const std::string& ownerId, const std::optional<std::string>& parentId,
                               const std::string& name) {
    return insertNode(ownerId, parentId, name, FileKind::Directory, "");
}

File FileTree::createFile(const std::string& ownerId, const std::optional<std::string>& parentId,
                          const std::string& name, const std::string& mimeType) {
    return insertNode(ownerId, parentId, name, FileKind::File, mimeType);
}

// #########################################################################
// ############################## MUTATIONS ################################
// #########################################################################

File FileTree::move(const std::string& fileId, const std::optional<std::string>& newParentId) {
    const auto owner = requireActive(fileId, "move").owner_id;
    auto guard = ownerLocks_.lock(owner);

    auto node = requireActive(fileId, "move");
    const auto parent = requireParent(node.owner_id, newParentId, "move");
    if (parent) requireAcyclic(node, *parent);
    requireFreeName(node.owner_id, newParentId, node.name, node.id, "move");

    node.parent_id = newParentId;
    node.path = joinPath(parent, node.name);
    node.updated_at = std::time(nullptr);
    files_->update(node);
    rewriteDescendantPaths(node);

    LogRegistry::fs()->debug("[FileTree] Moved {} to {}", node.id, node.path);
    return node;
}

File FileTree::rename(const std::string& fileId, const std::string& newName) {
    validateName(newName, "rename");

    const auto owner = requireActive(fileId, "rename").owner_id;
    auto guard = ownerLocks_.lock(owner);

    auto node = requireActive(fileId, "rename");
    if (node.name == newName) return node;

    requireFreeName(node.owner_id, node.parent_id, newName, node.id, "rename");

    const auto parent = node.parent_id ? files_->get(*node.parent_id, Include::WithTombstoned) : std::nullopt;
    node.name = newName;
    node.path = joinPath(parent, newName);
    node.updated_at = std::time(nullptr);
    files_->update(node);
    rewriteDescendantPaths(node);

    return node;
}

std::vector<File> FileTree::tombstone(const std::string& fileId) {
    const auto owner = requireActive(fileId, "tombstone").owner_id;
    auto guard = ownerLocks_.lock(owner);

    const auto node = requireActive(fileId, "tombstone");
    const auto now = std::time(nullptr);
    const auto batch = crypto::uuid4();

    std::vector<File> affected{node};
    for (auto& d : descendants(node, Include::ActiveOnly)) affected.push_back(std::move(d));

    for (auto& f : affected) {
        f.lifecycle = Lifecycle::Tombstoned;
        f.tombstoned_at = now;
        f.tombstone_batch = batch;
        f.updated_at = now;
        files_->update(f);
    }

    LogRegistry::fs()->debug("[FileTree] Tombstoned {} and {} descendants", node.id, affected.size() - 1);
    return affected;
}

File FileTree::restore(const std::string& fileId) {
    const auto existing = files_->get(fileId, Include::WithTombstoned);
    if (!existing) throw StorageError(ErrorCode::NotFound, "restore", fileId, "no file with this id");

    auto guard = ownerLocks_.lock(existing->owner_id);

    auto node = files_->get(fileId, Include::WithTombstoned);
    if (!node) throw StorageError(ErrorCode::NotFound, "restore", fileId, "no file with this id");
    if (node->isActive()) return *node;

    if (node->parent_id && !files_->get(*node->parent_id, Include::ActiveOnly))
        throw StorageError(ErrorCode::InvalidOperation, "restore", fileId, "parent is not active");
    requireFreeName(node->owner_id, node->parent_id, node->name, node->id, "restore");

    const auto batch = node->tombstone_batch;
    const auto now = std::time(nullptr);

    // Descendants tombstoned by a separate call stay tombstoned.
    std::vector<File> revived;
    if (batch)
        for (auto& d : descendants(*node, Include::WithTombstoned))
            if (!d.isActive() && d.tombstone_batch == batch) revived.push_back(std::move(d));

    node->lifecycle = Lifecycle::Active;
    node->tombstoned_at.reset();
    node->tombstone_batch.reset();
    node->updated_at = now;
    files_->update(*node);

    for (auto& f : revived) {
        f.lifecycle = Lifecycle::Active;
        f.tombstoned_at.reset();
        f.tombstone_batch.reset();
        f.updated_at = now;
        files_->update(f);
    }

    return *node;
}

void FileTree::rewriteDescendantPaths(const File& node) {
    std::deque<File> queue{node};
    while (!queue.empty()) {
        const auto cur = std::move(queue.front());
        queue.pop_front();

        for (auto& child : files_->children(cur.owner_id, cur.id, Include::WithTombstoned)) {
            child.path = cur.path + "/" + child.name;
            files_->update(child);
            queue.push_back(std::move(child));
        }
    }
}

// #########################################################################
// ############################### QUERIES #################################
// #########################################################################

std::vector<File> FileTree::descendants(const File& node, const Include include) const {
    std::vector<File> out;
    std::deque<std::string> queue{node.id};

    while (!queue.empty()) {
        const auto id = queue.front();
        queue.pop_front();

        for (auto& child : files_->children(node.owner_id, id, include)) {
            if (child.isDirectory()) queue.push_back(child.id);
            out.push_back(std::move(child));
        }
    }
    return out;
}

std::vector<File> FileTree::ancestors(const std::string& fileId) const {
    const auto node = files_->get(fileId, Include::WithTombstoned);
    if (!node) throw StorageError(ErrorCode::NotFound, "ancestors", fileId, "no file with this id");

    std::vector<File> chain;
    std::unordered_set<std::string> visited{node->id};
    auto parentId = node->parent_id;

    while (parentId) {
        if (!visited.insert(*parentId).second)
            throw StorageError(ErrorCode::InvalidOperation, "ancestors", *parentId, "parent chain contains a cycle");

        auto parent = files_->get(*parentId, Include::WithTombstoned);
        if (!parent) break;
        parentId = parent->parent_id;
        chain.push_back(std::move(*parent));
    }

    std::ranges::reverse(chain);
    return chain;
}

std::vector<File> FileTree::children(const std::string& ownerId, const std::optional<std::string>& parentId,
                                     const Include include) const {
    return files_->children(ownerId, parentId, include);
}
