#include "version/VersionManager.hpp"
#include "storage/KeyScheme.hpp"
#include "storage/StorageError.hpp"
#include "crypto/IdGenerator.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <ctime>
#include <fmt/format.h>

using namespace cf::version;
using namespace cf::types;
using namespace cf::storage;
using namespace cf::concurrency;
using namespace cf::logging;

VersionManager::VersionManager(std::shared_ptr<store::FileStore> files,
                               std::shared_ptr<store::VersionStore> versions,
                               std::shared_ptr<StorageBackend> backend)
    : files_(std::move(files)), versions_(std::move(versions)), backend_(std::move(backend)) {
    if (!files_ || !versions_ || !backend_)
        throw std::invalid_argument("[VersionManager] file store, version store and backend are required");
}

File VersionManager::requireFile(const std::string& fileId, const std::string& operation) const {
    auto file = files_->get(fileId, Include::ActiveOnly);
    if (!file) throw StorageError(ErrorCode::NotFound, operation, fileId, "no active file with this id");
    if (file->isDirectory())
        throw StorageError(ErrorCode::InvalidOperation, operation, fileId, "directories carry no versions");
    return *file;
}

// #########################################################################
// ############################## RECORDING ################################
// #########################################################################

FileVersion VersionManager::recordLocked(File& file, const uintmax_t size, const std::string& contentHash,
                                         const std::string& storageKey, const std::string& mimeType,
                                         const std::string& author) {
    FileVersion v;
    v.id = crypto::uuid4();
    v.file_id = file.id;
    v.version_number = versions_->latestNumber(file.id).value_or(0) + 1;
    v.size_bytes = size;
    v.content_hash = contentHash;
    v.storage_key = storageKey;
    v.mime_type = mimeType;
    v.created_by = author;
    v.created_at = std::time(nullptr);

    versions_->insert(v);

    file.current_version = v.version_number;
    file.size_bytes = size;
    file.content_hash = contentHash;
    file.mime_type = mimeType;
    file.updated_at = v.created_at;
    files_->update(file);

    LogRegistry::version()->debug("[VersionManager] Recorded version {} of file {} by {}", v.version_number, file.id, author);
    return v;
}

unsigned int VersionManager::recordVersion(const std::string& fileId, const uintmax_t size, const std::string& contentHash,
                                           const std::string& storageKey, const std::string& mimeType,
                                           const std::string& author) {
    KeyScheme::requireSafe(storageKey, "recordVersion");

    auto guard = locks_.lock(fileId);
    auto file = requireFile(fileId, "recordVersion");
    return recordLocked(file, size, contentHash, storageKey, mimeType, author).version_number;
}

FileVersion VersionManager::commitUpload(const std::string& fileId, const std::string& stagedKey,
                                         const std::string& mimeType, const std::string& author,
                                         const CancelToken& cancel) {
    auto guard = locks_.lock(fileId);
    auto file = requireFile(fileId, "commitUpload");

    const auto next = versions_->latestNumber(fileId).value_or(0) + 1;
    const auto key = KeyScheme::versionKey(file.owner_id, fileId, next);

    backend_->move(stagedKey, key, cancel);

    try {
        const auto info = backend_->stat(key, cancel);
        return recordLocked(file, info.size, info.integrityTag(), key, mimeType, author);
    } catch (const std::exception& e) {
        LogRegistry::version()->error("[VersionManager] Failed to record version {} of file {}, returning {} to {}: {}",
                                      next, fileId, key, stagedKey, e.what());
        unstage(fileId, next, key, stagedKey);
        throw;
    }
}

// Puts a committed upload back where the caller staged it so the commit can
// be retried, and drops a version row that was written before the failure.
void VersionManager::unstage(const std::string& fileId, const unsigned int number, const std::string& key,
                             const std::string& stagedKey) {
    try {
        if (const auto row = versions_->get(fileId, number); row && row->storage_key == key)
            versions_->remove(fileId, number);
    } catch (const std::exception& e) {
        LogRegistry::version()->error("[VersionManager] Failed to drop version row {} of file {}: {}",
                                      number, fileId, e.what());
    }

    try {
        backend_->move(key, stagedKey);
    } catch (const std::exception& e) {
        LogRegistry::version()->error("[VersionManager] Failed to return {} to {}, content left at {}: {}",
                                      key, stagedKey, key, e.what());
    }
}

// #########################################################################
// ############################### READING #################################
// #########################################################################

std::vector<FileVersion> VersionManager::listVersions(const std::string& fileId) const {
    return versions_->list(fileId);
}

FileVersion VersionManager::getVersion(const std::string& fileId, const unsigned int number) const {
    auto v = versions_->get(fileId, number);
    if (!v) throw StorageError(ErrorCode::NotFound, "getVersion", fileId, fmt::format("no version {}", number));
    return *v;
}

std::unique_ptr<std::istream> VersionManager::openVersion(const std::string& fileId, const unsigned int number,
                                                          const CancelToken& cancel) {
    const auto v = getVersion(fileId, number);
    const auto info = backend_->stat(v.storage_key, cancel);

    if (info.integrityTag() != v.content_hash) {
        LogRegistry::version()->error("[VersionManager] Integrity mismatch on version {} of file {} at {}: stored {}, backend {}",
                                      number, fileId, v.storage_key, v.content_hash, info.integrityTag());
        throw StorageError(ErrorCode::Corruption, "openVersion", v.storage_key,
                           fmt::format("version {} of file {} does not match its recorded hash", number, fileId));
    }

    return backend_->get(v.storage_key, cancel);
}

// #########################################################################
// ############################### HISTORY #################################
// #########################################################################

FileVersion VersionManager::rollback(const std::string& fileId, const unsigned int number, const std::string& actor) {
    auto guard = locks_.lock(fileId);
    auto file = requireFile(fileId, "rollback");
    const auto v = getVersion(fileId, number);

    file.current_version = v.version_number;
    file.size_bytes = v.size_bytes;
    file.content_hash = v.content_hash;
    file.mime_type = v.mime_type;
    file.updated_at = std::time(nullptr);
    files_->update(file);

    LogRegistry::version()->info("[VersionManager] {} rolled file {} back to version {}", actor, fileId, number);
    return v;
}

uintmax_t VersionManager::pruneVersions(const std::string& fileId, const unsigned int keep, const CancelToken& cancel) {
    auto guard = locks_.lock(fileId);

    const auto file = files_->get(fileId, Include::WithTombstoned);
    const auto current = file ? file->current_version : 0;

    auto all = versions_->list(fileId);
    const auto retained = std::max(keep, 1u);
    if (all.size() <= retained) return 0;

    all.resize(all.size() - retained);

    uintmax_t freed = 0;
    for (const auto& v : all) {
        if (v.version_number == current) continue;
        cancel.throwIfCancelled("pruneVersions", fileId);

        backend_->remove(v.storage_key, cancel);
        versions_->remove(fileId, v.version_number);
        freed += v.size_bytes;
    }

    LogRegistry::version()->debug("[VersionManager] Pruned file {} to {} versions, freed {} bytes", fileId, retained, freed);
    return freed;
}

uintmax_t VersionManager::purgeFile(const std::string& fileId, const CancelToken& cancel) {
    auto guard = locks_.lock(fileId);

    uintmax_t freed = 0;
    for (const auto& v : versions_->list(fileId)) {
        cancel.throwIfCancelled("purgeFile", fileId);
        backend_->remove(v.storage_key, cancel);
        versions_->remove(fileId, v.version_number);
        freed += v.size_bytes;
    }
    versions_->removeAll(fileId);

    LogRegistry::version()->info("[VersionManager] Purged all versions of file {}, freed {} bytes", fileId, freed);
    return freed;
}
