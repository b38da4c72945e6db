#pragma once

#include "concurrency/CancelToken.hpp"
#include "concurrency/KeyedMutex.hpp"
#include "storage/StorageBackend.hpp"
#include "store/FileStore.hpp"
#include "store/VersionStore.hpp"
#include "types/FileVersion.hpp"

#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace cf::version {

// Per-file version history. Every mutation of one file's history runs under
// that file's lock, so numbers come out as 1, 2, 3 ... with no gaps.
class VersionManager {
public:
    VersionManager(std::shared_ptr<store::FileStore> files,
                   std::shared_ptr<store::VersionStore> versions,
                   std::shared_ptr<storage::StorageBackend> backend);

    // Records content already stored at storageKey as the file's next version
    // and makes it current.
    unsigned int recordVersion(const std::string& fileId, uintmax_t size, const std::string& contentHash,
                               const std::string& storageKey, const std::string& mimeType,
                               const std::string& author);

    // Moves a staged upload to the next version key and records it. Size and
    // hash are taken from the stored object. On failure the object is moved
    // back to stagedKey.
    types::FileVersion commitUpload(const std::string& fileId, const std::string& stagedKey,
                                    const std::string& mimeType, const std::string& author,
                                    const concurrency::CancelToken& cancel = {});

    [[nodiscard]] std::vector<types::FileVersion> listVersions(const std::string& fileId) const;

    // Throws StorageError(NotFound).
    [[nodiscard]] types::FileVersion getVersion(const std::string& fileId, unsigned int number) const;

    // Points the file at an older version. Nothing in the backend changes.
    types::FileVersion rollback(const std::string& fileId, unsigned int number, const std::string& actor);

    // Fails with Corruption when the stored object no longer matches the
    // recorded hash.
    [[nodiscard]] std::unique_ptr<std::istream> openVersion(const std::string& fileId, unsigned int number,
                                                            const concurrency::CancelToken& cancel = {});

    // Drops all but the newest `keep` versions (at least one), never the
    // current one. Returns the bytes freed.
    uintmax_t pruneVersions(const std::string& fileId, unsigned int keep,
                            const concurrency::CancelToken& cancel = {});

    // Deletes every version row and object of the file. Returns the bytes freed.
    uintmax_t purgeFile(const std::string& fileId, const concurrency::CancelToken& cancel = {});

private:
    std::shared_ptr<store::FileStore> files_;
    std::shared_ptr<store::VersionStore> versions_;
    std::shared_ptr<storage::StorageBackend> backend_;
    concurrency::KeyedMutex<std::string> locks_;

    // Caller holds the file's lock.
    types::FileVersion recordLocked(types::File& file, uintmax_t size, const std::string& contentHash,
                                    const std::string& storageKey, const std::string& mimeType,
                                    const std::string& author);

    void unstage(const std::string& fileId, unsigned int number, const std::string& key, const std::string& stagedKey);

    [[nodiscard]] types::File requireFile(const std::string& fileId, const std::string& operation) const;
};

}
