#pragma once

#include "config/Config.hpp"
#include "concurrency/CancelToken.hpp"
#include "storage/ObjectInfo.hpp"

#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace cf::storage {

namespace fs = std::filesystem;

class LocalDiskBackend {
public:
    static constexpr size_t CHUNK_SIZE = 64 * 1024;

    explicit LocalDiskBackend(config::LocalStorageConfig config);

    // #########################################################################
    // ############################# OBJECTS ###################################
    // #########################################################################

    void save(const std::string& key, std::istream& in, uintmax_t size, const concurrency::CancelToken& cancel) const;
    [[nodiscard]] std::unique_ptr<std::istream> get(const std::string& key, const concurrency::CancelToken& cancel) const;
    void remove(const std::string& key, const concurrency::CancelToken& cancel) const;
    [[nodiscard]] bool exists(const std::string& key, const concurrency::CancelToken& cancel) const;
    [[nodiscard]] ObjectInfo stat(const std::string& key, const concurrency::CancelToken& cancel) const;
    void copy(const std::string& src, const std::string& dst, const concurrency::CancelToken& cancel) const;
    void move(const std::string& src, const std::string& dst, const concurrency::CancelToken& cancel) const;

    // #########################################################################
    // ########################### DIRECTORIES #################################
    // #########################################################################

    [[nodiscard]] std::vector<ObjectInfo> list(const std::string& prefix, const concurrency::CancelToken& cancel) const;
    void createDir(const std::string& path, const concurrency::CancelToken& cancel) const;
    void deleteDir(const std::string& path, const concurrency::CancelToken& cancel) const;
    [[nodiscard]] uintmax_t diskUsage(const std::string& prefix, const concurrency::CancelToken& cancel) const;

    // #########################################################################
    // ######################## MULTIPART UPLOADS ##############################
    // #########################################################################

    [[nodiscard]] std::string initiateMultipart(const std::string& key, const concurrency::CancelToken& cancel) const;

    [[nodiscard]] std::string uploadPart(const std::string& key, const std::string& uploadId, unsigned int partNumber,
                                         std::istream& in, uintmax_t size,
                                         const concurrency::CancelToken& cancel) const;

    void completeMultipart(const std::string& key, const std::string& uploadId,
                           const std::vector<std::string>& partIds, const concurrency::CancelToken& cancel) const;

    void abortMultipart(const std::string& key, const std::string& uploadId,
                        const concurrency::CancelToken& cancel) const;

    [[nodiscard]] uintmax_t minPartSize() const { return config_.min_part_size; }

    // #########################################################################
    // ################################ URLS ###################################
    // #########################################################################

    [[nodiscard]] std::string getURL(const std::string& key) const;
    [[nodiscard]] std::string getDownloadURL(const std::string& key, const std::string& filename) const;

    [[nodiscard]] const fs::path& root() const { return config_.root; }

private:
    config::LocalStorageConfig config_;

    [[nodiscard]] fs::path resolve(const std::string& key, const std::string& operation) const;
    [[nodiscard]] fs::path uploadDir(const std::string& uploadId, const std::string& operation) const;
    [[nodiscard]] fs::path tempPathFor(const fs::path& target) const;

    // Writes exactly `size` bytes from `in` to `target` through a temp file and
    // an atomic rename. Returns the BLAKE2b of what was written. Without
    // createParents a missing parent directory is NotFound.
    std::string writeAtomically(const fs::path& target, std::istream& in, uintmax_t size,
                                const concurrency::CancelToken& cancel, const std::string& operation,
                                const std::string& key, bool createParents = true) const;

    void pruneEmptyParents(fs::path dir) const;
};

}
