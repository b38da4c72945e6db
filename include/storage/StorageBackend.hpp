#pragma once

#include "config/Config.hpp"
#include "concurrency/CancelToken.hpp"
#include "storage/LocalDiskBackend.hpp"
#include "storage/ObjectInfo.hpp"
#include "storage/cloud/S3Backend.hpp"

#include <istream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace cf::storage {

// The one blob store of a deployment, picked at startup. Each variant checks
// caller-supplied keys with KeyScheme::isSafe before touching storage.
class StorageBackend {
public:
    using Variant = std::variant<LocalDiskBackend, cloud::S3Backend>;

    // Throws StorageError(UnsupportedBackend) for an unknown backend name.
    [[nodiscard]] static std::shared_ptr<StorageBackend> create(const config::StorageConfig& cfg);

    StorageBackend(Variant impl, config::BackendType type);

    [[nodiscard]] config::BackendType type() const { return type_; }

    // #########################################################################
    // ############################# OBJECTS ###################################
    // #########################################################################

    // Upsert: replaces whatever is stored under key.
    void save(const std::string& key, std::istream& in, uintmax_t size, const concurrency::CancelToken& cancel = {}) const;

    // Throws NotFound for a missing key.
    [[nodiscard]] std::unique_ptr<std::istream> get(const std::string& key, const concurrency::CancelToken& cancel = {}) const;

    // Missing keys are not an error.
    void remove(const std::string& key, const concurrency::CancelToken& cancel = {}) const;

    [[nodiscard]] bool exists(const std::string& key, const concurrency::CancelToken& cancel = {}) const;
    [[nodiscard]] ObjectInfo stat(const std::string& key, const concurrency::CancelToken& cancel = {}) const;
    void copy(const std::string& src, const std::string& dst, const concurrency::CancelToken& cancel = {}) const;
    void move(const std::string& src, const std::string& dst, const concurrency::CancelToken& cancel = {}) const;

    // #########################################################################
    // ########################### DIRECTORIES #################################
    // #########################################################################

    [[nodiscard]] std::vector<ObjectInfo> list(const std::string& prefix, const concurrency::CancelToken& cancel = {}) const;
    void createDir(const std::string& path, const concurrency::CancelToken& cancel = {}) const;
    void deleteDir(const std::string& path, const concurrency::CancelToken& cancel = {}) const;
    [[nodiscard]] uintmax_t diskUsage(const std::string& prefix, const concurrency::CancelToken& cancel = {}) const;

    // #########################################################################
    // ######################## MULTIPART UPLOADS ##############################
    // #########################################################################

    [[nodiscard]] std::string initiateMultipart(const std::string& key, const concurrency::CancelToken& cancel = {}) const;

    [[nodiscard]] std::string uploadPart(const std::string& key, const std::string& uploadId, unsigned int partNumber,
                                         std::istream& in, uintmax_t size,
                                         const concurrency::CancelToken& cancel = {}) const;

    void completeMultipart(const std::string& key, const std::string& uploadId,
                           const std::vector<std::string>& partIds, const concurrency::CancelToken& cancel = {}) const;

    void abortMultipart(const std::string& key, const std::string& uploadId,
                        const concurrency::CancelToken& cancel = {}) const;

    // Every part but the last must be at least this large.
    [[nodiscard]] uintmax_t minPartSize() const;

    // #########################################################################
    // ################################ URLS ###################################
    // #########################################################################

    [[nodiscard]] std::string getURL(const std::string& key) const;
    [[nodiscard]] std::string getDownloadURL(const std::string& key, const std::string& filename) const;

    [[nodiscard]] const Variant& impl() const { return impl_; }

private:
    Variant impl_;
    config::BackendType type_;
};

}
