#pragma once

#include "config/Config.hpp"
#include "concurrency/CancelToken.hpp"
#include "storage/ObjectInfo.hpp"
#include "storage/s3/S3Controller.hpp"

#include <chrono>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace cf::cloud {

// Object-store rendition of the storage contract. Directories exist only as
// key prefixes plus an optional zero-byte "<dir>/" marker.
class S3Backend {
public:
    S3Backend(config::S3StorageConfig config, config::RetryConfig retry, std::chrono::seconds urlExpiry);

    void save(const std::string& key, std::istream& in, uintmax_t size, const concurrency::CancelToken& cancel) const;
    [[nodiscard]] std::unique_ptr<std::istream> get(const std::string& key, const concurrency::CancelToken& cancel) const;
    void remove(const std::string& key, const concurrency::CancelToken& cancel) const;
    [[nodiscard]] bool exists(const std::string& key, const concurrency::CancelToken& cancel) const;
    [[nodiscard]] storage::ObjectInfo stat(const std::string& key, const concurrency::CancelToken& cancel) const;
    void copy(const std::string& src, const std::string& dst, const concurrency::CancelToken& cancel) const;
    void move(const std::string& src, const std::string& dst, const concurrency::CancelToken& cancel) const;

    [[nodiscard]] std::vector<storage::ObjectInfo> list(const std::string& prefix,
                                                        const concurrency::CancelToken& cancel) const;
    void createDir(const std::string& path, const concurrency::CancelToken& cancel) const;
    void deleteDir(const std::string& path, const concurrency::CancelToken& cancel) const;
    [[nodiscard]] uintmax_t diskUsage(const std::string& prefix, const concurrency::CancelToken& cancel) const;

    [[nodiscard]] std::string initiateMultipart(const std::string& key, const concurrency::CancelToken& cancel) const;

    [[nodiscard]] std::string uploadPart(const std::string& key, const std::string& uploadId, unsigned int partNumber,
                                         std::istream& in, uintmax_t size,
                                         const concurrency::CancelToken& cancel) const;

    void completeMultipart(const std::string& key, const std::string& uploadId,
                           const std::vector<std::string>& partIds, const concurrency::CancelToken& cancel) const;

    void abortMultipart(const std::string& key, const std::string& uploadId,
                        const concurrency::CancelToken& cancel) const;

    [[nodiscard]] uintmax_t minPartSize() const { return S3Controller::MIN_PART_SIZE; }

    [[nodiscard]] std::string getURL(const std::string& key) const;
    [[nodiscard]] std::string getDownloadURL(const std::string& key, const std::string& filename) const;

    [[nodiscard]] const S3Controller& controller() const { return controller_; }

private:
    S3Controller controller_;
    std::chrono::seconds urlExpiry_;

    // Prefix under which the children of `path` live, "" for the root.
    [[nodiscard]] static std::string childPrefix(const std::string& path);
};

}
