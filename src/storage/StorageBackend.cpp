#include "storage/StorageBackend.hpp"
#include "storage/StorageError.hpp"
#include "logging/LogRegistry.hpp"

using namespace cf::storage;
using namespace cf::concurrency;
using namespace cf::logging;

std::shared_ptr<StorageBackend> StorageBackend::create(const config::StorageConfig& cfg) {
    const auto type = config::parseBackendType(cfg.backend);

    switch (type) {
        case config::BackendType::Local:
            LogRegistry::storage()->info("[StorageBackend] Using local disk backend at {}", cfg.local.root.string());
            return std::make_shared<StorageBackend>(LocalDiskBackend(cfg.local), type);

        case config::BackendType::S3:
            LogRegistry::storage()->info("[StorageBackend] Using S3 backend, bucket {}", cfg.s3.bucket);
            return std::make_shared<StorageBackend>(cloud::S3Backend(cfg.s3, cfg.retry, cfg.url_expiry), type);

        case config::BackendType::MinIO: {
            if (cfg.s3.endpoint.empty())
                throw StorageError(ErrorCode::UnsupportedBackend, "minio backend requires storage.s3.endpoint");
            auto s3 = cfg.s3;
            s3.path_style = true;
            LogRegistry::storage()->info("[StorageBackend] Using MinIO backend at {}, bucket {}", s3.endpoint, s3.bucket);
            return std::make_shared<StorageBackend>(cloud::S3Backend(std::move(s3), cfg.retry, cfg.url_expiry), type);
        }
    }

    throw StorageError(ErrorCode::UnsupportedBackend, "unsupported storage backend: " + cfg.backend);
}

StorageBackend::StorageBackend(Variant impl, const config::BackendType type) : impl_(std::move(impl)), type_(type) {}

void StorageBackend::save(const std::string& key, std::istream& in, const uintmax_t size, const CancelToken& cancel) const {
    std::visit([&](const auto& b) { b.save(key, in, size, cancel); }, impl_);
}

std::unique_ptr<std::istream> StorageBackend::get(const std::string& key, const CancelToken& cancel) const {
    return std::visit([&](const auto& b) { return b.get(key, cancel); }, impl_);
}

void StorageBackend::remove(const std::string& key, const CancelToken& cancel) const {
    std::visit([&](const auto& b) { b.remove(key, cancel); }, impl_);
}

bool StorageBackend::exists(const std::string& key, const CancelToken& cancel) const {
    return std::visit([&](const auto& b) { return b.exists(key, cancel); }, impl_);
}

ObjectInfo StorageBackend::stat(const std::string& key, const CancelToken& cancel) const {
    return std::visit([&](const auto& b) { return b.stat(key, cancel); }, impl_);
}

void StorageBackend::copy(const std::string& src, const std::string& dst, const CancelToken& cancel) const {
    std::visit([&](const auto& b) { b.copy(src, dst, cancel); }, impl_);
}

void StorageBackend::move(const std::string& src, const std::string& dst, const CancelToken& cancel) const {
    std::visit([&](const auto& b) { b.move(src, dst, cancel); }, impl_);
}

std::vector<ObjectInfo> StorageBackend::list(const std::string& prefix, const CancelToken& cancel) const {
    return std::visit([&](const auto& b) { return b.list(prefix, cancel); }, impl_);
}

void StorageBackend::createDir(const std::string& path, const CancelToken& cancel) const {
    std::visit([&](const auto& b) { b.createDir(path, cancel); }, impl_);
}

void StorageBackend::deleteDir(const std::string& path, const CancelToken& cancel) const {
    std::visit([&](const auto& b) { b.deleteDir(path, cancel); }, impl_);
}

uintmax_t StorageBackend::diskUsage(const std::string& prefix, const CancelToken& cancel) const {
    return std::visit([&](const auto& b) { return b.diskUsage(prefix, cancel); }, impl_);
}

std::string StorageBackend::initiateMultipart(const std::string& key, const CancelToken& cancel) const {
    return std::visit([&](const auto& b) { return b.initiateMultipart(key, cancel); }, impl_);
}

std::string StorageBackend::uploadPart(const std::string& key, const std::string& uploadId,
                                       const unsigned int partNumber, std::istream& in, const uintmax_t size,
                                       const CancelToken& cancel) const {
    return std::visit([&](const auto& b) { return b.uploadPart(key, uploadId, partNumber, in, size, cancel); }, impl_);
}

void StorageBackend::completeMultipart(const std::string& key, const std::string& uploadId,
                                       const std::vector<std::string>& partIds, const CancelToken& cancel) const {
    std::visit([&](const auto& b) { b.completeMultipart(key, uploadId, partIds, cancel); }, impl_);
}

void StorageBackend::abortMultipart(const std::string& key, const std::string& uploadId,
                                    const CancelToken& cancel) const {
    std::visit([&](const auto& b) { b.abortMultipart(key, uploadId, cancel); }, impl_);
}

uintmax_t StorageBackend::minPartSize() const {
    return std::visit([](const auto& b) { return b.minPartSize(); }, impl_);
}

std::string StorageBackend::getURL(const std::string& key) const {
    return std::visit([&](const auto& b) { return b.getURL(key); }, impl_);
}

std::string StorageBackend::getDownloadURL(const std::string& key, const std::string& filename) const {
    return std::visit([&](const auto& b) { return b.getDownloadURL(key, filename); }, impl_);
}
