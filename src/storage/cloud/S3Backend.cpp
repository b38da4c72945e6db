#include "storage/cloud/S3Backend.hpp"
#include "storage/KeyScheme.hpp"
#include "storage/MimeTypes.hpp"
#include "storage/StorageError.hpp"
#include "crypto/Hash.hpp"
#include "crypto/IdGenerator.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace cf::cloud;
using namespace cf::storage;
using namespace cf::concurrency;
using namespace cf::logging;

namespace fs = std::filesystem;

static constexpr size_t CHUNK_SIZE = 64 * 1024;
static constexpr unsigned int MAX_PART_NUMBER = 10000;

namespace {

fs::path spoolPath() {
    return fs::temp_directory_path() / ("coffer-s3-" + cf::crypto::uuid4());
}

// Consumes exactly `size` bytes, hashing them and optionally copying them to `copy`.
std::string hashExactly(std::istream& in, const uintmax_t size, std::ostream* copy, const CancelToken& cancel,
                        const std::string& key) {
    cf::crypto::Hash::Blake2b hasher;
    std::vector<char> buf(CHUNK_SIZE);
    uintmax_t remaining = size;

    while (remaining > 0) {
        cancel.throwIfCancelled("save", key);
        in.read(buf.data(), static_cast<std::streamsize>(std::min<uintmax_t>(remaining, buf.size())));
        const auto got = in.gcount();
        if (got <= 0)
            throw StorageError(ErrorCode::UploadFailed, "save", key,
                               fmt::format("stream ended after {} of {} bytes", size - remaining, size));
        hasher.update(buf.data(), static_cast<size_t>(got));
        if (copy && !copy->write(buf.data(), got)) throw std::runtime_error("Failed to write upload spool file");
        remaining -= static_cast<uintmax_t>(got);
    }
    return hasher.finalHex();
}

void requireObjectKey(const std::string& key, const std::string& operation) {
    KeyScheme::requireSafe(key, operation);
    if (KeyScheme::isRoot(key)) throw StorageError(ErrorCode::InvalidKey, operation, key, "the root is not an object");
}

}

S3Backend::S3Backend(config::S3StorageConfig config, config::RetryConfig retry, const std::chrono::seconds urlExpiry)
    : controller_(std::move(config), retry), urlExpiry_(urlExpiry) {}

std::string S3Backend::childPrefix(const std::string& path) {
    if (path.empty() || KeyScheme::isRoot(path)) return "";
    return path + "/";
}

void S3Backend::save(const std::string& key, std::istream& in, const uintmax_t size, const CancelToken& cancel) const {
    requireObjectKey(key, "save");
    const auto mime = MimeTypes::fromPath(key);

    try {
        if (const auto start = in.tellg(); start != std::streampos(-1)) {
            const auto hash = hashExactly(in, size, nullptr, cancel, key);
            in.clear();
            in.seekg(start);
            (void)controller_.putObject(key, in, size, mime, hash, cancel);
            return;
        }

        // Forward-only input: spool it so the hash can travel with the PUT and retries can rewind.
        const auto spool = spoolPath();
        std::fstream tmp(spool, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
        if (!tmp.is_open()) throw std::runtime_error("Failed to open upload spool file " + spool.string());
        fs::remove(spool);

        const auto hash = hashExactly(in, size, &tmp, cancel, key);
        tmp.flush();
        tmp.seekg(0);
        (void)controller_.putObject(key, tmp, size, mime, hash, cancel);
    } catch (const std::exception& e) {
        LogRegistry::cloud()->error("[S3Backend] save failed for {}: {}", key, e.what());
        rethrowWrapped(ErrorCode::UploadFailed, "save", key);
    }
}

std::unique_ptr<std::istream> S3Backend::get(const std::string& key, const CancelToken& cancel) const {
    requireObjectKey(key, "get");

    const auto spool = spoolPath();
    auto out = std::make_unique<std::fstream>(spool, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out->is_open()) throw StorageError(ErrorCode::DownloadFailed, "get", key, "failed to open download spool file");

    // The open descriptor keeps the data alive after the name is gone.
    std::error_code ec;
    fs::remove(spool, ec);

    try {
        controller_.getObject(key, *out, cancel);
        out->seekg(0);
        return out;
    } catch (const std::exception&) {
        rethrowWrapped(ErrorCode::DownloadFailed, "get", key);
    }
}

void S3Backend::remove(const std::string& key, const CancelToken& cancel) const {
    requireObjectKey(key, "delete");
    controller_.deleteObject(key, cancel);
}

bool S3Backend::exists(const std::string& key, const CancelToken& cancel) const {
    KeyScheme::requireSafe(key, "exists");
    if (KeyScheme::isRoot(key)) return true;
    if (controller_.headObject(key, cancel)) return true;
    return !controller_.listObjects(childPrefix(key), "/", cancel).empty();
}

ObjectInfo S3Backend::stat(const std::string& key, const CancelToken& cancel) const {
    KeyScheme::requireSafe(key, "stat");

    ObjectInfo info;
    info.key = key;

    if (!KeyScheme::isRoot(key)) {
        if (const auto head = controller_.headObject(key, cancel)) {
            info.size = head->size;
            info.last_modified = head->last_modified;
            info.mime_type = head->content_type.empty() ? MimeTypes::fromPath(key) : head->content_type;
            info.etag = head->etag;
            info.content_hash = head->content_hash.value_or("");
            return info;
        }
        if (controller_.listObjects(childPrefix(key), "/", cancel).empty())
            throw StorageError(ErrorCode::NotFound, "stat", key, "no object at key");
    }

    info.is_dir = true;
    return info;
}

void S3Backend::copy(const std::string& src, const std::string& dst, const CancelToken& cancel) const {
    requireObjectKey(src, "copy");
    requireObjectKey(dst, "copy");
    controller_.copyObject(src, dst, cancel);
}

void S3Backend::move(const std::string& src, const std::string& dst, const CancelToken& cancel) const {
    requireObjectKey(src, "move");
    requireObjectKey(dst, "move");
    if (src == dst) {
        if (!controller_.headObject(src, cancel))
            throw StorageError(ErrorCode::NotFound, "move", src, "no object at source key");
        return;
    }
    controller_.copyObject(src, dst, cancel);
    try {
        controller_.deleteObject(src, cancel);
    } catch (const std::exception&) {
        try {
            controller_.deleteObject(dst, CancelToken{});
        } catch (const std::exception& e) {
            LogRegistry::cloud()->error("[S3Backend] move {} -> {} left a stray copy: {}", src, dst, e.what());
        }
        throw;
    }
}

std::vector<ObjectInfo> S3Backend::list(const std::string& prefix, const CancelToken& cancel) const {
    if (!prefix.empty()) KeyScheme::requireSafe(prefix, "list");
    const auto base = childPrefix(prefix);

    std::vector<ObjectInfo> out;
    for (auto& entry : controller_.listObjects(base, "/", cancel)) {
        if (entry.key == base) continue; // the directory's own marker

        ObjectInfo info;
        info.is_dir = entry.is_prefix;
        info.key = entry.is_prefix && entry.key.ends_with('/') ? entry.key.substr(0, entry.key.size() - 1) : entry.key;
        info.size = entry.size;
        info.last_modified = entry.last_modified;
        if (!info.is_dir) {
            info.mime_type = MimeTypes::fromPath(info.key);
            info.etag = std::move(entry.etag);
        }
        out.push_back(std::move(info));
    }

    std::ranges::sort(out, {}, &ObjectInfo::key);
    return out;
}

void S3Backend::createDir(const std::string& path, const CancelToken& cancel) const {
    KeyScheme::requireSafe(path, "createDir");
    if (KeyScheme::isRoot(path)) return;

    std::istringstream empty;
    (void)controller_.putObject(path + "/", empty, 0, "application/x-directory", std::nullopt, cancel);
}

void S3Backend::deleteDir(const std::string& path, const CancelToken& cancel) const {
    KeyScheme::requireSafe(path, "deleteDir");
    if (KeyScheme::isRoot(path)) throw StorageError(ErrorCode::InvalidKey, "deleteDir", path, "refusing to delete the storage root");

    const auto entries = controller_.listObjects(childPrefix(path), "", cancel);
    for (const auto& entry : entries) controller_.deleteObject(entry.key, cancel);

    LogRegistry::cloud()->debug("[S3Backend] deleteDir {} removed {} objects", path, entries.size());
}

uintmax_t S3Backend::diskUsage(const std::string& prefix, const CancelToken& cancel) const {
    if (!prefix.empty()) KeyScheme::requireSafe(prefix, "diskUsage");

    uintmax_t total = 0;
    for (const auto& entry : controller_.listObjects(childPrefix(prefix), "", cancel)) total += entry.size;
    return total;
}

std::string S3Backend::initiateMultipart(const std::string& key, const CancelToken& cancel) const {
    requireObjectKey(key, "initiateMultipart");
    return controller_.initiateMultipartUpload(key, cancel);
}

std::string S3Backend::uploadPart(const std::string& key, const std::string& uploadId, const unsigned int partNumber,
                                  std::istream& in, const uintmax_t size, const CancelToken& cancel) const {
    requireObjectKey(key, "uploadPart");
    if (partNumber == 0 || partNumber > MAX_PART_NUMBER)
        throw StorageError(ErrorCode::UploadFailed, "uploadPart", key,
                           fmt::format("part number {} outside 1..{}", partNumber, MAX_PART_NUMBER));
    return controller_.uploadPart(key, uploadId, partNumber, in, size, cancel);
}

void S3Backend::completeMultipart(const std::string& key, const std::string& uploadId,
                                  const std::vector<std::string>& partIds, const CancelToken& cancel) const {
    requireObjectKey(key, "completeMultipart");
    controller_.completeMultipartUpload(key, uploadId, partIds, cancel);
}

void S3Backend::abortMultipart(const std::string& key, const std::string& uploadId, const CancelToken& cancel) const {
    requireObjectKey(key, "abortMultipart");
    controller_.abortMultipartUpload(key, uploadId, cancel);
}

std::string S3Backend::getURL(const std::string& key) const {
    requireObjectKey(key, "getURL");
    return controller_.objectURL(key);
}

std::string S3Backend::getDownloadURL(const std::string& key, const std::string& filename) const {
    requireObjectKey(key, "getDownloadURL");
    return controller_.presignGet(key, urlExpiry_, filename.empty() ? std::nullopt : std::optional(filename));
}
