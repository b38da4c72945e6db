#include "storage/LocalDiskBackend.hpp"
#include "storage/KeyScheme.hpp"
#include "storage/MimeTypes.hpp"
#include "storage/StorageError.hpp"
#include "crypto/Hash.hpp"
#include "crypto/IdGenerator.hpp"
#include "logging/LogRegistry.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>

using namespace cf::storage;
using namespace cf::concurrency;
using namespace cf::logging;

static constexpr auto TEMP_MARKER = ".coffer-tmp-";
static constexpr auto MANIFEST_NAME = "manifest.json";
static constexpr unsigned int MAX_PART_NUMBER = 10000;

LocalDiskBackend::LocalDiskBackend(config::LocalStorageConfig config) : config_(std::move(config)) {
    if (config_.root.empty()) throw std::invalid_argument("[LocalDiskBackend] storage root must be configured");
    fs::create_directories(config_.root);
    config_.root = fs::canonical(config_.root);
    LogRegistry::storage()->debug("[LocalDiskBackend] Using root {}", config_.root.string());
}

fs::path LocalDiskBackend::resolve(const std::string& key, const std::string& operation) const {
    KeyScheme::requireSafe(key, operation);
    if (KeyScheme::firstSegment(key) == KeyScheme::MULTIPART_PREFIX)
        throw StorageError(ErrorCode::InvalidKey, operation, key, "key addresses the reserved multipart area");
    if (KeyScheme::isRoot(key)) return config_.root;
    return config_.root / key;
}

fs::path LocalDiskBackend::tempPathFor(const fs::path& target) const {
    return target.parent_path() / ("." + target.filename().string() + TEMP_MARKER + crypto::uuid4());
}

std::string LocalDiskBackend::writeAtomically(const fs::path& target, std::istream& in, const uintmax_t size,
                                              const CancelToken& cancel, const std::string& operation,
                                              const std::string& key, const bool createParents) const {
    const auto tmp = tempPathFor(target);

    std::ofstream out;
    if (createParents) {
        for (int attempt = 0; attempt < 2 && !out.is_open(); ++attempt) {
            // A concurrent delete may prune the parent between these two calls.
            fs::create_directories(target.parent_path());
            out.open(tmp, std::ios::binary | std::ios::trunc);
        }
    } else {
        out.open(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open() && !fs::is_directory(target.parent_path()))
            throw StorageError(ErrorCode::NotFound, operation, key, "parent directory no longer exists");
    }
    if (!out.is_open()) throw std::runtime_error("Failed to open temp file for writing: " + tmp.string());

    try {
        crypto::Hash::Blake2b hasher;
        std::vector<char> buf(CHUNK_SIZE);
        uintmax_t remaining = size;

        while (remaining > 0) {
            cancel.throwIfCancelled(operation, key);
            const auto want = static_cast<std::streamsize>(std::min<uintmax_t>(remaining, buf.size()));
            in.read(buf.data(), want);
            const auto got = in.gcount();
            if (got <= 0)
                throw StorageError(ErrorCode::UploadFailed, operation, key,
                                   fmt::format("stream ended after {} of {} bytes", size - remaining, size));
            out.write(buf.data(), got);
            if (!out) throw std::runtime_error("Write failed: " + tmp.string());
            hasher.update(buf.data(), static_cast<size_t>(got));
            remaining -= static_cast<uintmax_t>(got);
        }

        out.close();
        if (out.fail()) throw std::runtime_error("Failed to flush " + tmp.string());

        cancel.throwIfCancelled(operation, key);
        fs::rename(tmp, target);
        return hasher.finalHex();
    } catch (const std::exception&) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }
}

void LocalDiskBackend::pruneEmptyParents(fs::path dir) const {
    std::error_code ec;
    while (!dir.empty() && dir != config_.root && dir.string().starts_with(config_.root.string())) {
        if (!fs::is_empty(dir, ec) || ec) return;
        if (!fs::remove(dir, ec) || ec) return;
        dir = dir.parent_path();
    }
}

void LocalDiskBackend::save(const std::string& key, std::istream& in, const uintmax_t size,
                            const CancelToken& cancel) const {
    const auto path = resolve(key, "save");
    try {
        if (fs::is_directory(path))
            throw StorageError(ErrorCode::UploadFailed, "save", key, "a directory exists at this key");
        writeAtomically(path, in, size, cancel, "save", key);
    } catch (const std::exception& e) {
        LogRegistry::storage()->error("[LocalDiskBackend] save failed for {}: {}", key, e.what());
        rethrowWrapped(ErrorCode::UploadFailed, "save", key);
    }
}

std::unique_ptr<std::istream> LocalDiskBackend::get(const std::string& key, const CancelToken& cancel) const {
    const auto path = resolve(key, "get");
    cancel.throwIfCancelled("get", key);

    if (!fs::exists(path)) throw StorageError(ErrorCode::NotFound, "get", key, "no object at key");
    if (!fs::is_regular_file(path)) throw StorageError(ErrorCode::DownloadFailed, "get", key, "key is a directory");

    auto stream = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!stream->is_open()) {
        LogRegistry::storage()->error("[LocalDiskBackend] Failed to open {} for reading", path.string());
        throw StorageError(ErrorCode::DownloadFailed, "get", key, "failed to open object for reading");
    }
    return stream;
}

void LocalDiskBackend::remove(const std::string& key, const CancelToken& cancel) const {
    const auto path = resolve(key, "delete");
    cancel.throwIfCancelled("delete", key);

    try {
        const auto status = fs::symlink_status(path);
        if (!fs::exists(status)) return;
        if (fs::is_directory(status))
            throw StorageError(ErrorCode::DeleteFailed, "delete", key, "key is a directory, use deleteDir");
        fs::remove(path);
        pruneEmptyParents(path.parent_path());
    } catch (const std::exception& e) {
        LogRegistry::storage()->error("[LocalDiskBackend] delete failed for {}: {}", key, e.what());
        rethrowWrapped(ErrorCode::DeleteFailed, "delete", key);
    }
}

bool LocalDiskBackend::exists(const std::string& key, const CancelToken& cancel) const {
    const auto path = resolve(key, "exists");
    cancel.throwIfCancelled("exists", key);
    return fs::exists(path);
}

ObjectInfo LocalDiskBackend::stat(const std::string& key, const CancelToken& cancel) const {
    const auto path = resolve(key, "stat");
    cancel.throwIfCancelled("stat", key);

    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) throw StorageError(ErrorCode::NotFound, "stat", key, "no object at key");

    try {
        ObjectInfo info;
        info.key = key;
        info.last_modified = util::fileTimeToTimeT(fs::last_write_time(path));
        if (fs::is_directory(status)) {
            info.is_dir = true;
            return info;
        }

        info.size = fs::file_size(path);
        info.mime_type = MimeTypes::fromPath(key);
        info.content_hash = crypto::Hash::blake2b(path);
        info.etag = info.content_hash;
        return info;
    } catch (const std::exception& e) {
        LogRegistry::storage()->error("[LocalDiskBackend] stat failed for {}: {}", key, e.what());
        rethrowWrapped(ErrorCode::DownloadFailed, "stat", key);
    }
}

void LocalDiskBackend::copy(const std::string& src, const std::string& dst, const CancelToken& cancel) const {
    const auto from = resolve(src, "copy");
    const auto to = resolve(dst, "copy");

    if (!fs::is_regular_file(from)) throw StorageError(ErrorCode::NotFound, "copy", src, "no object at source key");

    try {
        std::ifstream in(from, std::ios::binary);
        if (!in.is_open()) throw std::runtime_error("Failed to open source " + from.string());
        writeAtomically(to, in, fs::file_size(from), cancel, "copy", dst);
    } catch (const std::exception& e) {
        LogRegistry::storage()->error("[LocalDiskBackend] copy {} -> {} failed: {}", src, dst, e.what());
        rethrowWrapped(ErrorCode::UploadFailed, "copy", dst);
    }
}

void LocalDiskBackend::move(const std::string& src, const std::string& dst, const CancelToken& cancel) const {
    const auto from = resolve(src, "move");
    const auto to = resolve(dst, "move");
    cancel.throwIfCancelled("move", src);

    if (!fs::exists(from)) throw StorageError(ErrorCode::NotFound, "move", src, "no object at source key");
    if (from == to) return;

    try {
        fs::create_directories(to.parent_path());
        fs::rename(from, to);
        pruneEmptyParents(from.parent_path());
    } catch (const std::exception& e) {
        LogRegistry::storage()->error("[LocalDiskBackend] move {} -> {} failed: {}", src, dst, e.what());
        rethrowWrapped(ErrorCode::UploadFailed, "move", dst);
    }
}

std::vector<ObjectInfo> LocalDiskBackend::list(const std::string& prefix, const CancelToken& cancel) const {
    const bool atRoot = prefix.empty() || KeyScheme::isRoot(prefix);
    const auto dir = atRoot ? config_.root : resolve(prefix, "list");

    std::vector<ObjectInfo> out;
    if (!fs::is_directory(dir)) return out;

    try {
        for (const auto& entry : fs::directory_iterator(dir)) {
            cancel.throwIfCancelled("list", prefix);

            const auto name = entry.path().filename().string();
            if (atRoot && name == KeyScheme::MULTIPART_PREFIX) continue;
            if (name.find(TEMP_MARKER) != std::string::npos) continue;

            ObjectInfo info;
            info.key = atRoot ? name : prefix + "/" + name;
            info.is_dir = entry.is_directory();
            info.last_modified = util::fileTimeToTimeT(entry.last_write_time());
            if (!info.is_dir) {
                info.size = entry.file_size();
                info.mime_type = MimeTypes::fromPath(name);
            }
            out.push_back(std::move(info));
        }
    } catch (const std::exception& e) {
        LogRegistry::storage()->error("[LocalDiskBackend] list failed for '{}': {}", prefix, e.what());
        rethrowWrapped(ErrorCode::DownloadFailed, "list", prefix);
    }

    std::ranges::sort(out, {}, &ObjectInfo::key);
    return out;
}

void LocalDiskBackend::createDir(const std::string& path, const CancelToken& cancel) const {
    const auto dir = resolve(path, "createDir");
    cancel.throwIfCancelled("createDir", path);

    if (fs::exists(dir) && !fs::is_directory(dir))
        throw StorageError(ErrorCode::UploadFailed, "createDir", path, "an object exists at this key");

    try {
        fs::create_directories(dir);
    } catch (const std::exception& e) {
        LogRegistry::storage()->error("[LocalDiskBackend] createDir failed for {}: {}", path, e.what());
        rethrowWrapped(ErrorCode::UploadFailed, "createDir", path);
    }
}

void LocalDiskBackend::deleteDir(const std::string& path, const CancelToken& cancel) const {
    const auto dir = resolve(path, "deleteDir");
    if (KeyScheme::isRoot(path)) throw StorageError(ErrorCode::InvalidKey, "deleteDir", path, "refusing to delete the storage root");
    cancel.throwIfCancelled("deleteDir", path);

    if (!fs::exists(dir)) return;
    if (!fs::is_directory(dir)) throw StorageError(ErrorCode::DeleteFailed, "deleteDir", path, "key is not a directory");

    try {
        fs::remove_all(dir);
        pruneEmptyParents(dir.parent_path());
    } catch (const std::exception& e) {
        LogRegistry::storage()->error("[LocalDiskBackend] deleteDir failed for {}: {}", path, e.what());
        rethrowWrapped(ErrorCode::DeleteFailed, "deleteDir", path);
    }
}

uintmax_t LocalDiskBackend::diskUsage(const std::string& prefix, const CancelToken& cancel) const {
    const bool atRoot = prefix.empty() || KeyScheme::isRoot(prefix);
    const auto dir = atRoot ? config_.root : resolve(prefix, "diskUsage");
    if (!fs::exists(dir)) return 0;
    if (fs::is_regular_file(dir)) return fs::file_size(dir);

    uintmax_t total = 0;
    for (auto it = fs::recursive_directory_iterator(dir); it != fs::recursive_directory_iterator(); ++it) {
        cancel.throwIfCancelled("diskUsage", prefix);
        if (atRoot && it.depth() == 0 && it->path().filename() == KeyScheme::MULTIPART_PREFIX) {
            it.disable_recursion_pending();
            continue;
        }
        if (it->is_regular_file()) total += it->file_size();
    }
    return total;
}

// #########################################################################
// ######################## MULTIPART UPLOADS ##############################
// #########################################################################

fs::path LocalDiskBackend::uploadDir(const std::string& uploadId, const std::string& operation) const {
    if (uploadId.empty() || uploadId.find('/') != std::string::npos || !KeyScheme::isSafe(uploadId)
        || uploadId == "." || uploadId == "..")
        throw StorageError(ErrorCode::NotFound, operation, uploadId, "unknown upload");

    auto dir = config_.root / KeyScheme::MULTIPART_PREFIX / uploadId;
    if (!fs::is_directory(dir)) throw StorageError(ErrorCode::NotFound, operation, uploadId, "unknown upload");
    return dir;
}

static void requireManifestKey(const fs::path& dir, const std::string& key, const std::string& operation) {
    std::ifstream in(dir / MANIFEST_NAME);
    if (!in.is_open()) throw StorageError(ErrorCode::UploadFailed, operation, key, "upload manifest missing");

    const auto manifest = nlohmann::json::parse(in);
    if (manifest.at("key").get<std::string>() != key)
        throw StorageError(ErrorCode::UploadFailed, operation, key, "upload was initiated for a different key");
}

std::string LocalDiskBackend::initiateMultipart(const std::string& key, const CancelToken& cancel) const {
    (void)resolve(key, "initiateMultipart");
    cancel.throwIfCancelled("initiateMultipart", key);

    const auto uploadId = crypto::uuid4();
    const auto dir = config_.root / KeyScheme::MULTIPART_PREFIX / uploadId;

    try {
        fs::create_directories(dir);
        std::ofstream out(dir / MANIFEST_NAME);
        out << nlohmann::json{{"key", key}, {"created_at", std::time(nullptr)}}.dump();
        out.close();
        if (out.fail()) throw std::runtime_error("Failed to write upload manifest in " + dir.string());
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove_all(dir, ec);
        LogRegistry::storage()->error("[LocalDiskBackend] initiateMultipart failed for {}: {}", key, e.what());
        rethrowWrapped(ErrorCode::UploadFailed, "initiateMultipart", key);
    }

    return uploadId;
}

std::string LocalDiskBackend::uploadPart(const std::string& key, const std::string& uploadId,
                                         const unsigned int partNumber, std::istream& in, const uintmax_t size,
                                         const CancelToken& cancel) const {
    (void)resolve(key, "uploadPart");
    if (partNumber == 0 || partNumber > MAX_PART_NUMBER)
        throw StorageError(ErrorCode::UploadFailed, "uploadPart", key,
                           fmt::format("part number {} outside 1..{}", partNumber, MAX_PART_NUMBER));

    const auto dir = uploadDir(uploadId, "uploadPart");

    try {
        requireManifestKey(dir, key, "uploadPart");
        // An abort may remove the upload directory at any point; never recreate it.
        return writeAtomically(dir / ("part-" + std::to_string(partNumber)), in, size, cancel, "uploadPart", key,
                               false);
    } catch (const std::exception& e) {
        LogRegistry::storage()->error("[LocalDiskBackend] uploadPart {} failed for {}: {}", partNumber, key, e.what());
        rethrowWrapped(ErrorCode::UploadFailed, "uploadPart", key);
    }
}

void LocalDiskBackend::completeMultipart(const std::string& key, const std::string& uploadId,
                                         const std::vector<std::string>& partIds,
                                         const CancelToken& cancel) const {
    const auto target = resolve(key, "completeMultipart");
    const auto dir = uploadDir(uploadId, "completeMultipart");
    if (partIds.empty()) throw StorageError(ErrorCode::UploadFailed, "completeMultipart", key, "no parts supplied");

    const auto tmp = tempPathFor(target);
    try {
        requireManifestKey(dir, key, "completeMultipart");
        fs::create_directories(target.parent_path());

        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) throw std::runtime_error("Failed to open temp file for writing: " + tmp.string());

        std::vector<char> buf(CHUNK_SIZE);
        for (size_t i = 0; i < partIds.size(); ++i) {
            const auto partPath = dir / ("part-" + std::to_string(i + 1));
            std::ifstream part(partPath, std::ios::binary);
            if (!part.is_open())
                throw StorageError(ErrorCode::UploadFailed, "completeMultipart", key,
                                   fmt::format("part {} was never uploaded", i + 1));

            crypto::Hash::Blake2b hasher;
            while (part.good()) {
                cancel.throwIfCancelled("completeMultipart", key);
                part.read(buf.data(), static_cast<std::streamsize>(buf.size()));
                const auto got = part.gcount();
                if (got <= 0) break;
                out.write(buf.data(), got);
                hasher.update(buf.data(), static_cast<size_t>(got));
            }
            if (!out) throw std::runtime_error("Write failed: " + tmp.string());

            if (hasher.finalHex() != partIds[i])
                throw StorageError(ErrorCode::UploadFailed, "completeMultipart", key,
                                   fmt::format("part {} does not match its identifier", i + 1));
        }

        out.close();
        if (out.fail()) throw std::runtime_error("Failed to flush " + tmp.string());

        fs::rename(tmp, target);
        fs::remove_all(dir);
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove(tmp, ec);
        LogRegistry::storage()->error("[LocalDiskBackend] completeMultipart failed for {}: {}", key, e.what());
        rethrowWrapped(ErrorCode::UploadFailed, "completeMultipart", key);
    }
}

void LocalDiskBackend::abortMultipart(const std::string& key, const std::string& uploadId,
                                      const CancelToken& cancel) const {
    (void)cancel;
    fs::path dir;
    try {
        dir = uploadDir(uploadId, "abortMultipart");
    } catch (const StorageError& e) {
        if (e.code() != ErrorCode::NotFound) throw;
        LogRegistry::storage()->debug("[LocalDiskBackend] abort of unknown upload {} for {} ignored", uploadId, key);
        return;
    }

    try {
        fs::remove_all(dir);
    } catch (const std::exception& e) {
        LogRegistry::storage()->error("[LocalDiskBackend] abortMultipart failed for {}: {}", key, e.what());
        rethrowWrapped(ErrorCode::DeleteFailed, "abortMultipart", key);
    }
}

// #########################################################################
// ################################ URLS ###################################
// #########################################################################

std::string LocalDiskBackend::getURL(const std::string& key) const {
    return "file://" + resolve(key, "getURL").string();
}

std::string LocalDiskBackend::getDownloadURL(const std::string& key, const std::string& filename) const {
    (void)filename;
    return getURL(key);
}
