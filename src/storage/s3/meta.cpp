#include "storage/s3/S3Controller.hpp"
#include "logging/LogRegistry.hpp"
#include "util/timestamp.hpp"

#include <algorithm>

using namespace cf::cloud;
using namespace cf::storage;
using namespace cf::concurrency;
using namespace cf::logging;

// SigV4 presigned URLs are capped at seven days.
static constexpr long MAX_PRESIGN_SECONDS = 7 * 24 * 3600;

std::optional<S3ObjectHead> S3Controller::headObject(const std::string& key, const CancelToken& cancel) const {
    Request req;
    req.operation = "headObject";
    req.method = "HEAD";
    req.key = key;

    const auto resp = send(req, cancel);
    if (resp.curl == CURLE_OK && resp.http == 404) return std::nullopt;
    if (!resp.ok()) raise(req, resp, ErrorCode::DownloadFailed, cancel);

    S3ObjectHead head;
    if (const auto len = util::extractHeader(resp.hdr, "Content-Length")) head.size = std::stoull(*len);
    if (const auto mod = util::extractHeader(resp.hdr, "Last-Modified")) head.last_modified = util::parseHttpDate(*mod);
    if (const auto etag = util::extractHeader(resp.hdr, "ETag")) head.etag = util::stripQuotes(*etag);
    if (const auto type = util::extractHeader(resp.hdr, "Content-Type")) head.content_type = *type;
    if (const auto hash = util::extractHeader(resp.hdr, CONTENT_HASH_HEADER); hash && !hash->empty())
        head.content_hash = *hash;
    return head;
}

std::string S3Controller::presignGet(const std::string& key, const std::chrono::seconds expiry,
                                     const std::optional<std::string>& downloadName) const {
    util::CurlEasy curl;
    const auto path = canonicalPath(curl, key);

    std::map<std::string, std::string> params;
    if (downloadName) params["response-content-disposition"] = "attachment; filename=\"" + *downloadName + "\"";

    const auto seconds = std::clamp<long>(static_cast<long>(expiry.count()), 1, MAX_PRESIGN_SECONDS);
    const auto query = util::buildPresignedQuery(curl, creds_, util::getAmzStamps(), path, host_, params, seconds);
    return baseURL_ + path + "?" + query;
}
