#include "storage/s3/S3Controller.hpp"
#include "logging/LogRegistry.hpp"
#include "util/timestamp.hpp"

#include <pugixml.hpp>

using namespace cf::cloud;
using namespace cf::storage;
using namespace cf::concurrency;
using namespace cf::logging;

std::string S3Controller::putObject(const std::string& key, std::istream& in, const uintmax_t size,
                                    const std::string& contentType, const std::optional<std::string>& contentHash,
                                    const CancelToken& cancel) const {
    Request req;
    req.operation = "putObject";
    req.method = "PUT";
    req.key = key;
    req.contentType = contentType.empty() ? "application/octet-stream" : contentType;
    if (contentHash) req.amzHeaders[CONTENT_HASH_HEADER] = *contentHash;
    req.stream = &in;
    req.streamSize = size;

    const auto resp = send(req, cancel);
    if (!resp.ok()) raise(req, resp, ErrorCode::UploadFailed, cancel);

    std::string etag;
    if (!util::extractETag(resp.hdr, etag))
        LogRegistry::cloud()->warn("[S3Controller] putObject for {} returned no ETag", key);
    return util::stripQuotes(etag);
}

void S3Controller::getObject(const std::string& key, std::ostream& out, const CancelToken& cancel) const {
    Request req;
    req.operation = "getObject";
    req.method = "GET";
    req.key = key;
    req.sink = &out;

    const auto resp = send(req, cancel);
    if (!resp.ok()) raise(req, resp, ErrorCode::DownloadFailed, cancel);
    out.flush();
}

void S3Controller::deleteObject(const std::string& key, const CancelToken& cancel) const {
    Request req;
    req.operation = "deleteObject";
    req.method = "DELETE";
    req.key = key;

    const auto resp = send(req, cancel);
    if (resp.ok() || (resp.curl == CURLE_OK && resp.http == 404)) return;
    raise(req, resp, ErrorCode::DeleteFailed, cancel);
}

void S3Controller::copyObject(const std::string& src, const std::string& dst, const CancelToken& cancel) const {
    util::CurlEasy tmpHandle;

    Request req;
    req.operation = "copyObject";
    req.method = "PUT";
    req.key = dst;
    req.amzHeaders["x-amz-copy-source"] = "/" + config_.bucket + "/" + util::escapeKeyPreserveSlashes(tmpHandle, src);

    auto resp = send(req, cancel);

    // CopyObject can fail after the 200 status line went out; the body then holds an <Error>.
    if (resp.ok()) {
        pugi::xml_document doc;
        if (!doc.load_string(resp.body.c_str()) || !doc.child("Error")) return;
        resp.http = 500;
    }
    raise(req, resp, ErrorCode::UploadFailed, cancel);
}

std::vector<S3ListEntry> S3Controller::listObjects(const std::string& prefix, const std::string& delimiter,
                                                   const CancelToken& cancel) const {
    std::vector<S3ListEntry> out;
    std::string continuationToken;
    bool moreResults = true;

    while (moreResults) {
        Request req;
        req.operation = "listObjects";
        req.method = "GET";
        req.query["list-type"] = "2";
        if (!prefix.empty()) req.query["prefix"] = prefix;
        if (!delimiter.empty()) req.query["delimiter"] = delimiter;
        if (!continuationToken.empty()) req.query["continuation-token"] = continuationToken;

        const auto resp = send(req, cancel);
        if (!resp.ok()) raise(req, resp, ErrorCode::DownloadFailed, cancel);

        pugi::xml_document doc;
        if (const auto result = doc.load_string(resp.body.c_str()); !result)
            throw StorageError(ErrorCode::DownloadFailed, "listObjects", prefix,
                               std::string("unparseable ListBucketResult: ") + result.description());

        const auto root = doc.child("ListBucketResult");
        if (!root) throw StorageError(ErrorCode::DownloadFailed, "listObjects", prefix, "no ListBucketResult in response");

        for (const auto content : root.children("Contents")) {
            S3ListEntry entry;
            entry.key = content.child_value("Key");
            entry.size = content.child("Size").text().as_ullong();
            entry.last_modified = util::parseIso8601(content.child_value("LastModified"));
            entry.etag = util::stripQuotes(content.child_value("ETag"));
            out.push_back(std::move(entry));
        }

        for (const auto common : root.children("CommonPrefixes")) {
            S3ListEntry entry;
            entry.key = common.child_value("Prefix");
            entry.is_prefix = true;
            out.push_back(std::move(entry));
        }

        continuationToken = root.child_value("NextContinuationToken");
        moreResults = std::string(root.child_value("IsTruncated")) == "true" && !continuationToken.empty();
    }

    return out;
}
