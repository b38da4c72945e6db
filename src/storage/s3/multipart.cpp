#include "storage/s3/S3Controller.hpp"
#include "logging/LogRegistry.hpp"

#include <pugixml.hpp>
#include <fmt/format.h>
#include <regex>

using namespace cf::cloud;
using namespace cf::storage;
using namespace cf::concurrency;
using namespace cf::logging;

std::string S3Controller::initiateMultipartUpload(const std::string& key, const CancelToken& cancel) const {
    Request req;
    req.operation = "initiateMultipartUpload";
    req.method = "POST";
    req.key = key;
    req.query["uploads"] = "";
    req.contentType = "application/octet-stream";

    const auto resp = send(req, cancel);
    if (!resp.ok()) raise(req, resp, ErrorCode::UploadFailed, cancel);

    std::smatch m;
    static const std::regex re(R"(<UploadId>([^<]+)</UploadId>)");
    if (std::regex_search(resp.body, m, re) && m.size() > 1) return m[1].str();

    LogRegistry::cloud()->error("[S3Controller] initiateMultipartUpload failed to parse UploadId from response: {}",
                                resp.body);
    throw StorageError(ErrorCode::UploadFailed, req.operation, key, "no UploadId in response");
}

std::string S3Controller::uploadPart(const std::string& key, const std::string& uploadId,
                                     const unsigned int partNumber, std::istream& in, const uintmax_t size,
                                     const CancelToken& cancel) const {
    Request req;
    req.operation = "uploadPart";
    req.method = "PUT";
    req.key = key;
    req.query["partNumber"] = std::to_string(partNumber);
    req.query["uploadId"] = uploadId;
    req.stream = &in;
    req.streamSize = size;

    const auto resp = send(req, cancel);
    if (!resp.ok()) raise(req, resp, ErrorCode::UploadFailed, cancel);

    std::string etag;
    if (!util::extractETag(resp.hdr, etag))
        throw StorageError(ErrorCode::UploadFailed, req.operation, key,
                           fmt::format("no ETag returned for part {}", partNumber));
    return util::stripQuotes(etag);
}

void S3Controller::completeMultipartUpload(const std::string& key, const std::string& uploadId,
                                           const std::vector<std::string>& etags, const CancelToken& cancel) const {
    if (etags.empty()) throw StorageError(ErrorCode::UploadFailed, "completeMultipartUpload", key, "no parts supplied");

    Request req;
    req.operation = "completeMultipartUpload";
    req.method = "POST";
    req.key = key;
    req.query["uploadId"] = uploadId;
    req.contentType = "application/xml";
    req.body = util::composeMultiPartUploadXMLBody(etags);

    auto resp = send(req, cancel);

    // A 200 can still carry an <Error> once S3 has started assembling.
    if (resp.ok()) {
        pugi::xml_document doc;
        if (!doc.load_string(resp.body.c_str()) || !doc.child("Error")) return;
        resp.http = 500;
    }
    raise(req, resp, ErrorCode::UploadFailed, cancel);
}

void S3Controller::abortMultipartUpload(const std::string& key, const std::string& uploadId,
                                        const CancelToken& cancel) const {
    Request req;
    req.operation = "abortMultipartUpload";
    req.method = "DELETE";
    req.key = key;
    req.query["uploadId"] = uploadId;

    const auto resp = send(req, cancel);
    if (resp.ok() || (resp.curl == CURLE_OK && resp.http == 404)) return;
    raise(req, resp, ErrorCode::DeleteFailed, cancel);
}
