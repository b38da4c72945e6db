#include "storage/s3/S3Controller.hpp"
#include "logging/LogRegistry.hpp"

#include <pugixml.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <thread>

using namespace cf::cloud;
using namespace cf::storage;
using namespace cf::concurrency;
using namespace cf::logging;

namespace {

struct SinkContext {
    std::ostream* out;
    std::string* errorBody;
    CURL* handle;
};

// Error responses stay out of the caller's stream.
size_t writeToSink(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* ctx = static_cast<SinkContext*>(userdata);
    const auto n = size * nmemb;

    long http = 0;
    curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &http);
    if (http / 100 != 2) {
        ctx->errorBody->append(ptr, n);
        return n;
    }

    ctx->out->write(ptr, static_cast<std::streamsize>(n));
    return ctx->out->good() ? n : 0;
}

size_t readFromStream(char* buf, const size_t size, const size_t nmemb, void* userdata) {
    auto* in = static_cast<std::istream*>(userdata);
    in->read(buf, static_cast<std::streamsize>(size * nmemb));
    return static_cast<size_t>(in->gcount());
}

int abortOnCancel(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return static_cast<const CancelToken*>(clientp)->cancelled() ? 1 : 0;
}

}

S3Controller::S3Controller(config::S3StorageConfig config, config::RetryConfig retry)
    : config_(std::move(config)), retry_(retry) {
    if (config_.bucket.empty()) throw std::invalid_argument("[S3Controller] S3 backend requires a bucket");

    util::ensureCurlGlobalInit();
    creds_ = {config_.access_key, config_.secret_key, config_.region};

    std::string endpoint = config_.endpoint;
    scheme_ = config_.use_ssl ? "https" : "http";
    if (const auto pos = endpoint.find("://"); pos != std::string::npos) {
        scheme_ = endpoint.substr(0, pos);
        endpoint = endpoint.substr(pos + 3);
    }
    while (!endpoint.empty() && endpoint.back() == '/') endpoint.pop_back();
    if (endpoint.empty()) endpoint = "s3." + config_.region + ".amazonaws.com";

    host_ = config_.path_style ? endpoint : config_.bucket + "." + endpoint;
    baseURL_ = scheme_ + "://" + host_;

    LogRegistry::cloud()->debug("[S3Controller] bucket={} base={} path_style={}",
                                config_.bucket, baseURL_, config_.path_style);
}

std::string S3Controller::canonicalPath(CURL* curl, const std::string& key) const {
    const auto escapedKey = key.empty() ? std::string{} : util::escapeKeyPreserveSlashes(curl, key);
    if (config_.path_style) return "/" + config_.bucket + (escapedKey.empty() ? "" : "/" + escapedKey);
    return "/" + escapedKey;
}

std::string S3Controller::objectURL(const std::string& key) const {
    util::CurlEasy curl;
    return baseURL_ + canonicalPath(curl, key);
}

util::HttpResponse S3Controller::perform(const Request& req, const CancelToken& cancel) const {
    util::HeaderList headers;
    std::string errorBody;
    SinkContext sinkCtx{req.sink, &errorBody, nullptr};
    const std::string emptyBody;
    CancelToken watch = cancel;

    auto resp = util::performCurl([&](CURL* h) {
        const auto path = canonicalPath(h, req.key);
        const auto query = util::canonicalQueryString(h, req.query);
        const auto url = baseURL_ + path + (query.empty() ? "" : "?" + query);

        const std::string payloadHash = req.stream ? "UNSIGNED-PAYLOAD" : util::sha256Hex(req.body.value_or(""));
        const auto stamps = util::getAmzStamps();

        auto hdrMap = req.amzHeaders;
        hdrMap["host"] = host_;
        hdrMap["x-amz-content-sha256"] = payloadHash;
        hdrMap["x-amz-date"] = stamps.amzDate;

        headers.add("Authorization: " + util::buildAuthorizationHeader(creds_, stamps, req.method, path, hdrMap,
                                                                       payloadHash, query));
        for (const auto& [k, v] : hdrMap) if (k != "host") headers.add(k + ": " + v);
        if (!req.contentType.empty()) headers.add("Content-Type: " + req.contentType);

        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.list);

        if (req.method == "HEAD") {
            curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
        } else if (req.stream) {
            curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(h, CURLOPT_READFUNCTION, readFromStream);
            curl_easy_setopt(h, CURLOPT_READDATA, req.stream);
            curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(req.streamSize));
        } else if (req.method == "PUT" || req.method == "POST") {
            const auto& body = req.body ? *req.body : emptyBody;
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, req.method.c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        } else if (req.method != "GET") {
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, req.method.c_str());
        }

        if (req.sink) {
            sinkCtx.handle = h;
            curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToSink);
            curl_easy_setopt(h, CURLOPT_WRITEDATA, &sinkCtx);
        }

        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, abortOnCancel);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, &watch);
        if (const auto left = cancel.remaining())
            curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(std::max<long long>(1, left->count())));
    });

    if (req.sink && resp.body.empty()) resp.body = std::move(errorBody);
    return resp;
}

util::HttpResponse S3Controller::send(const Request& req, const CancelToken& cancel) const {
    const auto bodyStart = req.stream ? req.stream->tellg() : std::streampos(0);
    const auto sinkStart = req.sink ? req.sink->tellp() : std::streampos(0);
    const bool replayable = bodyStart != std::streampos(-1) && sinkStart != std::streampos(-1);
    const auto attempts = std::max(1u, retry_.max_attempts);

    for (unsigned int attempt = 1;; ++attempt) {
        cancel.throwIfCancelled(req.operation, req.key);

        auto resp = perform(req, cancel);
        if (resp.curl == CURLE_ABORTED_BY_CALLBACK || resp.curl == CURLE_OPERATION_TIMEDOUT)
            cancel.throwIfCancelled(req.operation, req.key);

        if (resp.ok() || !resp.transient() || attempt >= attempts || !replayable) return resp;

        std::chrono::milliseconds backoff = retry_.base_backoff * (1 << std::min(attempt - 1, 16u));
        if (const auto left = cancel.remaining()) backoff = std::min(backoff, *left);

        LogRegistry::cloud()->warn("[S3Controller] {} {} attempt {}/{} failed (CURL={} HTTP={}), retrying in {}ms",
                                   req.operation, req.key, attempt, attempts, static_cast<int>(resp.curl),
                                   resp.http, backoff.count());

        std::this_thread::sleep_for(backoff);

        if (req.stream) {
            req.stream->clear();
            req.stream->seekg(bodyStart);
        }
        if (req.sink) {
            req.sink->clear();
            req.sink->seekp(sinkStart);
        }
    }
}

void S3Controller::raise(const Request& req, const util::HttpResponse& resp, const ErrorCode fallback,
                         const CancelToken& cancel) const {
    cancel.throwIfCancelled(req.operation, req.key);

    std::string s3Code, s3Message;
    if (!resp.body.empty()) {
        pugi::xml_document doc;
        if (doc.load_string(resp.body.c_str())) {
            const auto err = doc.child("Error");
            s3Code = err.child_value("Code");
            s3Message = err.child_value("Message");
        }
    }

    auto code = fallback;
    if (resp.curl == CURLE_OK) {
        if (resp.http == 404 || s3Code == "NoSuchKey" || s3Code == "NoSuchUpload") code = ErrorCode::NotFound;
        else if (resp.http == 403) code = ErrorCode::PermissionDenied;
    }

    const auto detail = resp.curl != CURLE_OK
        ? fmt::format("CURL error {}: {}", static_cast<int>(resp.curl), resp.curlError)
        : fmt::format("HTTP {}{}{}", resp.http, s3Code.empty() ? "" : " " + s3Code,
                      s3Message.empty() ? "" : ": " + s3Message);

    LogRegistry::cloud()->error("[S3Controller] {} failed for '{}': {}", req.operation, req.key, detail);
    throw StorageError(code, req.operation, req.key, detail, std::make_exception_ptr(std::runtime_error(detail)));
}
