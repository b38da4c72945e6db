#pragma once

#include "config/Config.hpp"
#include "concurrency/CancelToken.hpp"
#include "storage/StorageError.hpp"
#include "util/curlWrappers.hpp"

#include <chrono>
#include <ctime>
#include <istream>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace cf::cloud {

struct S3ObjectHead {
    uintmax_t size = 0;
    std::time_t last_modified = 0;
    std::string etag;
    std::string content_type;
    std::optional<std::string> content_hash;
};

struct S3ListEntry {
    std::string key;
    uintmax_t size = 0;
    std::time_t last_modified = 0;
    std::string etag;
    bool is_prefix = false; // CommonPrefixes entry
};

// Signs and sends S3 REST requests. Failures surface as storage::StorageError.
class S3Controller {
public:
    static constexpr uintmax_t MIN_PART_SIZE = 5 * 1024 * 1024; // 5 MiB
    static constexpr auto CONTENT_HASH_HEADER = "x-amz-meta-content-hash";

    S3Controller(config::S3StorageConfig config, config::RetryConfig retry);

    // #########################################################################
    // ############################# OBJECTS ###################################
    // #########################################################################

    // Returns the ETag S3 assigned.
    std::string putObject(const std::string& key, std::istream& in, uintmax_t size, const std::string& contentType,
                          const std::optional<std::string>& contentHash,
                          const concurrency::CancelToken& cancel) const;

    void getObject(const std::string& key, std::ostream& out, const concurrency::CancelToken& cancel) const;

    // nullopt when the object does not exist.
    [[nodiscard]] std::optional<S3ObjectHead> headObject(const std::string& key,
                                                         const concurrency::CancelToken& cancel) const;

    void deleteObject(const std::string& key, const concurrency::CancelToken& cancel) const;
    void copyObject(const std::string& src, const std::string& dst, const concurrency::CancelToken& cancel) const;

    [[nodiscard]] std::vector<S3ListEntry> listObjects(const std::string& prefix, const std::string& delimiter,
                                                       const concurrency::CancelToken& cancel) const;

    // #########################################################################
    // ######################## MULTIPART UPLOADS ##############################
    // #########################################################################

    [[nodiscard]] std::string initiateMultipartUpload(const std::string& key,
                                                      const concurrency::CancelToken& cancel) const;

    [[nodiscard]] std::string uploadPart(const std::string& key, const std::string& uploadId, unsigned int partNumber,
                                         std::istream& in, uintmax_t size,
                                         const concurrency::CancelToken& cancel) const;

    void completeMultipartUpload(const std::string& key, const std::string& uploadId,
                                 const std::vector<std::string>& etags,
                                 const concurrency::CancelToken& cancel) const;

    void abortMultipartUpload(const std::string& key, const std::string& uploadId,
                              const concurrency::CancelToken& cancel) const;

    // #########################################################################
    // ################################ URLS ###################################
    // #########################################################################

    [[nodiscard]] std::string presignGet(const std::string& key, std::chrono::seconds expiry,
                                         const std::optional<std::string>& downloadName = std::nullopt) const;

    [[nodiscard]] std::string objectURL(const std::string& key) const;

    [[nodiscard]] const std::string& bucket() const { return config_.bucket; }

private:
    struct Request {
        std::string operation;
        std::string method;
        std::string key;
        std::map<std::string, std::string> query;
        std::map<std::string, std::string> amzHeaders; // signed, lowercase names
        std::string contentType;
        std::optional<std::string> body;               // in-memory payload, signed by hash
        std::istream* stream = nullptr;                // streamed payload, sent unsigned
        uintmax_t streamSize = 0;
        std::ostream* sink = nullptr;                  // response body target on success
    };

    config::S3StorageConfig config_;
    config::RetryConfig retry_;
    util::S3Credentials creds_;
    std::string scheme_;
    std::string host_;       // Host header value
    std::string baseURL_;    // scheme://host

    [[nodiscard]] std::string canonicalPath(CURL* curl, const std::string& key) const;

    // One attempt, no retry.
    [[nodiscard]] util::HttpResponse perform(const Request& req, const concurrency::CancelToken& cancel) const;

    // Retries transient failures with exponential backoff while the payload can be replayed.
    [[nodiscard]] util::HttpResponse send(const Request& req, const concurrency::CancelToken& cancel) const;

    [[noreturn]] void raise(const Request& req, const util::HttpResponse& resp, storage::ErrorCode fallback,
                            const concurrency::CancelToken& cancel) const;
};

}
