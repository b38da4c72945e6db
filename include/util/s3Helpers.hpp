#pragma once

#include "util/timestamp.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <curl/curl.h>

namespace cf::util {

struct S3Credentials {
    std::string access_key;
    std::string secret_key;
    std::string region;
};

std::string sha256Hex(const std::string& data);
std::string hmacSha256Raw(const std::string& key, const std::string& data);
std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data);

// Percent-encodes every key segment but keeps the '/' separators.
std::string escapeKeyPreserveSlashes(CURL* curl, const std::string& key);
std::string escapeComponent(CURL* curl, const std::string& value);

// Sorted, encoded "k=v&k2=v2"; keys without a value render as "k=".
std::string canonicalQueryString(CURL* curl, const std::map<std::string, std::string>& params);

std::string composeMultiPartUploadXMLBody(const std::vector<std::string>& etags);
size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);
[[nodiscard]] bool extractETag(const std::string& respHdr, std::string& etagOut);
[[nodiscard]] std::optional<std::string> extractHeader(const std::string& respHdr, const std::string& name);
std::string stripQuotes(const std::string& etag);

std::string buildAuthorizationHeader(const S3Credentials& creds, const AmzStamps& stamps,
                                     const std::string& method, const std::string& canonicalPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash, const std::string& canonicalQuery = "");

// Query-string SigV4 for a GET on `canonicalPath`; returns the complete signed query.
std::string buildPresignedQuery(CURL* curl, const S3Credentials& creds, const AmzStamps& stamps,
                                const std::string& canonicalPath, const std::string& host,
                                std::map<std::string, std::string> params, long expiresSeconds);

void trimInPlace(std::string& s);

void ensureCurlGlobalInit();

/** Build a curl_slist from stable heap-stored strings */
struct HeaderList {
    std::vector<std::string> store; // owns the memory
    curl_slist* list = nullptr;     // raw list pointer

    HeaderList() = default;
    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;
    ~HeaderList() { if (list) curl_slist_free_all(list); }

    void add(const std::string& h) {
        store.push_back(h);
        list = curl_slist_append(list, store.back().c_str());
    }
};

}
