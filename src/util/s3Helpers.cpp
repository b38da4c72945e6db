#include "util/s3Helpers.hpp"

#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <iomanip>
#include <mutex>
#include <stdexcept>

namespace cf::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

static std::string toHex(const unsigned char* data, const size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    return oss.str();
}

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

std::string hmacSha256Raw(const std::string& key, const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, nullptr);
    return {reinterpret_cast<char*>(digest), SHA256_DIGEST_LENGTH};
}

std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data) {
    unsigned char sig[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), rawKey.data(), static_cast<int>(rawKey.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), sig, nullptr);
    return toHex(sig, SHA256_DIGEST_LENGTH);
}

std::string escapeComponent(CURL* curl, const std::string& value) {
    char* esc = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.length()));
    if (!esc) throw std::runtime_error("[s3Helpers] escape failed");
    std::string out(esc);
    curl_free(esc);
    return out;
}

std::string escapeKeyPreserveSlashes(CURL* curl, const std::string& key) {
    std::ostringstream out;
    size_t start = 0;
    while (true) {
        const auto slash = key.find('/', start);
        out << escapeComponent(curl, key.substr(start, slash == std::string::npos ? std::string::npos : slash - start));
        if (slash == std::string::npos) break;
        out << '/';
        start = slash + 1;
    }
    return out.str();
}

std::string canonicalQueryString(CURL* curl, const std::map<std::string, std::string>& params) {
    // Encoding preserves the byte order of the keys, so std::map order is canonical.
    std::string query;
    for (const auto& [k, v] : params) {
        if (!query.empty()) query += '&';
        query += escapeComponent(curl, k) + "=" + escapeComponent(curl, v);
    }
    return query;
}

std::string composeMultiPartUploadXMLBody(const std::vector<std::string>& etags) {
    std::ostringstream xml;

    xml << "<CompleteMultipartUpload>";

    for (size_t i = 0; i < etags.size(); ++i)
        xml << "<Part><PartNumber>" << (i + 1) << "</PartNumber><ETag>\"" << stripQuotes(etags[i])
            << "\"</ETag></Part>";

    xml << "</CompleteMultipartUpload>";

    return xml.str();
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::optional<std::string> extractHeader(const std::string& respHdr, const std::string& name) {
    std::string lowerHdr = respHdr;
    std::string lowerName = name + ":";
    const auto lower = [](const unsigned char c) { return static_cast<char>(std::tolower(c)); };
    std::ranges::transform(lowerHdr, lowerHdr.begin(), lower);
    std::ranges::transform(lowerName, lowerName.begin(), lower);

    // Redirects and 100-continue produce several header blocks; the last one wins.
    size_t pos = std::string::npos;
    for (size_t at = lowerHdr.find(lowerName); at != std::string::npos; at = lowerHdr.find(lowerName, at + 1))
        if (at == 0 || lowerHdr[at - 1] == '\n') pos = at;
    if (pos == std::string::npos) return std::nullopt;

    pos += lowerName.size();
    const auto end = respHdr.find_first_of("\r\n", pos);
    std::string value = respHdr.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    trimInPlace(value);
    return value;
}

bool extractETag(const std::string& respHdr, std::string& etagOut) {
    const auto value = extractHeader(respHdr, "ETag");
    if (!value) return false;
    etagOut = *value;
    return !etagOut.empty();
}

std::string stripQuotes(const std::string& etag) {
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') return etag.substr(1, etag.size() - 2);
    return etag;
}

static std::string signingKey(const S3Credentials& creds, const std::string& dateStamp) {
    const std::string kDate    = hmacSha256Raw("AWS4" + creds.secret_key, dateStamp);
    const std::string kRegion  = hmacSha256Raw(kDate, creds.region);
    const std::string kService = hmacSha256Raw(kRegion, "s3");
    return hmacSha256Raw(kService, "aws4_request");
}

static std::string credentialScope(const S3Credentials& creds, const AmzStamps& stamps) {
    return stamps.dateStamp + "/" + creds.region + "/s3/aws4_request";
}

static std::string stringToSign(const S3Credentials& creds, const AmzStamps& stamps,
                                const std::string& canonicalRequest) {
    std::ostringstream sts;
    sts << "AWS4-HMAC-SHA256" << "\n"
        << stamps.amzDate << "\n"
        << credentialScope(creds, stamps) << "\n"
        << sha256Hex(canonicalRequest);
    return sts.str();
}

std::string buildAuthorizationHeader(const S3Credentials& creds, const AmzStamps& stamps,
                                     const std::string& method,
                                     const std::string& canonicalPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash,
                                     const std::string& canonicalQuery) {
    // Build canonical headers and signed headers
    std::string canonicalHeaders, signedHeaders;
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        canonicalHeaders += it->first + ":" + it->second + "\n";
        signedHeaders += it->first;
        if (std::next(it) != headers.end())
            signedHeaders += ";";
    }

    std::ostringstream canonicalRequest;
    canonicalRequest << method << "\n"
                     << canonicalPath << "\n"
                     << canonicalQuery << "\n"
                     << canonicalHeaders << "\n"
                     << signedHeaders << "\n"
                     << payloadHash;

    const auto signature = hmacSha256HexFromRaw(signingKey(creds, stamps.dateStamp),
                                                stringToSign(creds, stamps, canonicalRequest.str()));

    std::ostringstream authHeader;
    authHeader << "AWS4-HMAC-SHA256 "
               << "Credential=" << creds.access_key << "/" << credentialScope(creds, stamps) << ", "
               << "SignedHeaders=" << signedHeaders << ", "
               << "Signature=" << signature;

    return authHeader.str();
}

std::string buildPresignedQuery(CURL* curl, const S3Credentials& creds, const AmzStamps& stamps,
                                const std::string& canonicalPath, const std::string& host,
                                std::map<std::string, std::string> params, const long expiresSeconds) {
    params["X-Amz-Algorithm"] = "AWS4-HMAC-SHA256";
    params["X-Amz-Credential"] = creds.access_key + "/" + credentialScope(creds, stamps);
    params["X-Amz-Date"] = stamps.amzDate;
    params["X-Amz-Expires"] = std::to_string(expiresSeconds);
    params["X-Amz-SignedHeaders"] = "host";

    const auto query = canonicalQueryString(curl, params);

    std::ostringstream canonicalRequest;
    canonicalRequest << "GET" << "\n"
                     << canonicalPath << "\n"
                     << query << "\n"
                     << "host:" << host << "\n" << "\n"
                     << "host" << "\n"
                     << "UNSIGNED-PAYLOAD";

    const auto signature = hmacSha256HexFromRaw(signingKey(creds, stamps.dateStamp),
                                                stringToSign(creds, stamps, canonicalRequest.str()));

    return query + "&X-Amz-Signature=" + signature;
}

void trimInPlace(std::string& s) {
    s.erase(s.begin(), std::ranges::find_if(s, [](const unsigned char ch) { return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](const unsigned char ch) { return !std::isspace(ch); }).base(),
            s.end());
}

}
