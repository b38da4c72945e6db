#pragma once

#include "util/s3Helpers.hpp"

#include <curl/curl.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace cf::util {

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h_, CURLOPT_CONNECTTIMEOUT, 30L);
    }
    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;
    ~CurlEasy() { curl_easy_cleanup(h_); }
    operator CURL*()       { return h_; }
    operator const CURL*() const { return h_; }

private:
    CURL* h_;
};

struct HttpResponse {
    CURLcode curl  = CURLE_OK;
    long     http  = 0;
    std::string body;
    std::string hdr;
    std::string curlError;

    [[nodiscard]] bool ok() const { return curl == CURLE_OK && http / 100 == 2; }

    // Worth another attempt: connection-level failures, throttling, 5xx.
    [[nodiscard]] bool transient() const {
        switch (curl) {
            case CURLE_OK: return http == 429 || http / 100 == 5;
            case CURLE_COULDNT_CONNECT:
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_SEND_ERROR:
            case CURLE_RECV_ERROR:
            case CURLE_GOT_NOTHING:
            case CURLE_PARTIAL_FILE:
                return true;
            default:
                return false;
        }
    }
};

// Body goes to a string unless the setup callback installs its own writer.
template <class SetupFn>
HttpResponse performCurl(SetupFn&& setup) {
    CurlEasy h;                    // RAII handle
    std::string bodyBuf, hdrBuf;
    char errBuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA,  &bodyBuf);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &hdrBuf);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errBuf);

    setup(h);                      // caller-specific tweaks

    HttpResponse r;
    r.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);
    r.body.swap(bodyBuf);
    r.hdr.swap(hdrBuf);
    r.curlError = errBuf[0] ? errBuf : curl_easy_strerror(r.curl);
    return r;
}

}
