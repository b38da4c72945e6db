#pragma once

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <string>

namespace cf::util {

inline std::time_t parsePostgresTimestamp(const std::string& timestampStr) {
    std::tm tm = {};
    std::istringstream ss(timestampStr.substr(0, 19)); // truncate to "YYYY-MM-DD HH:MM:SS"
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + timestampStr);
    return timegm(&tm); // returns UTC-based time_t
}

inline std::string timestampToString(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

// "2009-10-12T17:50:30.000Z" as returned by S3 listings
inline std::time_t parseIso8601(const std::string& iso) {
    std::tm tm = {};
    std::istringstream ss(iso.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) return 0;
    return timegm(&tm);
}

// RFC 1123, e.g. "Wed, 12 Oct 2009 17:50:00 GMT" from Last-Modified headers
inline std::time_t parseHttpDate(const std::string& date) {
    std::tm tm = {};
    std::istringstream ss(date);
    ss.imbue(std::locale::classic());
    ss >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
    if (ss.fail()) return 0;
    return timegm(&tm);
}

inline std::time_t fileTimeToTimeT(const std::filesystem::file_time_type ft) {
    const auto sys = std::chrono::file_clock::to_sys(ft);
    return std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::system_clock::duration>(sys));
}

// Both SigV4 stamps must come from the same instant.
struct AmzStamps {
    std::string amzDate;   // YYYYMMDD'T'HHMMSS'Z'
    std::string dateStamp; // YYYYMMDD
};

inline AmzStamps getAmzStamps() {
    const std::time_t now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now_c, &tm);
    char full[17];
    char date[9];
    strftime(full, sizeof(full), "%Y%m%dT%H%M%SZ", &tm);
    strftime(date, sizeof(date), "%Y%m%d", &tm);
    return {full, date};
}

} // namespace cf::util
