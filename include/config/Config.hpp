#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace cf::config {

constexpr static uintmax_t DEFAULT_MIN_PART_SIZE = 5 * 1024 * 1024;                              // 5 MiB
constexpr static uintmax_t DEFAULT_QUOTA_CEILING = static_cast<uintmax_t>(10) * 1024 * 1024 * 1024; // 10 GiB

enum class BackendType { Local, S3, MinIO };

struct LocalStorageConfig {
    std::filesystem::path root = "/var/lib/coffer/blobs";
    uintmax_t min_part_size = DEFAULT_MIN_PART_SIZE;
};

struct S3StorageConfig {
    std::string bucket;
    std::string region = "us-east-1";
    std::string endpoint;   // empty: https://s3.<region>.amazonaws.com
    std::string access_key;
    std::string secret_key;
    bool use_ssl = true;
    bool path_style = false;
};

struct RetryConfig {
    unsigned int max_attempts = 3;
    std::chrono::milliseconds base_backoff{200};
};

struct StorageConfig {
    std::string backend = "local"; // local | s3 | minio
    LocalStorageConfig local;
    S3StorageConfig s3;
    RetryConfig retry;
    std::chrono::seconds url_expiry{3600};
};

struct MultipartConfig {
    std::chrono::minutes session_ttl{24 * 60};
    std::chrono::minutes sweep_interval{60};
};

struct QuotaConfig {
    uintmax_t default_ceiling_bytes = DEFAULT_QUOTA_CEILING;
};

struct SharingConfig {
    size_t token_length = 32;
    unsigned int max_token_attempts = 8;
};

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "coffer";
    std::string user = "coffer";
    std::string password;
    int pool_size = 4;

    [[nodiscard]] std::string connectionString() const;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum coffer   = spdlog::level::info;  // Startup/shutdown, service lifecycle
    spdlog::level::level_enum storage  = spdlog::level::warn;  // Local disk I/O failures
    spdlog::level::level_enum cloud    = spdlog::level::warn;  // S3 request failures and retries
    spdlog::level::level_enum upload   = spdlog::level::info;  // Multipart session transitions, sweeps
    spdlog::level::level_enum version  = spdlog::level::info;  // Version assignment, rollback, corruption
    spdlog::level::level_enum quota    = spdlog::level::warn;  // Rejected reservations
    spdlog::level::level_enum share    = spdlog::level::warn;  // Rejected validations
    spdlog::level::level_enum fs       = spdlog::level::warn;  // Rejected tree mutations
    spdlog::level::level_enum db       = spdlog::level::err;   // Failed transactions
    spdlog::level::level_enum crypto   = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
    uintmax_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 5;
};

struct Config {
    StorageConfig storage;
    MultipartConfig multipart;
    QuotaConfig quota;
    SharingConfig sharing;
    DatabaseConfig database;
    LoggingConfig logging;
};

[[nodiscard]] BackendType parseBackendType(const std::string& name);
[[nodiscard]] std::string to_string(BackendType type);

Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const StorageConfig& c);
void from_json(const nlohmann::json& j, StorageConfig& c);
void to_json(nlohmann::json& j, const MultipartConfig& c);
void from_json(const nlohmann::json& j, MultipartConfig& c);
void to_json(nlohmann::json& j, const QuotaConfig& c);
void from_json(const nlohmann::json& j, QuotaConfig& c);
void to_json(nlohmann::json& j, const SharingConfig& c);
void from_json(const nlohmann::json& j, SharingConfig& c);
void to_json(nlohmann::json& j, const DatabaseConfig& c);
void from_json(const nlohmann::json& j, DatabaseConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);

} // namespace cf::config
