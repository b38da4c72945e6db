#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace cf::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<LocalStorageConfig> {
    static Node encode(const LocalStorageConfig& rhs) {
        Node node;
        node["root"] = rhs.root.string();
        node["min_part_size_mb"] = rhs.min_part_size / (1024 * 1024);
        return node;
    }

    static bool decode(const Node& node, LocalStorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root = node["root"].as<std::string>("/var/lib/coffer/blobs");
        if (node["min_part_size_bytes"]) rhs.min_part_size = node["min_part_size_bytes"].as<uintmax_t>();
        else rhs.min_part_size = node["min_part_size_mb"].as<uintmax_t>(5) * 1024 * 1024;
        return true;
    }
};

template<>
struct convert<S3StorageConfig> {
    static Node encode(const S3StorageConfig& rhs) {
        Node node;
        node["bucket"] = rhs.bucket;
        node["region"] = rhs.region;
        node["endpoint"] = rhs.endpoint;
        node["access_key"] = rhs.access_key;
        node["secret_key"] = rhs.secret_key;
        node["use_ssl"] = rhs.use_ssl;
        node["path_style"] = rhs.path_style;
        return node;
    }

    static bool decode(const Node& node, S3StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.bucket = node["bucket"].as<std::string>("");
        rhs.region = node["region"].as<std::string>("us-east-1");
        rhs.endpoint = node["endpoint"].as<std::string>("");
        rhs.access_key = node["access_key"].as<std::string>("");
        rhs.secret_key = node["secret_key"].as<std::string>("");
        rhs.use_ssl = node["use_ssl"].as<bool>(true);
        rhs.path_style = node["path_style"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<RetryConfig> {
    static Node encode(const RetryConfig& rhs) {
        Node node;
        node["max_attempts"] = rhs.max_attempts;
        node["base_backoff_ms"] = rhs.base_backoff.count();
        return node;
    }

    static bool decode(const Node& node, RetryConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_attempts = node["max_attempts"].as<unsigned int>(3);
        rhs.base_backoff = std::chrono::milliseconds(node["base_backoff_ms"].as<long>(200));
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["backend"] = rhs.backend;
        node["local"] = rhs.local;
        node["s3"] = rhs.s3;
        node["retry"] = rhs.retry;
        node["url_expiry_seconds"] = rhs.url_expiry.count();
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.backend = node["backend"].as<std::string>("local");
        if (node["local"]) rhs.local = node["local"].as<LocalStorageConfig>();
        if (node["s3"]) rhs.s3 = node["s3"].as<S3StorageConfig>();
        if (node["retry"]) rhs.retry = node["retry"].as<RetryConfig>();
        rhs.url_expiry = std::chrono::seconds(node["url_expiry_seconds"].as<long>(3600));
        return true;
    }
};

template<>
struct convert<MultipartConfig> {
    static Node encode(const MultipartConfig& rhs) {
        Node node;
        node["session_ttl_minutes"] = rhs.session_ttl.count();
        node["sweep_interval_minutes"] = rhs.sweep_interval.count();
        return node;
    }

    static bool decode(const Node& node, MultipartConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.session_ttl = std::chrono::minutes(node["session_ttl_minutes"].as<long>(24 * 60));
        rhs.sweep_interval = std::chrono::minutes(node["sweep_interval_minutes"].as<long>(60));
        return true;
    }
};

template<>
struct convert<QuotaConfig> {
    static Node encode(const QuotaConfig& rhs) {
        Node node;
        node["default_ceiling_bytes"] = rhs.default_ceiling_bytes;
        return node;
    }

    static bool decode(const Node& node, QuotaConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.default_ceiling_bytes = node["default_ceiling_bytes"].as<uintmax_t>(DEFAULT_QUOTA_CEILING);
        return true;
    }
};

template<>
struct convert<SharingConfig> {
    static Node encode(const SharingConfig& rhs) {
        Node node;
        node["token_length"] = rhs.token_length;
        node["max_token_attempts"] = rhs.max_token_attempts;
        return node;
    }

    static bool decode(const Node& node, SharingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.token_length = node["token_length"].as<size_t>(32);
        rhs.max_token_attempts = node["max_token_attempts"].as<unsigned int>(8);
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["password"] = rhs.password;
        node["pool_size"] = rhs.pool_size;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("coffer");
        rhs.user = node["user"].as<std::string>("coffer");
        rhs.password = node["password"].as<std::string>("");
        rhs.pool_size = node["pool_size"].as<int>(4);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["coffer"]  = to_std_string(spdlog::level::to_string_view(rhs.coffer));
        node["storage"] = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["cloud"]   = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["upload"]  = to_std_string(spdlog::level::to_string_view(rhs.upload));
        node["version"] = to_std_string(spdlog::level::to_string_view(rhs.version));
        node["quota"]   = to_std_string(spdlog::level::to_string_view(rhs.quota));
        node["share"]   = to_std_string(spdlog::level::to_string_view(rhs.share));
        node["fs"]      = to_std_string(spdlog::level::to_string_view(rhs.fs));
        node["db"]      = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["crypto"]  = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.coffer = spdlog::level::from_str(node["coffer"].as<std::string>("info"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warn"));
        rhs.cloud = spdlog::level::from_str(node["cloud"].as<std::string>("warn"));
        rhs.upload = spdlog::level::from_str(node["upload"].as<std::string>("info"));
        rhs.version = spdlog::level::from_str(node["version"].as<std::string>("info"));
        rhs.quota = spdlog::level::from_str(node["quota"].as<std::string>("warn"));
        rhs.share = spdlog::level::from_str(node["share"].as<std::string>("warn"));
        rhs.fs = spdlog::level::from_str(node["fs"].as<std::string>("warn"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("err"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_levels"] = rhs.levels;
        node["max_file_size_mb"] = rhs.max_file_size / (1024 * 1024);
        node["max_files"] = rhs.max_files;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        rhs.max_file_size = node["max_file_size_mb"].as<uintmax_t>(10) * 1024 * 1024;
        rhs.max_files = node["max_files"].as<size_t>(5);
        return true;
    }
};

}
