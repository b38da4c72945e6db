#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "storage/StorageError.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>

namespace cf::config {

static constexpr auto REDACTED = "********";

static Config decodeRoot(const YAML::Node& root) {
    Config cfg;

    if (auto node = root["storage"]) YAML::convert<StorageConfig>::decode(node, cfg.storage);
    if (auto node = root["multipart"]) YAML::convert<MultipartConfig>::decode(node, cfg.multipart);
    if (auto node = root["quota"]) YAML::convert<QuotaConfig>::decode(node, cfg.quota);
    if (auto node = root["sharing"]) YAML::convert<SharingConfig>::decode(node, cfg.sharing);
    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path))
        throw std::runtime_error("[Config] Config file not found: " + path.string());
    return decodeRoot(YAML::LoadFile(path.string()));
}

Config loadConfigFromString(const std::string& yaml) { return decodeRoot(YAML::Load(yaml)); }

BackendType parseBackendType(const std::string& name) {
    std::string lowered = name;
    std::ranges::transform(lowered, lowered.begin(), [](const unsigned char c) { return std::tolower(c); });

    if (lowered == "local") return BackendType::Local;
    if (lowered == "s3") return BackendType::S3;
    if (lowered == "minio") return BackendType::MinIO;

    throw storage::StorageError(storage::ErrorCode::UnsupportedBackend, "unsupported storage backend: " + name);
}

std::string to_string(const BackendType type) {
    switch (type) {
        case BackendType::Local: return "local";
        case BackendType::S3: return "s3";
        case BackendType::MinIO: return "minio";
    }
    return "unknown";
}

std::string DatabaseConfig::connectionString() const {
    std::string conn = "host=" + host + " port=" + std::to_string(port) + " dbname=" + name + " user=" + user;
    if (!password.empty()) conn += " password=" + password;
    return conn;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"storage", c.storage},
        {"multipart", c.multipart},
        {"quota", c.quota},
        {"sharing", c.sharing},
        {"database", c.database},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("storage")) j.at("storage").get_to(c.storage);
    if (j.contains("multipart")) j.at("multipart").get_to(c.multipart);
    if (j.contains("quota")) j.at("quota").get_to(c.quota);
    if (j.contains("sharing")) j.at("sharing").get_to(c.sharing);
    if (j.contains("database")) j.at("database").get_to(c.database);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = {
        {"backend", c.backend},
        {"local", {
            {"root", c.local.root.string()},
            {"min_part_size_bytes", c.local.min_part_size}
        }},
        {"s3", {
            {"bucket", c.s3.bucket},
            {"region", c.s3.region},
            {"endpoint", c.s3.endpoint},
            {"access_key", c.s3.access_key},
            {"secret_key", c.s3.secret_key.empty() ? "" : REDACTED},
            {"use_ssl", c.s3.use_ssl},
            {"path_style", c.s3.path_style}
        }},
        {"retry", {
            {"max_attempts", c.retry.max_attempts},
            {"base_backoff_ms", c.retry.base_backoff.count()}
        }},
        {"url_expiry_seconds", c.url_expiry.count()}
    };
}

void from_json(const nlohmann::json& j, StorageConfig& c) {
    c.backend = j.value("backend", "local");
    if (j.contains("local")) {
        const auto& l = j.at("local");
        c.local.root = l.value("root", c.local.root.string());
        c.local.min_part_size = l.value("min_part_size_bytes", DEFAULT_MIN_PART_SIZE);
    }
    if (j.contains("s3")) {
        const auto& s = j.at("s3");
        c.s3.bucket = s.value("bucket", "");
        c.s3.region = s.value("region", "us-east-1");
        c.s3.endpoint = s.value("endpoint", "");
        c.s3.access_key = s.value("access_key", "");
        c.s3.secret_key = s.value("secret_key", "");
        c.s3.use_ssl = s.value("use_ssl", true);
        c.s3.path_style = s.value("path_style", false);
    }
    if (j.contains("retry")) {
        const auto& r = j.at("retry");
        c.retry.max_attempts = r.value("max_attempts", 3u);
        c.retry.base_backoff = std::chrono::milliseconds(r.value("base_backoff_ms", 200L));
    }
    c.url_expiry = std::chrono::seconds(j.value("url_expiry_seconds", 3600L));
}

void to_json(nlohmann::json& j, const MultipartConfig& c) {
    j = {
        {"session_ttl_minutes", c.session_ttl.count()},
        {"sweep_interval_minutes", c.sweep_interval.count()}
    };
}

void from_json(const nlohmann::json& j, MultipartConfig& c) {
    c.session_ttl = std::chrono::minutes(j.value("session_ttl_minutes", 24L * 60));
    c.sweep_interval = std::chrono::minutes(j.value("sweep_interval_minutes", 60L));
}

void to_json(nlohmann::json& j, const QuotaConfig& c) {
    j = {{"default_ceiling_bytes", c.default_ceiling_bytes}};
}

void from_json(const nlohmann::json& j, QuotaConfig& c) {
    c.default_ceiling_bytes = j.value("default_ceiling_bytes", DEFAULT_QUOTA_CEILING);
}

void to_json(nlohmann::json& j, const SharingConfig& c) {
    j = {
        {"token_length", c.token_length},
        {"max_token_attempts", c.max_token_attempts}
    };
}

void from_json(const nlohmann::json& j, SharingConfig& c) {
    c.token_length = j.value("token_length", static_cast<size_t>(32));
    c.max_token_attempts = j.value("max_token_attempts", 8u);
}

void to_json(nlohmann::json& j, const DatabaseConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port},
        {"name", c.name},
        {"user", c.user},
        {"password", c.password.empty() ? "" : REDACTED},
        {"pool_size", c.pool_size}
    };
}

void from_json(const nlohmann::json& j, DatabaseConfig& c) {
    c.host = j.value("host", "localhost");
    c.port = j.value("port", static_cast<uint16_t>(5432));
    c.name = j.value("name", "coffer");
    c.user = j.value("user", "coffer");
    c.password = j.value("password", "");
    c.pool_size = j.value("pool_size", 4);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    const auto& lv = c.levels;
    const auto& sub = lv.subsystem_levels;
    const auto str = [](const spdlog::level::level_enum l) {
        const auto sv = spdlog::level::to_string_view(l);
        return std::string(sv.data(), sv.size());
    };

    j = {
        {"console_log_level", str(lv.console_log_level)},
        {"file_log_level", str(lv.file_log_level)},
        {"subsystem_levels", {
            {"coffer", str(sub.coffer)},
            {"storage", str(sub.storage)},
            {"cloud", str(sub.cloud)},
            {"upload", str(sub.upload)},
            {"version", str(sub.version)},
            {"quota", str(sub.quota)},
            {"share", str(sub.share)},
            {"fs", str(sub.fs)},
            {"db", str(sub.db)},
            {"crypto", str(sub.crypto)}
        }},
        {"max_file_size", c.max_file_size},
        {"max_files", c.max_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    auto& lv = c.levels;
    const auto level = [&](const nlohmann::json& node, const char* key, const spdlog::level::level_enum def) {
        return node.contains(key) ? spdlog::level::from_str(node.at(key).get<std::string>()) : def;
    };

    lv.console_log_level = level(j, "console_log_level", spdlog::level::info);
    lv.file_log_level = level(j, "file_log_level", spdlog::level::warn);

    if (j.contains("subsystem_levels")) {
        const auto& s = j.at("subsystem_levels");
        auto& sub = lv.subsystem_levels;
        sub.coffer = level(s, "coffer", sub.coffer);
        sub.storage = level(s, "storage", sub.storage);
        sub.cloud = level(s, "cloud", sub.cloud);
        sub.upload = level(s, "upload", sub.upload);
        sub.version = level(s, "version", sub.version);
        sub.quota = level(s, "quota", sub.quota);
        sub.share = level(s, "share", sub.share);
        sub.fs = level(s, "fs", sub.fs);
        sub.db = level(s, "db", sub.db);
        sub.crypto = level(s, "crypto", sub.crypto);
    }

    c.max_file_size = j.value("max_file_size", static_cast<uintmax_t>(10 * 1024 * 1024));
    c.max_files = j.value("max_files", static_cast<size_t>(5));
}

} // namespace cf::config
