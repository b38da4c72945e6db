#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace cf::logging {

class LogRegistry {
public:
    static constexpr auto LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    // Initialize all loggers with sinks/levels.
    static void init(const std::filesystem::path& logDir, const config::LoggingConfig& cnf);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> coffer()  { return get("coffer"); }
    static std::shared_ptr<spdlog::logger> storage() { return get("storage"); }
    static std::shared_ptr<spdlog::logger> cloud()   { return get("cloud"); }
    static std::shared_ptr<spdlog::logger> upload()  { return get("upload"); }
    static std::shared_ptr<spdlog::logger> version() { return get("version"); }
    static std::shared_ptr<spdlog::logger> quota()   { return get("quota"); }
    static std::shared_ptr<spdlog::logger> share()   { return get("share"); }
    static std::shared_ptr<spdlog::logger> fs()      { return get("fs"); }
    static std::shared_ptr<spdlog::logger> db()      { return get("db"); }
    static std::shared_ptr<spdlog::logger> crypto()  { return get("crypto"); }

    [[nodiscard]] static bool isInitialized();

    static void shutdown();

private:
    static inline bool initialized_ = false;
    static inline std::filesystem::path log_dir_;
};

} // namespace cf::logging
