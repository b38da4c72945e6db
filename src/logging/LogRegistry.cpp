#include "logging/LogRegistry.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>

namespace cf::logging {

void LogRegistry::init(const std::filesystem::path& logDir, const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = logDir;

    namespace fs = std::filesystem;
    if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

    const auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(cnf.levels.console_log_level);
    console_sink->set_color_mode(spdlog::color_mode::automatic);
    console_sink->set_pattern(LOG_FORMAT);

    const auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (log_dir_ / "coffer.log").string(), cnf.max_file_size, cnf.max_files);
    file_sink->set_level(cnf.levels.file_log_level);
    file_sink->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name,
                          const spdlog::level::level_enum lvl = spdlog::level::debug) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink, file_sink});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("coffer",  sub_levels.coffer);
    makeLogger("storage", sub_levels.storage);
    makeLogger("cloud",   sub_levels.cloud);
    makeLogger("upload",  sub_levels.upload);
    makeLogger("version", sub_levels.version);
    makeLogger("quota",   sub_levels.quota);
    makeLogger("share",   sub_levels.share);
    makeLogger("fs",      sub_levels.fs);
    makeLogger("db",      sub_levels.db);
    makeLogger("crypto",  sub_levels.crypto);

    initialized_ = true;
    coffer()->debug("[LogRegistry] Initialized, writing to {}", log_dir_.string());
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

void LogRegistry::shutdown() {
    if (!initialized_) return;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    spdlog::drop_all();
    initialized_ = false;
}

}
