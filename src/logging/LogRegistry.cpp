#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <vector>

namespace ais::logging {

void LogRegistry::init(const config::LoggingConfig& cnf) {
    std::lock_guard lock(mutex_);
    initLocked(cnf);
}

void LogRegistry::init() {
    if (config::ConfigRegistry::isInitialized()) init(config::ConfigRegistry::get().logging);
    else init(config::LoggingConfig{});
}

void LogRegistry::initLocked(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);
    sinks.push_back(console_sink_);

    if (!cnf.log_dir.empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(cnf.log_dir)) fs::create_directories(cnf.log_dir);
        main_log_path_ = cnf.log_dir / LOG_FILE_NAME;

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        if (spdlog::get(name)) spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("aisobj", sub_levels.aisobj);
    makeLogger("http",   sub_levels.http);
    makeLogger("cli",    sub_levels.cli);

    initialized_ = true;
    spdlog::get("aisobj")->debug("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    if (!isInitialized()) init();

    auto logger = spdlog::get(name);
    if (!logger) throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    return logger;
}

bool LogRegistry::isInitialized() {
    std::lock_guard lock(mutex_);
    return initialized_;
}

void LogRegistry::setConsoleLevel(const spdlog::level::level_enum lvl) {
    if (!isInitialized()) init();

    std::lock_guard lock(mutex_);
    console_sink_->set_level(lvl);
    spdlog::apply_all([lvl](const std::shared_ptr<spdlog::logger>& lg) {
        if (lg->level() > lvl) lg->set_level(lvl);
    });
}

}
