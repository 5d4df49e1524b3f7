#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace ais::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf);

    // Uses ConfigRegistry when it is initialized, built-in defaults otherwise.
    static void init();

    // Generic access by name; initializes with defaults on first use
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> aisobj() { return get("aisobj"); }
    static std::shared_ptr<spdlog::logger> http()   { return get("http"); }
    static std::shared_ptr<spdlog::logger> cli()    { return get("cli"); }

    [[nodiscard]] static bool isInitialized();

    // Re-apply levels after init, e.g. for --verbose
    static void setConsoleLevel(spdlog::level::level_enum lvl);

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
    static constexpr const auto* LOG_FILE_NAME = "aisobj.log";

    static inline std::mutex mutex_;
    static inline bool initialized_ = false;

    static inline std::filesystem::path main_log_path_;

    // stderr keeps stdout free for object payloads
    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;

    static void initLocked(const config::LoggingConfig& cnf);
};

}
