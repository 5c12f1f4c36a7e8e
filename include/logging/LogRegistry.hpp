#pragma once

#include <memory>
#include <string>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace lc::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels taken from ConfigRegistry.
    // Falls back to console-only logging when logDir is not writable.
    static void init(const std::filesystem::path& logDir);

    // Console-only loggers at debug level, used by the test runner.
    static void initForTesting();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> lockcopy() { return get("lockcopy"); }
    static std::shared_ptr<spdlog::logger> queue()    { return get("queue"); }
    static std::shared_ptr<spdlog::logger> copy()     { return get("copy"); }
    static std::shared_ptr<spdlog::logger> share()    { return get("share"); }
    static std::shared_ptr<spdlog::logger> notify()   { return get("notify"); }
    static std::shared_ptr<spdlog::logger> crypto()   { return get("crypto"); }
    static std::shared_ptr<spdlog::logger> shell()    { return get("shell"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    // shared by every subsystem logger
    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_; // stdout carries command output
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;

    static void registerLogger_(const std::string& name, spdlog::level::level_enum lvl);
};

}
