#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <stdexcept>

namespace lc::logging {

void LogRegistry::registerLogger_(const std::string& name, const spdlog::level::level_enum lvl) {
    std::vector<spdlog::sink_ptr> sinks{console_sink_};
    if (main_file_sink_) sinks.push_back(main_file_sink_);

    const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(lvl);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
}

void LogRegistry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = logDir;
    main_log_path_ = log_dir_ / "lockcopy.log";

    const auto& cnf = config::ConfigRegistry::get().logging;

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // main file sink (rotating)
    std::string fileSinkError;
    try {
        std::filesystem::create_directories(log_dir_);
        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
    } catch (const std::filesystem::filesystem_error& e) {
        fileSinkError = e.what();
    } catch (const spdlog::spdlog_ex& e) {
        fileSinkError = e.what();
    }

    const auto& sub_levels = cnf.levels.subsystem_levels;
    registerLogger_("lockcopy", sub_levels.lockcopy);
    registerLogger_("queue",    sub_levels.queue);
    registerLogger_("copy",     sub_levels.copy);
    registerLogger_("share",    sub_levels.share);
    registerLogger_("notify",   sub_levels.notify);
    registerLogger_("crypto",   sub_levels.crypto);
    registerLogger_("shell",    sub_levels.shell);

    initialized_ = true;

    if (!main_file_sink_) {
        LogRegistry::lockcopy()->warn("[LogRegistry] Logging to console only; cannot write {}: {}",
                                      main_log_path_.string(), fileSinkError);
        return;
    }
    LogRegistry::lockcopy()->debug("[LogRegistry] Initialized, writing to {}", main_log_path_.string());
}

void LogRegistry::initForTesting() {
    if (initialized_) return;

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(spdlog::level::warn);
    console_sink_->set_pattern(LOG_FORMAT);

    for (const auto* name : {"lockcopy", "queue", "copy", "share", "notify", "crypto", "shell"})
        registerLogger_(name, spdlog::level::debug);

    initialized_ = true;
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

}
