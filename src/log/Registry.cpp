#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace nx::log {

void Registry::init() {
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }

    const auto& cnf = config::ConfigRegistry::get();

    log_dir_ = cnf.logDir();
    main_log_path_  = log_dir_ / "nexus.log";
    audit_log_path_ = log_dir_ / "audit.log";

    namespace fs = std::filesystem;
    if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

    const auto& levels = cnf.logging.levels;

    // console goes to stderr, stdout carries command output only
    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // main file sink (rotating)
    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = levels.subsystem_levels;
    makeLogger("nexus",       sub_levels.nexus);
    makeLogger("scan",        sub_levels.scan);
    makeLogger("trash",       sub_levels.trash);
    makeLogger("concurrency", sub_levels.concurrency);
    makeLogger("config",      sub_levels.config);

    // audit: file-only sink (append), one line per trash journal mutation
    {
        audit_file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            audit_log_path_.string(), /*truncate=*/false);
        std::vector<spdlog::sink_ptr> sinks = { audit_file_sink_ };
        const auto logger = std::make_shared<spdlog::logger>("audit", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    nexus()->debug("[Registry] Initialized, logging to {}", log_dir_.string());
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::shutdown() {
    if (!initialized_) return;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    spdlog::drop_all();
    console_sink_.reset();
    main_file_sink_.reset();
    audit_file_sink_.reset();
    initialized_ = false;
}

}
