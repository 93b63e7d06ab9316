#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>

namespace nx::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels. Reads ConfigRegistry.
    static void init();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> nexus()       { return get("nexus"); }
    static std::shared_ptr<spdlog::logger> scan()        { return get("scan"); }
    static std::shared_ptr<spdlog::logger> trash()       { return get("trash"); }
    static std::shared_ptr<spdlog::logger> concurrency() { return get("concurrency"); }
    static std::shared_ptr<spdlog::logger> config()      { return get("config"); }
    static std::shared_ptr<spdlog::logger> audit()       { return get("audit"); }

    [[nodiscard]] static bool isInitialized();

    // Drops every registered logger; the next init() starts from scratch.
    static void shutdown();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;
    static inline std::filesystem::path audit_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;
    static inline std::shared_ptr<spdlog::sinks::basic_file_sink_mt>    audit_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
