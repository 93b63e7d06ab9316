#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace nx::config {

constexpr static uintmax_t SMALL_FILE_BYTES = 5 * 1024 * 1024;     // 5MB, "Misc / Other" cutoff
constexpr static uintmax_t SMALL_FOLDER_BYTES = 1 * 1024 * 1024;   // 1MB, "Other Folders" cutoff

struct ScanConfig {
    int default_depth = 2;
    int deep_depth = 6;
    uintmax_t small_file_bytes = SMALL_FILE_BYTES;
    uintmax_t small_folder_bytes = SMALL_FOLDER_BYTES;
    unsigned int max_recursion_depth = 256;
    unsigned int worker_threads = 0;   // 0 = hardware_concurrency
    std::vector<std::string> always_fold = {"node_modules", ".git", ".next", "dist", "build", ".cache", "Library"};
};

struct TrashConfig {
    std::filesystem::path root{};              // empty = paths::getTrashRoot()
    bool include_system_trash = true;
    std::filesystem::path system_trash_dir{};  // empty = paths::getSystemTrashRoot()
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum nexus       = spdlog::level::info;   // Startup, shutdown, top-level command results
    spdlog::level::level_enum scan        = spdlog::level::warn;   // Skipped entries only show up at debug
    spdlog::level::level_enum trash       = spdlog::level::info;   // Every journal mutation is worth a line
    spdlog::level::level_enum concurrency = spdlog::level::warn;   // Worker faults
    spdlog::level::level_enum config      = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir{};   // empty = paths::getLogPath()
    LogLevelsConfig levels;
};

struct Config {
    ScanConfig scan;
    TrashConfig trash;
    LoggingConfig logging;

    [[nodiscard]] std::filesystem::path trashRoot() const;
    [[nodiscard]] std::filesystem::path systemTrashRoot() const;
    [[nodiscard]] std::filesystem::path logDir() const;
};

// Missing file yields defaults; a malformed one throws YAML::Exception.
Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const ScanConfig& c);
void from_json(const nlohmann::json& j, ScanConfig& c);
void to_json(nlohmann::json& j, const TrashConfig& c);
void from_json(const nlohmann::json& j, TrashConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);

} // namespace nx::config
