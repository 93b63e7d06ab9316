#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "util/paths.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace nx::config {

std::filesystem::path Config::trashRoot() const {
    return trash.root.empty() ? paths::getTrashRoot() : trash.root;
}

std::filesystem::path Config::systemTrashRoot() const {
    return trash.system_trash_dir.empty() ? paths::getSystemTrashRoot() : trash.system_trash_dir;
}

std::filesystem::path Config::logDir() const {
    return logging.log_dir.empty() ? paths::getLogPath() : logging.log_dir;
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (!std::filesystem::exists(path)) return cfg;

    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["scan"]) YAML::convert<ScanConfig>::decode(node, cfg.scan);
    if (auto node = root["trash"]) YAML::convert<TrashConfig>::decode(node, cfg.trash);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

static std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"scan", c.scan},
        {"trash", c.trash},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    j.at("scan").get_to(c.scan);
    j.at("trash").get_to(c.trash);
    j.at("logging").get_to(c.logging);
}

void to_json(nlohmann::json& j, const ScanConfig& c) {
    j = {
        {"default_depth", c.default_depth},
        {"deep_depth", c.deep_depth},
        {"small_file_bytes", c.small_file_bytes},
        {"small_folder_bytes", c.small_folder_bytes},
        {"max_recursion_depth", c.max_recursion_depth},
        {"worker_threads", c.worker_threads},
        {"always_fold", c.always_fold}
    };
}

void from_json(const nlohmann::json& j, ScanConfig& c) {
    c.default_depth = j.value("default_depth", 2);
    c.deep_depth = j.value("deep_depth", 6);
    c.small_file_bytes = j.value("small_file_bytes", SMALL_FILE_BYTES);
    c.small_folder_bytes = j.value("small_folder_bytes", SMALL_FOLDER_BYTES);
    c.max_recursion_depth = j.value("max_recursion_depth", 256u);
    c.worker_threads = j.value("worker_threads", 0u);
    if (j.contains("always_fold")) c.always_fold = j.at("always_fold").get<std::vector<std::string>>();
}

void to_json(nlohmann::json& j, const TrashConfig& c) {
    j = {
        {"root", c.root.string()},
        {"include_system_trash", c.include_system_trash},
        {"system_trash_dir", c.system_trash_dir.string()}
    };
}

void from_json(const nlohmann::json& j, TrashConfig& c) {
    c.root = j.value("root", std::string{});
    c.include_system_trash = j.value("include_system_trash", true);
    c.system_trash_dir = j.value("system_trash_dir", std::string{});
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"nexus", levelName(c.nexus)},
        {"scan", levelName(c.scan)},
        {"trash", levelName(c.trash)},
        {"concurrency", levelName(c.concurrency)},
        {"config", levelName(c.config)}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.nexus = spdlog::level::from_str(j.value("nexus", "info"));
    c.scan = spdlog::level::from_str(j.value("scan", "warn"));
    c.trash = spdlog::level::from_str(j.value("trash", "info"));
    c.concurrency = spdlog::level::from_str(j.value("concurrency", "warn"));
    c.config = spdlog::level::from_str(j.value("config", "warn"));
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = spdlog::level::from_str(j.value("console_log_level", "warn"));
    c.file_log_level = spdlog::level::from_str(j.value("file_log_level", "info"));
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"log_levels", c.levels}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    c.log_dir = j.value("log_dir", std::string{});
    if (j.contains("log_levels")) j.at("log_levels").get_to(c.levels);
}

} // namespace nx::config
