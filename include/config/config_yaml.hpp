#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace nx::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<ScanConfig> {
    static Node encode(const ScanConfig& rhs) {
        Node node;
        node["default_depth"] = rhs.default_depth;
        node["deep_depth"] = rhs.deep_depth;
        node["small_file_mb"] = rhs.small_file_bytes / (1024 * 1024);
        node["small_folder_mb"] = rhs.small_folder_bytes / (1024 * 1024);
        node["max_recursion_depth"] = rhs.max_recursion_depth;
        node["worker_threads"] = rhs.worker_threads;
        node["always_fold"] = rhs.always_fold;
        return node;
    }

    static bool decode(const Node& node, ScanConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.default_depth = node["default_depth"].as<int>(2);
        rhs.deep_depth = node["deep_depth"].as<int>(6);
        rhs.small_file_bytes = node["small_file_mb"].as<uintmax_t>(5) * 1024 * 1024;       // Default 5MB
        rhs.small_folder_bytes = node["small_folder_mb"].as<uintmax_t>(1) * 1024 * 1024;   // Default 1MB
        rhs.max_recursion_depth = node["max_recursion_depth"].as<unsigned int>(256);
        rhs.worker_threads = node["worker_threads"].as<unsigned int>(0);
        if (node["always_fold"]) rhs.always_fold = node["always_fold"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<TrashConfig> {
    static Node encode(const TrashConfig& rhs) {
        Node node;
        node["root"] = rhs.root.string();
        node["include_system_trash"] = rhs.include_system_trash;
        node["system_trash_dir"] = rhs.system_trash_dir.string();
        return node;
    }

    static bool decode(const Node& node, TrashConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root = node["root"].as<std::string>("");
        rhs.include_system_trash = node["include_system_trash"].as<bool>(true);
        rhs.system_trash_dir = node["system_trash_dir"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["nexus"]       = to_std_string(spdlog::level::to_string_view(rhs.nexus));
        node["scan"]        = to_std_string(spdlog::level::to_string_view(rhs.scan));
        node["trash"]       = to_std_string(spdlog::level::to_string_view(rhs.trash));
        node["concurrency"] = to_std_string(spdlog::level::to_string_view(rhs.concurrency));
        node["config"]      = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.nexus = spdlog::level::from_str(node["nexus"].as<std::string>("info"));
        rhs.scan = spdlog::level::from_str(node["scan"].as<std::string>("warn"));
        rhs.trash = spdlog::level::from_str(node["trash"].as<std::string>("info"));
        rhs.concurrency = spdlog::level::from_str(node["concurrency"].as<std::string>("warn"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("warn"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (const auto sub = node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (const auto levels = node["log_levels"]) convert<LogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

} // namespace YAML
