#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace nx::cli {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;

    [[nodiscard]] bool hasOpt(const std::string& key) const {
        for (const auto& [k, v] : options) if (k == key) return true;
        return false;
    }

    [[nodiscard]] std::optional<std::string> opt(const std::string& key) const {
        for (const auto& [k, v] : options) if (k == key) return v;
        return std::nullopt;
    }
};

enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_OP_FAILED = 1,
    EXIT_USAGE = 2
};

struct CommandResult {
    int exit_code = EXIT_OK;
    std::string stderr_text;     // human-readable failure, if any
    nlohmann::json data;         // printed to stdout when has_data
    bool has_data = false;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandInfo {
    std::string synopsis;        // e.g. "scan <path> [--depth N]"
    std::string description;
    size_t min_positionals = 0;
    CommandHandler handler;
};

inline CommandResult ok(nlohmann::json data) {
    return {EXIT_OK, {}, std::move(data), true};
}

inline CommandResult failed(std::string why, nlohmann::json data = nullptr) {
    const bool hasData = !data.is_null();
    return {EXIT_OP_FAILED, std::move(why), std::move(data), hasData};
}

inline CommandResult invalid(std::string why) {
    return {EXIT_USAGE, std::move(why), nullptr, false};
}

}
