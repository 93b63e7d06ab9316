#pragma once

#include "cli/types.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace nx::cli {

// Flags that never take a value.
inline const std::unordered_set<std::string> BOOLEAN_FLAGS = {"help", "h", "version", "pretty"};

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

inline std::string stripLeadingDashes(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && s[i] == '-') ++i;
    return s.substr(i);
}

inline bool isFlag(const std::string& a) {
    return a.size() > 1 && a[0] == '-' && a != "--";
}

// Splits --key=value into two tokens; everything else passes through.
inline std::vector<std::string> normalizeArgs(const int argc, char** argv) {
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(argc));
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--", 0) == 0 && a.size() > 2) {
            if (const auto eq = a.find('='); eq != std::string::npos) {
                out.emplace_back(a.substr(0, eq));
                out.emplace_back(a.substr(eq + 1));
                continue;
            }
        }
        out.emplace_back(std::move(a));
    }
    return out;
}

// First bare word is the command; flags may appear anywhere and consume the
// following word unless they are boolean. "--" ends flag parsing.
inline CommandCall parseArgs(const std::vector<std::string>& args) {
    CommandCall call;
    bool stopFlags = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];

        if (!stopFlags && a == "--") { stopFlags = true; continue; }

        if (!stopFlags && isFlag(a)) {
            const auto key = stripLeadingDashes(a);
            if (!BOOLEAN_FLAGS.contains(key) && i + 1 < args.size() && !isFlag(args[i + 1])) {
                setOpt(call, key, args[i + 1]);
                ++i;
            } else {
                setOpt(call, key, std::nullopt);
            }
            continue;
        }

        if (call.name.empty()) call.name = a;
        else call.positionals.push_back(a);
    }

    return call;
}

inline CommandCall parseArgs(const int argc, char** argv) {
    return parseArgs(normalizeArgs(argc, argv));
}

}
