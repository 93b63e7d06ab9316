#include "cli/Router.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>

using namespace nx::cli;
using namespace nx::log;

void Router::registerCommand(const std::string& name, CommandInfo info) {
    const auto key = normalize(name);
    if (commands_.contains(key)) {
        Registry::nexus()->warn("[Router] Command '{}' registered twice, keeping the first", key);
        return;
    }
    commands_.emplace(key, std::move(info));
}

bool Router::contains(const std::string& name) const {
    return commands_.contains(normalize(name));
}

CommandResult Router::execute(const CommandCall& call) const {
    if (call.name.empty()) return invalid(usage());

    const auto key = normalize(call.name);
    const auto it = commands_.find(key);
    if (it == commands_.end()) return invalid(fmt::format("Unknown command: {}\n\n{}", call.name, usage()));

    const auto& info = it->second;
    if (call.positionals.size() < info.min_positionals)
        return invalid(fmt::format("Usage: nexus {}", info.synopsis));

    Registry::nexus()->debug("[Router] Executing '{}' with {} argument(s)", key, call.positionals.size());
    return info.handler(call);
}

std::string Router::usage() const {
    std::string out = "Usage: nexus [--config <file>] <command> [args]\n\nCommands:\n";
    size_t width = 0;
    for (const auto& [_, info] : commands_) width = std::max(width, info.synopsis.size());
    for (const auto& [_, info] : commands_)
        out += fmt::format("  {:<{}}  {}\n", info.synopsis, width, info.description);
    return out;
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

void nx::cli::printResult(const CommandResult& result, const bool pretty, std::ostream& out, std::ostream& err) {
    if (result.has_data) out << (pretty ? result.data.dump(2) : result.data.dump()) << std::endl;
    if (!result.stderr_text.empty()) err << result.stderr_text << (result.stderr_text.ends_with('\n') ? "" : "\n");
}
