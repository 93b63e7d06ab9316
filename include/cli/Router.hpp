#pragma once

#include "cli/types.hpp"

#include <map>
#include <ostream>
#include <string>

namespace nx::cli {

class Router {
public:
    void registerCommand(const std::string& name, CommandInfo info);

    [[nodiscard]] CommandResult execute(const CommandCall& call) const;

    [[nodiscard]] bool contains(const std::string& name) const;

    [[nodiscard]] std::string usage() const;

private:
    std::map<std::string, CommandInfo> commands_;

    static std::string normalize(const std::string& s);
};

// JSON payload to out, failure text to err.
void printResult(const CommandResult& result, bool pretty, std::ostream& out, std::ostream& err);

}
