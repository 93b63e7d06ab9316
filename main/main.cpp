#include "cli/Parser.hpp"
#include "cli/Router.hpp"
#include "cli/commands.hpp"
#include "config/ConfigRegistry.hpp"
#include "runtime/Core.hpp"
#include "log/Registry.hpp"
#include "util/paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>

using namespace nx::cli;
using namespace nx::config;

int main(int argc, char** argv) {
    const auto call = parseArgs(argc, argv);

    try {
        if (call.hasOpt("config") && !call.opt("config")) {
            std::cerr << "--config expects a file path" << std::endl;
            return EXIT_USAGE;
        }

        const std::filesystem::path configPath = call.opt("config").value_or(nx::paths::getConfigPath().string());
        ConfigRegistry::init(configPath);
        nx::log::Registry::init();

        if (std::filesystem::exists(configPath))
            nx::log::Registry::config()->info("[ConfigRegistry] Loaded {}", configPath.string());
        else
            nx::log::Registry::config()->debug("[ConfigRegistry] {} not found, using defaults", configPath.string());
        nx::log::Registry::nexus()->debug("[*] nexus starting: '{}'", call.name);

        const nx::runtime::Core core(ConfigRegistry::get());

        Router router;
        registerCommands(router, core);

        if (call.name.empty() || call.hasOpt("help") || call.hasOpt("h")) {
            std::cout << router.usage();
            return call.name.empty() && !call.hasOpt("help") && !call.hasOpt("h") ? EXIT_USAGE : EXIT_OK;
        }

        const auto result = router.execute(call);
        printResult(result, call.hasOpt("pretty"), std::cout, std::cerr);

        nx::log::Registry::nexus()->info("[*] '{}' finished with exit code {}", call.name, result.exit_code);
        core.shutdown();
        nx::log::Registry::shutdown();
        return result.exit_code;
    } catch (const std::exception& e) {
        if (nx::log::Registry::isInitialized())
            nx::log::Registry::nexus()->error("[-] nexus failed: {}", e.what());
        else spdlog::error("[-] nexus failed to start: {}", e.what());
        return EXIT_FAILURE;
    }
}
