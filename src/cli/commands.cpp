#include "cli/commands.hpp"
#include "cli/Router.hpp"
#include "runtime/Core.hpp"
#include "trash/Manager.hpp"
#include "scan/model/DiskNode.hpp"
#include "log/Registry.hpp"
#include "util/Error.hpp"

#include <future>
#include <stdexcept>
#include <fmt/format.h>

using namespace nx;
using namespace nx::cli;
using namespace nx::runtime;
using namespace nx::log;

namespace {

nlohmann::json errorBody(const Error& e) {
    return {{"ok", false}, {"error", std::string(to_string(e.code()))}, {"message", e.what()}};
}

template <typename F>
CommandResult runTyped(F&& fn) {
    try {
        return fn();
    } catch (const Error& e) {
        return failed(e.what(), errorBody(e));
    }
}

std::optional<int> parseDepth(const std::string& raw) {
    try {
        size_t consumed = 0;
        const int depth = std::stoi(raw, &consumed);
        if (consumed != raw.size() || depth < 0) return std::nullopt;
        return depth;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

CommandResult awaitScan(scan::ScanFuture future, const std::string& path) {
    try {
        const auto tree = scan::awaitTree(future);
        return ok(*tree);
    } catch (const Error& e) {
        return failed(e.what(), errorBody(e));
    } catch (const std::future_error& e) {
        return failed(fmt::format("Scan of {} was abandoned: {}", path, e.what()));
    } catch (const std::runtime_error& e) {
        return failed(fmt::format("Scan of {} failed: {}", path, e.what()));
    }
}

}

void nx::cli::registerCommands(Router& router, const Core& core) {
    router.registerCommand("scan", {
        .synopsis = "scan <path> [--depth N]",
        .description = "Size tree of <path> for visualization",
        .min_positionals = 1,
        .handler = [&core](const CommandCall& call) {
            const auto& path = call.positionals.front();
            int depth = core.settings().scan.default_depth;
            if (call.hasOpt("depth")) {
                const auto raw = call.opt("depth");
                const auto parsed = raw ? parseDepth(*raw) : std::nullopt;
                if (!parsed) return invalid("--depth expects a non-negative integer");
                depth = *parsed;
            }
            return awaitScan(core.scanForVisualization(path, depth), path);
        }
    });

    router.registerCommand("scan-deep", {
        .synopsis = "scan-deep <path>",
        .description = "Size tree of <path> at the configured deep depth",
        .min_positionals = 1,
        .handler = [&core](const CommandCall& call) {
            const auto& path = call.positionals.front();
            return awaitScan(core.scanForVisualizationDeep(path), path);
        }
    });

    router.registerCommand("trash", {
        .synopsis = "trash <path>",
        .description = "Move <path> into the app trash",
        .min_positionals = 1,
        .handler = [&core](const CommandCall& call) {
            return runTyped([&] {
                const auto entry = core.trashManager().moveToTrash(call.positionals.front());
                return ok({{"ok", true}, {"entry", trash::model::Item(entry)}});
            });
        }
    });

    router.registerCommand("list", {
        .synopsis = "list",
        .description = "List app and system trash, newest first",
        .min_positionals = 0,
        .handler = [&core](const CommandCall&) {
            return runTyped([&] { return ok(core.trashManager().listTrashItems()); });
        }
    });

    router.registerCommand("restore", {
        .synopsis = "restore <id>",
        .description = "Move a trashed item back to its original path",
        .min_positionals = 1,
        .handler = [&core](const CommandCall& call) {
            return runTyped([&] {
                core.trashManager().restoreFromTrash(call.positionals.front());
                return ok({{"ok", true}, {"id", call.positionals.front()}});
            });
        }
    });

    router.registerCommand("purge", {
        .synopsis = "purge <id>",
        .description = "Permanently delete one trashed item",
        .min_positionals = 1,
        .handler = [&core](const CommandCall& call) {
            return runTyped([&] {
                core.trashManager().permanentlyDelete(call.positionals.front());
                return ok({{"ok", true}, {"id", call.positionals.front()}});
            });
        }
    });

    router.registerCommand("empty", {
        .synopsis = "empty",
        .description = "Permanently delete everything in the trash",
        .min_positionals = 0,
        .handler = [&core](const CommandCall&) {
            if (!core.emptyTrash()) return failed("Emptying the trash failed", {{"ok", false}});
            return ok({{"ok", true}});
        }
    });

    router.registerCommand("config", {
        .synopsis = "config",
        .description = "Print the effective configuration",
        .min_positionals = 0,
        .handler = [&core](const CommandCall&) {
            return ok(core.settings());
        }
    });
}
