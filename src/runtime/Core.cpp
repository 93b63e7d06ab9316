#include "runtime/Core.hpp"
#include "trash/Manager.hpp"
#include "trash/SystemTrash.hpp"
#include "log/Registry.hpp"
#include "util/Error.hpp"

using namespace nx;
using namespace nx::runtime;
using namespace nx::scan;
using namespace nx::trash;
using namespace nx::log;

namespace {

template <typename F>
bool reportFailure(const std::string_view op, const std::string_view subject, F&& fn) {
    try {
        fn();
        return true;
    } catch (const Error& e) {
        Registry::trash()->warn("[Core] {} {} failed ({}): {}", op, subject, to_string(e.code()), e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        Registry::trash()->warn("[Core] {} {} failed ({}): {}", op, subject,
                                to_string(errorFromCode(e.code())), e.what());
    }
    return false;
}

}

Core::Core(const config::Config& config)
    : config_(config),
      executor_(std::make_unique<Executor>(TreeBuilder::Options::fromConfig(config.scan), config.scan.worker_threads)),
      trash_(std::make_unique<Manager>(config.trashRoot(),
                                       SystemTrash(config.systemTrashRoot(), config.trash.include_system_trash,
                                                   config.scan.max_recursion_depth),
                                       config.scan.max_recursion_depth)) {
    Registry::nexus()->debug("[Core] Ready, trash root {}", trash_->root().string());
}

Core::~Core() { shutdown(); }

void Core::shutdown() const { executor_->shutdown(); }

ScanFuture Core::scanForVisualization(const std::filesystem::path& path, const int depth) const {
    return executor_->submit(path, depth);
}

ScanFuture Core::scanForVisualization(const std::filesystem::path& path) const {
    return executor_->submit(path, config_.scan.default_depth);
}

ScanFuture Core::scanForVisualizationDeep(const std::filesystem::path& path) const {
    return executor_->submit(path, config_.scan.deep_depth);
}

bool Core::moveToTrash(const std::filesystem::path& path) const {
    return reportFailure("Trash", path.string(), [&] { trash_->moveToTrash(path); });
}

std::vector<trash::model::Item> Core::listTrashItems() const {
    try {
        return trash_->listTrashItems();
    } catch (const Error& e) {
        Registry::trash()->warn("[Core] Listing trash failed ({}): {}", to_string(e.code()), e.what());
    }
    return {};
}

bool Core::restoreFromTrash(const std::string_view id) const {
    return reportFailure("Restore", id, [&] { trash_->restoreFromTrash(id); });
}

bool Core::permanentlyDelete(const std::string_view id) const {
    return reportFailure("Delete", id, [&] { trash_->permanentlyDelete(id); });
}

bool Core::emptyTrash() const {
    return reportFailure("Empty", "trash", [&] { trash_->emptyTrash(); });
}
