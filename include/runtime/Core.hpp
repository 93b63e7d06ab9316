#pragma once

#include "config/Config.hpp"
#include "scan/Executor.hpp"
#include "trash/model/Item.hpp"

#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

namespace nx::trash { class Manager; }

namespace nx::runtime {

// Entry surface used by the CLI and embedders. Scans come back as futures; trash
// mutations report success as bool and log the typed failure.
class Core {
public:
    explicit Core(const config::Config& config);
    ~Core();

    Core(const Core&) = delete;
    Core& operator=(const Core&) = delete;

    [[nodiscard]] scan::ScanFuture scanForVisualization(const std::filesystem::path& path, int depth) const;
    [[nodiscard]] scan::ScanFuture scanForVisualization(const std::filesystem::path& path) const;
    [[nodiscard]] scan::ScanFuture scanForVisualizationDeep(const std::filesystem::path& path) const;

    bool moveToTrash(const std::filesystem::path& path) const;
    [[nodiscard]] std::vector<trash::model::Item> listTrashItems() const;
    bool restoreFromTrash(std::string_view id) const;
    bool permanentlyDelete(std::string_view id) const;
    bool emptyTrash() const;

    [[nodiscard]] trash::Manager& trashManager() const { return *trash_; }
    [[nodiscard]] const config::Config& settings() const { return config_; }

    void shutdown() const;

private:
    config::Config config_;
    std::unique_ptr<scan::Executor> executor_;
    std::unique_ptr<trash::Manager> trash_;
};

}
