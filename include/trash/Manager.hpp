#pragma once

#include "trash/Manifest.hpp"
#include "trash/SystemTrash.hpp"
#include "trash/model/Entry.hpp"
#include "trash/model/Item.hpp"
#include "scan/SizeProbe.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace nx::trash {

// Owns <trashRoot>/files and <trashRoot>/manifest.json. Every public operation
// runs its load/mutate/save cycle under one mutex. Failures throw nx::Error.
class Manager {
public:
    Manager(std::filesystem::path trashRoot, SystemTrash systemTrash, unsigned int maxRecursionDepth = 256);

    model::Entry moveToTrash(const std::filesystem::path& path);

    // System ids are rejected with InvalidId.
    void restoreFromTrash(std::string_view id);

    void permanentlyDelete(std::string_view id);

    // Best effort; the manifest is reset regardless of individual failures.
    void emptyTrash();

    // App entries and system items, newest first.
    [[nodiscard]] std::vector<model::Item> listTrashItems() const;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }
    [[nodiscard]] std::filesystem::path filesDir() const { return root_ / "files"; }
    [[nodiscard]] const SystemTrash& systemTrash() const { return system_; }

private:
    std::filesystem::path root_;
    Manifest manifest_;
    SystemTrash system_;
    scan::SizeProbe probe_;
    mutable std::mutex mutex_;

    void ensureLayout() const;
    void persistOrRollback(const std::vector<model::Entry>& entries,
                           const std::filesystem::path& movedFrom, const std::filesystem::path& movedTo) const;
};

}
