#pragma once

#include "trash/model/Entry.hpp"

#include <filesystem>
#include <vector>

namespace nx::trash {

// The persisted journal of app-owned trashed items. Not synchronized; the
// Manager serializes every load/mutate/save cycle.
class Manifest {
public:
    static constexpr int VERSION = 1;

    explicit Manifest(std::filesystem::path file);

    // Missing document -> empty. An unparsable document is moved aside to
    // "<file>.corrupt-<epochms>" and read as empty.
    [[nodiscard]] std::vector<model::Entry> load() const;

    // Atomic replace through "<file>.tmp". Throws nx::Error.
    void save(const std::vector<model::Entry>& entries) const;

    [[nodiscard]] const std::filesystem::path& path() const { return file_; }

private:
    std::filesystem::path file_;

    void quarantine(const std::string& reason) const;
};

}
