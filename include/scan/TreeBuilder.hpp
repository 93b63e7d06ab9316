#pragma once

#include "scan/SizeProbe.hpp"
#include "scan/model/DiskNode.hpp"
#include "config/Config.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace nx::scan {

class TreeBuilder {
public:
    struct Options {
        uintmax_t small_file_bytes = config::SMALL_FILE_BYTES;
        uintmax_t small_folder_bytes = config::SMALL_FOLDER_BYTES;
        unsigned int max_recursion_depth = 256;
        std::vector<std::string> always_fold{};

        static Options fromConfig(const config::ScanConfig& cfg);
    };

    TreeBuilder();
    explicit TreeBuilder(Options options);

    // Throws Error{NotFound} when path does not exist. Everything below the root
    // degrades to zero instead of failing.
    [[nodiscard]] model::DiskNode build(const std::filesystem::path& path, int maxDepth) const;

private:
    Options options_;
    SizeProbe probe_;

    model::DiskNode buildDirectory(const std::filesystem::path& dir, std::string name,
                                   int remainingDepth, unsigned int level, VisitedSet& visited) const;

    [[nodiscard]] bool alwaysFolded(const std::filesystem::path& dir) const;

    [[nodiscard]] static model::DiskNode leaf(const std::filesystem::path& file, std::string name, uintmax_t size);
};

}
