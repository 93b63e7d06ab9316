#pragma once

#include "concurrency/Task.hpp"
#include "scan/TreeBuilder.hpp"

#include <filesystem>

namespace nx::scan::task {

// One scan request. Owns its own copy of the inputs; the pool drops it once it has run.
struct ScanTask final : concurrency::PromisedTask {
    const std::filesystem::path path;
    const int depth;
    const TreeBuilder::Options options;

    ScanTask(std::filesystem::path path, int depth, TreeBuilder::Options options);
    ~ScanTask() override = default;

    void operator()() override;
};

}
