#pragma once

#include "concurrency/Task.hpp"
#include "scan/TreeBuilder.hpp"

#include <filesystem>
#include <future>
#include <memory>

namespace nx::concurrency { class ThreadPool; }

namespace nx::scan {

using ScanFuture = std::future<ExpectedFuture>;

// Runs each scan as its own task on a private worker pool. The caller gets the
// future back immediately; faults surface from get().
class Executor {
public:
    explicit Executor(TreeBuilder::Options options, unsigned int workers = 0);
    ~Executor();

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    [[nodiscard]] ScanFuture submit(const std::filesystem::path& path, int depth) const;

    // Queued scans that have not started are abandoned (their futures report broken_promise).
    void shutdown() const;

private:
    TreeBuilder::Options options_;
    std::shared_ptr<concurrency::ThreadPool> pool_;
};

// Blocks on the future and unwraps the tree, rethrowing whatever the scan threw.
std::shared_ptr<model::DiskNode> awaitTree(ScanFuture& future);

}
