#include "scan/Executor.hpp"
#include "scan/task/ScanTask.hpp"
#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace nx::scan;
using namespace nx::concurrency;
using namespace nx::log;

Executor::Executor(TreeBuilder::Options options, const unsigned int workers)
    : options_(std::move(options)),
      pool_(std::make_shared<ThreadPool>("scan", workers)) {
    Registry::scan()->debug("[Executor] Started with {} workers", pool_->workerCount());
}

Executor::~Executor() { shutdown(); }

ScanFuture Executor::submit(const std::filesystem::path& path, const int depth) const {
    const auto task = std::make_shared<task::ScanTask>(path, depth, options_);
    auto future = task->getFuture().value();
    pool_->submit(task);
    Registry::scan()->debug("[Executor] Queued scan of {} (depth {}), {} pending", path.string(), depth, pool_->queueDepth());
    return future;
}

void Executor::shutdown() const {
    if (pool_->isStopped()) return;
    pool_->stop();
    Registry::scan()->debug("[Executor] Stopped");
}

std::shared_ptr<nx::scan::model::DiskNode> nx::scan::awaitTree(ScanFuture& future) {
    auto result = future.get();
    if (const auto* tree = std::get_if<std::shared_ptr<model::DiskNode>>(&result); tree && *tree) return *tree;
    throw std::runtime_error("[Executor] Scan task completed without a tree");
}
