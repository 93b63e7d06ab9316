#include "scan/task/ScanTask.hpp"
#include "scan/model/DiskNode.hpp"
#include "log/Registry.hpp"

using namespace nx::scan::task;
using namespace nx::scan;
using namespace nx::log;

ScanTask::ScanTask(std::filesystem::path path, const int depth, TreeBuilder::Options options)
    : path(std::move(path)), depth(depth), options(std::move(options)) {}

void ScanTask::operator()() {
    try {
        const TreeBuilder builder(options);
        promise.set_value(std::make_shared<model::DiskNode>(builder.build(path, depth)));
    } catch (const std::exception& e) {
        Registry::scan()->warn("[ScanTask] Scan of {} failed: {}", path.string(), e.what());
        promise.set_exception(std::current_exception());
    }
}
