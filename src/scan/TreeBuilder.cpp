#include "scan/TreeBuilder.hpp"
#include "log/Registry.hpp"
#include "util/Error.hpp"

#include <algorithm>
#include <numeric>

namespace fs = std::filesystem;

using namespace nx::scan::model;
using namespace nx::log;

namespace nx::scan {

TreeBuilder::Options TreeBuilder::Options::fromConfig(const config::ScanConfig& cfg) {
    return {
        .small_file_bytes = cfg.small_file_bytes,
        .small_folder_bytes = cfg.small_folder_bytes,
        .max_recursion_depth = cfg.max_recursion_depth,
        .always_fold = cfg.always_fold
    };
}

TreeBuilder::TreeBuilder() : TreeBuilder(Options{}) {}

TreeBuilder::TreeBuilder(Options options)
    : options_(std::move(options)), probe_(options_.max_recursion_depth) {}

DiskNode TreeBuilder::build(const fs::path& path, const int maxDepth) const {
    auto root = fs::absolute(path).lexically_normal();
    if (root.filename().empty() && root != root.root_path()) root = root.parent_path();

    auto name = root.filename().string();
    if (name.empty()) name = "Root";

    std::error_code ec;
    const auto st = fs::status(root, ec);
    if (ec || !fs::exists(st)) {
        if (!ec || ec == std::errc::no_such_file_or_directory)
            throw Error(ErrorCode::NotFound, "[TreeBuilder] Scan root does not exist: " + root.string());

        Registry::scan()->warn("[TreeBuilder] Cannot stat scan root {}: {}", root.string(), ec.message());
        DiskNode inaccessible;
        inaccessible.id = name;
        inaccessible.path = root;
        return inaccessible;
    }

    if (!fs::is_directory(st)) {
        const auto size = fs::file_size(root, ec);
        return leaf(root, name, ec ? 0 : size);
    }

    VisitedSet visited;
    auto tree = buildDirectory(root, name, maxDepth, 0, visited);
    Registry::scan()->debug("[TreeBuilder] Built {} ({} bytes, depth {})", root.string(), tree.value, maxDepth);
    return tree;
}

DiskNode TreeBuilder::buildDirectory(const fs::path& dir, std::string name, const int remainingDepth,
                                     const unsigned int level, VisitedSet& visited) const {
    DiskNode node;
    node.id = std::move(name);
    node.path = dir;
    node.category = Category::Folder;

    if (const auto id = identityOf(dir); id && !visited.insert(*id).second) {
        Registry::scan()->debug("[TreeBuilder] {} already visited, skipping", dir.string());
        return node;
    }

    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        Registry::scan()->debug("[TreeBuilder] TraversalFault listing {}: {}", dir.string(), ec.message());
        return node;
    }

    std::vector<DiskNode> children;
    uintmax_t miscFileSize = 0, otherFolderSize = 0;

    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;

        try {
            const auto& entry = *it;
            std::error_code entryEc;
            const auto st = entry.symlink_status(entryEc);
            if (entryEc) {
                Registry::scan()->debug("[TreeBuilder] Skipping {}: {}", entry.path().string(), entryEc.message());
                continue;
            }

            if (fs::is_regular_file(st)) {
                const auto size = entry.file_size(entryEc);
                if (entryEc) continue;

                if (size < options_.small_file_bytes) miscFileSize += size;
                else children.push_back(leaf(entry.path(), entry.path().filename().string(), size));
            } else if (fs::is_directory(st)) {
                const auto childSize = probe_.compute(entry.path());

                if (remainingDepth <= 0 ||
                    childSize < options_.small_folder_bytes ||
                    level + 1 >= options_.max_recursion_depth ||
                    alwaysFolded(entry.path()))
                    otherFolderSize += childSize;
                else
                    children.push_back(buildDirectory(entry.path(), entry.path().filename().string(),
                                                      remainingDepth - 1, level + 1, visited));
            }
        } catch (const fs::filesystem_error& e) {
            Registry::scan()->debug("[TreeBuilder] Skipping entry under {}: {}", dir.string(), e.what());
        }
    }

    if (ec) Registry::scan()->debug("[TreeBuilder] Listing of {} cut short: {}", dir.string(), ec.message());

    if (miscFileSize > 0) children.push_back(DiskNode::bucket(MISC_BUCKET_ID, miscFileSize));
    if (otherFolderSize > 0) children.push_back(DiskNode::bucket(OTHER_FOLDERS_BUCKET_ID, otherFolderSize));

    node.value = std::accumulate(children.begin(), children.end(), uintmax_t{0},
                                 [](const uintmax_t sum, const DiskNode& c) { return sum + c.value; });
    if (!children.empty()) node.children = std::move(children);

    return node;
}

bool TreeBuilder::alwaysFolded(const fs::path& dir) const {
    const auto name = dir.filename().string();
    return std::ranges::find(options_.always_fold, name) != options_.always_fold.end();
}

DiskNode TreeBuilder::leaf(const fs::path& file, std::string name, const uintmax_t size) {
    DiskNode n;
    n.id = std::move(name);
    n.value = size;
    n.path = file;
    n.category = categoryForPath(file);
    return n;
}

}
