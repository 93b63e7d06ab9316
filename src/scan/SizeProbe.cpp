#include "scan/SizeProbe.hpp"
#include "log/Registry.hpp"

#include <sys/stat.h>

namespace fs = std::filesystem;

using namespace nx::log;

namespace nx::scan {

std::optional<DirIdentity> identityOf(const fs::path& p) {
    struct stat st{};
    if (::lstat(p.c_str(), &st) != 0) return std::nullopt;
    return DirIdentity{st.st_dev, st.st_ino};
}

uintmax_t SizeProbe::compute(const fs::path& path) const {
    std::error_code ec;
    const auto st = fs::symlink_status(path, ec);
    if (ec) return 0;

    if (fs::is_regular_file(st)) {
        const auto size = fs::file_size(path, ec);
        return ec ? 0 : size;
    }

    if (!fs::is_directory(st)) return 0;

    VisitedSet visited;
    return computeDir(path, 0, visited);
}

uintmax_t SizeProbe::computeDir(const fs::path& dir, const unsigned int level, VisitedSet& visited) const {
    if (level >= maxRecursionDepth_) {
        Registry::scan()->debug("[SizeProbe] Recursion ceiling {} reached at {}, not descending",
                                maxRecursionDepth_, dir.string());
        return 0;
    }

    if (const auto id = identityOf(dir); !id || !visited.insert(*id).second) return 0;

    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        Registry::scan()->debug("[SizeProbe] Cannot list {}: {}", dir.string(), ec.message());
        return 0;
    }

    uintmax_t total = 0;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;

        std::error_code entryEc;
        const auto st = it->symlink_status(entryEc);
        if (entryEc) continue;

        if (fs::is_regular_file(st)) {
            const auto size = it->file_size(entryEc);
            if (!entryEc) total += size;
        } else if (fs::is_directory(st)) {
            total += computeDir(it->path(), level + 1, visited);
        }
    }

    if (ec) Registry::scan()->debug("[SizeProbe] Listing of {} cut short: {}", dir.string(), ec.message());

    return total;
}

}
