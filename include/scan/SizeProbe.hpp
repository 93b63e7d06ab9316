#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <unordered_set>
#include <sys/types.h>

namespace nx::scan {

struct DirIdentity {
    dev_t dev{};
    ino_t ino{};

    [[nodiscard]] bool operator==(const DirIdentity& other) const = default;
};

struct DirIdentityHash {
    size_t operator()(const DirIdentity& id) const noexcept {
        return std::hash<uint64_t>{}(static_cast<uint64_t>(id.dev) * 1000003ULL ^ static_cast<uint64_t>(id.ino));
    }
};

using VisitedSet = std::unordered_set<DirIdentity, DirIdentityHash>;

// lstat-based; nullopt when the path cannot be stat'ed.
std::optional<DirIdentity> identityOf(const std::filesystem::path& p);

// Exact recursive byte size of a path. Never throws: anything that cannot be
// stat'ed or listed contributes zero. Symlinks are not followed.
class SizeProbe {
public:
    explicit SizeProbe(unsigned int maxRecursionDepth = 256) : maxRecursionDepth_(maxRecursionDepth) {}

    [[nodiscard]] uintmax_t compute(const std::filesystem::path& path) const;

private:
    unsigned int maxRecursionDepth_;

    uintmax_t computeDir(const std::filesystem::path& dir, unsigned int level, VisitedSet& visited) const;
};

}
