#pragma once

#include <filesystem>

namespace nx::util {

// Moves from -> to without ever replacing an existing destination. Falls back to
// copy + remove when the two sides live on different filesystems. Throws nx::Error
// (RestoreCollision when the destination is occupied).
void moveNoReplace(const std::filesystem::path& from, const std::filesystem::path& to);

// Cross-device half of moveNoReplace: recursive copy (symlinks copied as links),
// then removal of the source. A failed copy leaves nothing behind at `to`.
void copyThenRemove(const std::filesystem::path& from, const std::filesystem::path& to);

// Recursive removal that treats an already-missing path as success. Throws nx::Error
// on anything else.
void removeTree(const std::filesystem::path& path);

}
