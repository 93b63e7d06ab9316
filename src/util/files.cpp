#include "util/files.hpp"
#include "util/Error.hpp"
#include "util/fsPath.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstdio>
#include <fcntl.h>

using namespace nx::log;

namespace nx::util {

void copyThenRemove(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    if (fs::exists(fs::symlink_status(to, ec)))
        throw Error(ErrorCode::RestoreCollision, "Destination already exists: " + to.string());

    fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) {
        std::error_code cleanupEc;
        fs::remove_all(to, cleanupEc);
        throwFromCode(ec, "Failed to copy " + from.string() + " to " + to.string());
    }

    fs::remove_all(from, ec);
    if (ec) {
        // Source is still there; undo the copy so the item is not duplicated.
        std::error_code cleanupEc;
        fs::remove_all(to, cleanupEc);
        throwFromCode(ec, "Failed to remove " + from.string() + " after cross-device copy");
    }
}

void moveNoReplace(const fs::path& from, const fs::path& to) {
#ifdef RENAME_NOREPLACE
    if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) return;

    const int err = errno;
    if (err == EXDEV) {
        Registry::trash()->debug("[files] {} and {} are on different filesystems, copying", from.string(), to.string());
        copyThenRemove(from, to);
        return;
    }
    if (err != EINVAL && err != ENOSYS)
        throwFromCode(std::error_code(err, std::generic_category()),
                      "Failed to move " + from.string() + " to " + to.string(), true);
#endif

    // EINVAL also means "destination inside source"; only the unsupported-flag case falls through.
    if (isStrictlyWithin(to, from))
        throw Error(ErrorCode::InvalidArgument, "Cannot move " + from.string() + " into itself: " + to.string());

    // Filesystem without RENAME_NOREPLACE support: check, then rename.
    std::error_code ec;
    if (fs::exists(fs::symlink_status(to, ec)))
        throw Error(ErrorCode::RestoreCollision, "Destination already exists: " + to.string());

    fs::rename(from, to, ec);
    if (!ec) return;

    if (ec.value() == EXDEV) {
        copyThenRemove(from, to);
        return;
    }
    throwFromCode(ec, "Failed to move " + from.string() + " to " + to.string(), true);
}

void removeTree(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
        throwFromCode(ec, "Failed to remove " + path.string());
}

}
