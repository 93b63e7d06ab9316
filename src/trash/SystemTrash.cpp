#include "trash/SystemTrash.hpp"
#include "log/Registry.hpp"
#include "util/Error.hpp"
#include "util/files.hpp"
#include "util/fsPath.hpp"
#include "util/timestamp.hpp"
#include "util/uuid.hpp"

#include <fstream>

using namespace nx::trash;
using namespace nx::trash::model;
using namespace nx::log;
using namespace nx::util;

SystemTrash::SystemTrash(fs::path root, const bool enabled, const unsigned int maxRecursionDepth)
    : root_(std::move(root)), enabled_(enabled), probe_(maxRecursionDepth) {}

bool SystemTrash::isSystemId(const std::string_view id) {
    return id.substr(0, ID_PREFIX.size()) == ID_PREFIX;
}

std::string SystemTrash::encodeId(const fs::path& path) {
    return std::string(ID_PREFIX) + b32_crockford_encode(path.string());
}

std::optional<fs::path> SystemTrash::decodeId(const std::string_view id) {
    if (!isSystemId(id)) return std::nullopt;
    const auto body = id.substr(ID_PREFIX.size());
    if (body.empty()) return std::nullopt;

    const auto decoded = b32_crockford_decode(body);
    if (!decoded || decoded->empty()) return std::nullopt;
    if (decoded->find('\0') != std::string::npos) return std::nullopt;

    fs::path p(*decoded);
    if (!p.is_absolute()) return std::nullopt;
    return p;
}

fs::path SystemTrash::infoFileFor(const std::string& name) const {
    return infoDir() / (name + ".trashinfo");
}

SystemTrash::TrashInfo SystemTrash::readInfo(const std::string& name) const {
    TrashInfo info;
    std::ifstream in(infoFileFor(name));
    if (!in) return info;

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.starts_with("Path=")) info.original_path = percentDecode(line.substr(5));
        else if (line.starts_with("DeletionDate=")) info.deleted_at = parseLocalIsoMillis(line.substr(13));
    }
    return info;
}

std::vector<Item> SystemTrash::list() const {
    std::vector<Item> items;
    if (!enabled()) return items;

    const auto files = filesDir();
    std::error_code ec;
    if (!fs::is_directory(files, ec)) return items;

    fs::directory_iterator it(files, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        Registry::trash()->warn("[SystemTrash] Cannot list {}: {}", files.string(), ec.message());
        return items;
    }

    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            Registry::trash()->debug("[SystemTrash] Listing {} stopped early: {}", files.string(), ec.message());
            break;
        }

        const auto& p = it->path();
        const auto name = p.filename().string();

        std::error_code statEc;
        const auto st = fs::symlink_status(p, statEc);
        if (statEc) continue;

        Item item;
        item.id = encodeId(p);
        item.name = name;
        item.is_directory = fs::is_directory(st);
        item.size = probe_.compute(p);
        item.source = Source::System;

        const auto info = readInfo(name);
        item.original_path = info.original_path;
        if (info.deleted_at) item.trashed_at = *info.deleted_at;
        else {
            const auto mtime = fs::last_write_time(p, statEc);
            item.trashed_at = statEc ? 0 : toMillis(mtime);
        }

        items.push_back(std::move(item));
    }

    return items;
}

void SystemTrash::remove(const std::string_view id) const {
    const auto target = decodeId(id);
    if (!target) throw Error(ErrorCode::InvalidId, "[SystemTrash] Malformed system id: " + std::string(id));

    if (!enabled() || !isStrictlyWithin(*target, filesDir()))
        throw Error(ErrorCode::InvalidId, "[SystemTrash] Refusing to delete outside the system trash: " + target->string());

    std::error_code ec;
    if (!fs::exists(fs::symlink_status(*target, ec)))
        throw Error(ErrorCode::NotFound, "[SystemTrash] No such item: " + target->string());

    removeTree(*target);

    // Only top-level items carry a sidecar.
    const auto name = target->filename().string();
    std::error_code canonEc;
    const auto parent = fs::weakly_canonical(target->parent_path(), canonEc);
    if (!canonEc && parent == fs::weakly_canonical(filesDir(), canonEc) && !canonEc) {
        fs::remove(infoFileFor(name), ec);
        if (ec) Registry::trash()->warn("[SystemTrash] Failed to remove {}: {}", infoFileFor(name).string(), ec.message());
    }

    Registry::trash()->info("[SystemTrash] Permanently deleted {}", target->string());
}
