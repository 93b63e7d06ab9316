#include "trash/Manager.hpp"
#include "log/Registry.hpp"
#include "util/Error.hpp"
#include "util/files.hpp"
#include "util/fsPath.hpp"
#include "util/timestamp.hpp"
#include "util/uuid.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace nx;
using namespace nx::trash;
using namespace nx::trash::model;
using namespace nx::log;
using namespace nx::util;

Manager::Manager(fs::path trashRoot, SystemTrash systemTrash, const unsigned int maxRecursionDepth)
    : root_(makeAbsolute(trashRoot)),
      manifest_(root_ / "manifest.json"),
      system_(std::move(systemTrash)),
      probe_(maxRecursionDepth) {}

void Manager::ensureLayout() const {
    std::error_code ec;
    fs::create_directories(filesDir(), ec);
    if (ec) throwFromCode(ec, "[Manager] Failed to create trash directory " + filesDir().string());
}

void Manager::persistOrRollback(const std::vector<Entry>& entries,
                                const fs::path& movedFrom, const fs::path& movedTo) const {
    try {
        manifest_.save(entries);
    } catch (const Error& e) {
        Registry::trash()->error("[Manager] Failed to persist manifest, moving {} back to {}: {}",
                                 movedTo.string(), movedFrom.string(), e.what());
        try {
            moveNoReplace(movedTo, movedFrom);
        } catch (const Error& rollback) {
            Registry::trash()->critical("[Manager] Rollback failed, payload left at {}: {}",
                                        movedTo.string(), rollback.what());
        }
        throw;
    }
}

Entry Manager::moveToTrash(const fs::path& path) {
    std::lock_guard lock(mutex_);

    if (path.empty()) throw Error(ErrorCode::InvalidArgument, "[Manager] Empty path");
    const auto source = makeAbsolute(path);

    std::error_code ec;
    const auto st = fs::symlink_status(source, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
        throwFromCode(ec, "[Manager] Cannot stat " + source.string());
    if (!fs::exists(st)) throw Error(ErrorCode::NotFound, "[Manager] No such file or directory: " + source.string());

    // Symlink aliases of the trash root resolve to it and are refused too.
    std::error_code sourceEc, rootEc;
    const auto resolvedSource = fs::weakly_canonical(source, sourceEc);
    const auto resolvedRoot = fs::weakly_canonical(root_, rootEc);
    if (source == root_ || (!sourceEc && !rootEc && resolvedSource == resolvedRoot) ||
        isStrictlyWithin(source, root_) || isStrictlyWithin(root_, source))
        throw Error(ErrorCode::InvalidArgument, "[Manager] Refusing to trash the trash or a directory holding it: " + source.string());

    ensureLayout();
    auto entries = manifest_.load();

    Entry entry;
    entry.id = uuid4();
    entry.name = source.filename().string();
    entry.original_path = source;
    entry.stored_name = entry.id + "_" + entry.name;
    entry.size = probe_.compute(source);
    entry.is_directory = fs::is_directory(st);

    const auto stored = filesDir() / entry.stored_name;
    moveNoReplace(source, stored);
    entry.trashed_at = nowMillis();

    entries.push_back(entry);
    persistOrRollback(entries, source, stored);

    Registry::trash()->info("[Manager] Trashed {} as {}", source.string(), entry.id);
    Registry::audit()->info("trash id={} path={} size={}", entry.id, source.string(), entry.size);
    return entry;
}

void Manager::restoreFromTrash(const std::string_view id) {
    if (SystemTrash::isSystemId(id))
        throw Error(ErrorCode::InvalidId, "[Manager] System trash items cannot be restored: " + std::string(id));

    std::lock_guard lock(mutex_);

    auto entries = manifest_.load();
    const auto it = std::ranges::find_if(entries, [&](const Entry& e) { return e.id == id; });
    if (it == entries.end()) throw Error(ErrorCode::NotFound, "[Manager] No trash entry with id " + std::string(id));

    const auto entry = *it;
    const auto stored = filesDir() / entry.stored_name;
    const auto& dest = entry.original_path;

    std::error_code ec;
    if (fs::exists(fs::symlink_status(dest, ec)))
        throw Error(ErrorCode::RestoreCollision, "[Manager] Restore destination is occupied: " + dest.string());

    if (!fs::exists(fs::symlink_status(stored, ec)))
        throw Error(ErrorCode::NotFound, "[Manager] Payload for " + entry.id + " is missing: " + stored.string());

    if (dest.has_parent_path()) {
        fs::create_directories(dest.parent_path(), ec);
        if (ec) throwFromCode(ec, "[Manager] Failed to create " + dest.parent_path().string());
    }

    moveNoReplace(stored, dest);

    entries.erase(it);
    persistOrRollback(entries, stored, dest);

    Registry::trash()->info("[Manager] Restored {} to {}", entry.id, dest.string());
    Registry::audit()->info("restore id={} path={}", entry.id, dest.string());
}

void Manager::permanentlyDelete(const std::string_view id) {
    std::lock_guard lock(mutex_);

    if (SystemTrash::isSystemId(id)) {
        system_.remove(id);
        Registry::audit()->info("purge id={} source=system", id);
        return;
    }

    auto entries = manifest_.load();
    const auto it = std::ranges::find_if(entries, [&](const Entry& e) { return e.id == id; });
    if (it == entries.end()) throw Error(ErrorCode::NotFound, "[Manager] No trash entry with id " + std::string(id));

    const auto stored = filesDir() / it->stored_name;
    removeTree(stored);

    const auto name = it->name;
    entries.erase(it);
    manifest_.save(entries);

    Registry::trash()->info("[Manager] Permanently deleted {} ({})", id, name);
    Registry::audit()->info("purge id={} source=app", id);
}

void Manager::emptyTrash() {
    std::lock_guard lock(mutex_);

    const auto entries = manifest_.load();
    size_t failures = 0;

    for (const auto& e : entries) {
        try {
            removeTree(filesDir() / e.stored_name);
        } catch (const Error& err) {
            ++failures;
            Registry::trash()->warn("[Manager] Skipping {} while emptying trash: {}", e.id, err.what());
        }
    }

    for (const auto& item : system_.list()) {
        try {
            system_.remove(item.id);
        } catch (const Error& err) {
            ++failures;
            Registry::trash()->warn("[Manager] Skipping system item {} while emptying trash: {}", item.name, err.what());
        }
    }

    manifest_.save({});

    Registry::trash()->info("[Manager] Emptied trash ({} app entries, {} failures)", entries.size(), failures);
    Registry::audit()->info("empty entries={} failures={}", entries.size(), failures);
}

std::vector<Item> Manager::listTrashItems() const {
    std::vector<Item> items;
    {
        std::lock_guard lock(mutex_);
        for (const auto& e : manifest_.load()) items.emplace_back(e);
    }

    auto system = system_.list();
    items.insert(items.end(), std::make_move_iterator(system.begin()), std::make_move_iterator(system.end()));

    std::ranges::stable_sort(items, [](const Item& a, const Item& b) { return a.trashed_at > b.trashed_at; });
    return items;
}
