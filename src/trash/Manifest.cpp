#include "trash/Manifest.hpp"
#include "log/Registry.hpp"
#include "util/Error.hpp"
#include "util/timestamp.hpp"

#include <fstream>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

using namespace nx::trash;
using namespace nx::trash::model;
using namespace nx::log;
using namespace nx::util;

Manifest::Manifest(fs::path file) : file_(std::move(file)) {}

std::vector<Entry> Manifest::load() const {
    std::error_code ec;
    if (!fs::exists(file_, ec)) return {};

    std::ifstream in(file_, std::ios::binary);
    if (!in) throw Error(ErrorCode::IoFailure, "[Manifest] Failed to open " + file_.string());

    std::stringstream buffer;
    buffer << in.rdbuf();
    in.close();

    try {
        const auto doc = nlohmann::json::parse(buffer.str());

        // Legacy documents are a bare array of entries.
        if (doc.is_array()) return doc.get<std::vector<Entry>>();

        if (!doc.is_object() || !doc.contains("entries"))
            throw Error(ErrorCode::ManifestCorrupt, "document has no entries array");

        if (const auto version = doc.value("version", VERSION); version > VERSION)
            Registry::trash()->warn("[Manifest] {} was written by a newer version ({}), reading anyway",
                                    file_.string(), version);

        return doc.at("entries").get<std::vector<Entry>>();
    } catch (const nlohmann::json::exception& e) {
        quarantine(e.what());
    } catch (const Error& e) {
        quarantine(e.what());
    }

    return {};
}

void Manifest::save(const std::vector<Entry>& entries) const {
    std::error_code ec;
    fs::create_directories(file_.parent_path(), ec);
    if (ec) throwFromCode(ec, "[Manifest] Failed to create " + file_.parent_path().string());

    const nlohmann::json doc = {
        {"version", VERSION},
        {"entries", entries}
    };

    auto tmp = file_;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw Error(ErrorCode::IoFailure, "[Manifest] Failed to open " + tmp.string() + " for writing");
        out << doc.dump(2);
        out.flush();
        if (!out) throw Error(ErrorCode::IoFailure, "[Manifest] Failed to write " + tmp.string());
    }

    if (const int fd = ::open(tmp.c_str(), O_RDONLY); fd >= 0) {
        ::fsync(fd);
        ::close(fd);
    }

    fs::rename(tmp, file_, ec);
    if (ec) {
        std::error_code cleanupEc;
        fs::remove(tmp, cleanupEc);
        throwFromCode(ec, "[Manifest] Failed to replace " + file_.string());
    }
}

void Manifest::quarantine(const std::string& reason) const {
    auto aside = file_;
    aside += ".corrupt-" + std::to_string(nowMillis());

    std::error_code ec;
    fs::rename(file_, aside, ec);

    Registry::trash()->error("[Manifest] {}: {} is unreadable ({}), treating as empty; original kept at {}",
                             to_string(ErrorCode::ManifestCorrupt), file_.string(), reason,
                             ec ? std::string("<not preserved: ") + ec.message() + ">" : aside.string());
}
