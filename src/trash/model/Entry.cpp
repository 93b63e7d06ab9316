#include "trash/model/Entry.hpp"

#include "util/Error.hpp"

#include <nlohmann/json.hpp>

void nx::trash::model::to_json(nlohmann::json& j, const Entry& e) {
    j = {
        {"id", e.id},
        {"name", e.name},
        {"originalPath", e.original_path.string()},
        {"storedName", e.stored_name},
        {"trashedAt", e.trashed_at},
        {"size", e.size},
        {"isDirectory", e.is_directory}
    };
}

void nx::trash::model::from_json(const nlohmann::json& j, Entry& e) {
    e.id = j.at("id").get<std::string>();
    e.name = j.at("name").get<std::string>();
    e.original_path = j.at("originalPath").get<std::string>();
    e.stored_name = j.at("storedName").get<std::string>();
    // Payloads live directly under files/, so anything but a single plain component is forged.
    if (e.stored_name.empty() || e.stored_name == "." || e.stored_name == ".." ||
        e.stored_name.find('/') != std::string::npos || e.stored_name.find('\0') != std::string::npos)
        throw nx::Error(nx::ErrorCode::ManifestCorrupt, "[Entry] Invalid storedName: " + e.stored_name);
    e.trashed_at = j.at("trashedAt").get<int64_t>();
    e.size = j.value("size", uintmax_t{0});
    e.is_directory = j.value("isDirectory", false);
}
