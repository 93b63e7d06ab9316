#include "trash/model/Item.hpp"
#include "trash/model/Entry.hpp"

#include <nlohmann/json.hpp>

namespace nx::trash::model {

std::string_view to_string(const Source s) {
    return s == Source::System ? "system" : "app";
}

Item::Item(const Entry& entry)
    : id(entry.id),
      name(entry.name),
      original_path(entry.original_path),
      trashed_at(entry.trashed_at),
      size(entry.size),
      is_directory(entry.is_directory),
      source(Source::App) {}

void to_json(nlohmann::json& j, const Item& item) {
    j = {
        {"id", item.id},
        {"name", item.name},
        {"originalPath", item.original_path.string()},
        {"trashedAt", item.trashed_at},
        {"size", item.size},
        {"isDirectory", item.is_directory},
        {"source", std::string(to_string(item.source))}
    };
}

}
