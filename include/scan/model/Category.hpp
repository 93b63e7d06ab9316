#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace nx::scan::model {

enum class Category { Code, Media, Docs, System, Folder, Other };

[[nodiscard]] std::string_view to_string(Category c);

// Extension lookup is case-insensitive; unlisted or missing extensions map to Other.
[[nodiscard]] Category categoryForPath(const std::filesystem::path& p);

}
