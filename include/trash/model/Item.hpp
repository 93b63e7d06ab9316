#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <nlohmann/json_fwd.hpp>

namespace nx::trash::model {

struct Entry;

enum class Source { App, System };

[[nodiscard]] std::string_view to_string(Source s);

// A row of the merged trash listing.
struct Item {
    std::string id{}, name{};
    std::filesystem::path original_path{};
    int64_t trashed_at{};
    uintmax_t size{};
    bool is_directory{};
    Source source{Source::App};

    Item() = default;
    explicit Item(const Entry& entry);
};

void to_json(nlohmann::json& j, const Item& item);

}
