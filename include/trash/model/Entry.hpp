#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace nx::trash::model {

// One app-owned journal record. Created on soft-delete, never mutated afterwards.
struct Entry {
    std::string id{}, name{};
    std::filesystem::path original_path{};
    std::string stored_name{};   // payload name under <trashRoot>/files
    int64_t trashed_at{};        // epoch ms
    uintmax_t size{};
    bool is_directory{};

    [[nodiscard]] bool operator==(const Entry& other) const = default;
};

void to_json(nlohmann::json& j, const Entry& e);
void from_json(const nlohmann::json& j, Entry& e);

}
