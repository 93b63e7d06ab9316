#pragma once

#include "scan/model/Category.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace nx::scan::model {

static constexpr const char* MISC_BUCKET_ID = "Misc / Other";
static constexpr const char* OTHER_FOLDERS_BUCKET_ID = "Other Folders";

struct DiskNode {
    std::string id;
    uintmax_t value{0};
    std::optional<std::filesystem::path> path{};   // absent on buckets
    Category category{Category::Other};
    std::optional<std::vector<DiskNode>> children{}; // present only on expanded directories

    [[nodiscard]] bool isBucket() const { return !path && category == Category::Other; }
    [[nodiscard]] bool hasChildren() const { return children && !children->empty(); }

    [[nodiscard]] bool operator==(const DiskNode& other) const = default;

    static DiskNode bucket(std::string id, uintmax_t value);
};

void to_json(nlohmann::json& j, const DiskNode& node);

}
