#pragma once

#include "trash/model/Item.hpp"
#include "scan/SizeProbe.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nx::trash {

// Read-mostly view over the freedesktop.org home trash (<root>/files + <root>/info).
class SystemTrash {
public:
    static constexpr std::string_view ID_PREFIX = "system:";

    SystemTrash(std::filesystem::path root, bool enabled, unsigned int maxRecursionDepth = 256);

    // Empty when disabled or when the trash directory does not exist.
    [[nodiscard]] std::vector<model::Item> list() const;

    // Removes the payload named by a system id plus its .trashinfo sidecar.
    // Throws nx::Error: InvalidId for malformed ids or paths outside files/.
    void remove(std::string_view id) const;

    [[nodiscard]] static bool isSystemId(std::string_view id);
    [[nodiscard]] static std::string encodeId(const std::filesystem::path& path);
    [[nodiscard]] static std::optional<std::filesystem::path> decodeId(std::string_view id);

    [[nodiscard]] bool enabled() const { return enabled_ && !root_.empty(); }
    [[nodiscard]] std::filesystem::path filesDir() const { return root_ / "files"; }
    [[nodiscard]] std::filesystem::path infoDir() const { return root_ / "info"; }

private:
    std::filesystem::path root_;
    bool enabled_;
    scan::SizeProbe probe_;

    struct TrashInfo {
        std::filesystem::path original_path{};
        std::optional<int64_t> deleted_at{};
    };

    [[nodiscard]] TrashInfo readInfo(const std::string& name) const;
    [[nodiscard]] std::filesystem::path infoFileFor(const std::string& name) const;
};

}
