#include "scan/model/Category.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace nx::scan::model {

std::string_view to_string(const Category c) {
    switch (c) {
        case Category::Code: return "code";
        case Category::Media: return "media";
        case Category::Docs: return "docs";
        case Category::System: return "system";
        case Category::Folder: return "folder";
        case Category::Other: return "other";
    }
    return "other";
}

Category categoryForPath(const std::filesystem::path& p) {
    static const std::unordered_map<std::string, Category> extMap = {
        {"js", Category::Code}, {"ts", Category::Code}, {"tsx", Category::Code}, {"jsx", Category::Code},
        {"py", Category::Code}, {"html", Category::Code}, {"css", Category::Code}, {"json", Category::Code},
        {"jpg", Category::Media}, {"jpeg", Category::Media}, {"png", Category::Media}, {"gif", Category::Media},
        {"webp", Category::Media}, {"svg", Category::Media}, {"mp4", Category::Media}, {"mov", Category::Media},
        {"webm", Category::Media}, {"avi", Category::Media},
        {"pdf", Category::Docs}, {"doc", Category::Docs}, {"docx", Category::Docs}, {"txt", Category::Docs},
        {"md", Category::Docs},
        {"dll", Category::System}, {"exe", Category::System}, {"dmg", Category::System},
    };

    auto ext = p.extension().string();
    if (ext.size() < 2) return Category::Other;
    ext.erase(0, 1);
    std::ranges::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });

    const auto it = extMap.find(ext);
    return it != extMap.end() ? it->second : Category::Other;
}

}
