#include "scan/model/DiskNode.hpp"

#include <nlohmann/json.hpp>

namespace nx::scan::model {

DiskNode DiskNode::bucket(std::string id, const uintmax_t value) {
    DiskNode n;
    n.id = std::move(id);
    n.value = value;
    n.category = Category::Other;
    return n;
}

void to_json(nlohmann::json& j, const DiskNode& node) {
    j = {
        {"id", node.id},
        {"value", node.value},
        {"category", std::string(to_string(node.category))}
    };

    if (node.path) j["path"] = node.path->string();
    if (node.children) j["children"] = *node.children;
}

}
