#include <lazymcp/hierarchy/hierarchy_node.hpp>

namespace lazymcp {

std::unique_ptr<HierarchyNode> HierarchyNode::MakeCategory(std::string path,
                                                           std::string description,
                                                           std::string overview) {
    auto node = std::make_unique<HierarchyNode>(Key{}, NodeKind::Category, std::move(path),
                                                std::move(description));
    node->overview_ = std::move(overview);
    return node;
}

std::unique_ptr<HierarchyNode> HierarchyNode::MakeTool(std::string path,
                                                       std::string description,
                                                       ToolBinding binding) {
    auto node = std::make_unique<HierarchyNode>(Key{}, NodeKind::Tool, std::move(path),
                                                std::move(description));
    node->binding_ = std::move(binding);
    return node;
}

const HierarchyNode* HierarchyNode::FindChild(const std::string& name) const {
    auto it = children_.find(name);
    if (it == children_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool HierarchyNode::AddChild(const std::string& name, std::unique_ptr<HierarchyNode> child) {
    return children_.emplace(name, std::move(child)).second;
}

} // namespace lazymcp
