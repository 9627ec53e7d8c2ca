#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace lazymcp {

enum class NodeKind {
    Category,
    Tool,
};

// ---------------------------------------------------------------------------
// ToolBinding: where a tool node routes to.
// ---------------------------------------------------------------------------
struct ToolBinding {
    std::string server;          // owning backend name
    std::string native_tool_id;  // the backend's own tool name
    nlohmann::json input_schema = nlohmann::json::object();
};

// ---------------------------------------------------------------------------
// HierarchyNode: one node of the category/tool tree.
//
// Built once by the loader and never mutated afterwards; the store hands out
// const pointers only.
// ---------------------------------------------------------------------------
class HierarchyNode {
private:
    // Constructor key: only the factories can build one.
    struct Key {
        explicit Key() = default;
    };

public:
    using Children = std::map<std::string, std::unique_ptr<HierarchyNode>>;

    static std::unique_ptr<HierarchyNode> MakeCategory(std::string path,
                                                       std::string description,
                                                       std::string overview);
    static std::unique_ptr<HierarchyNode> MakeTool(std::string path,
                                                   std::string description,
                                                   ToolBinding binding);

    HierarchyNode(Key, NodeKind kind, std::string path, std::string description)
        : kind_(kind), path_(std::move(path)), description_(std::move(description)) {}

    [[nodiscard]] NodeKind Kind() const noexcept { return kind_; }
    [[nodiscard]] bool IsCategory() const noexcept { return kind_ == NodeKind::Category; }
    [[nodiscard]] bool IsTool() const noexcept { return kind_ == NodeKind::Tool; }

    /// Full dot-separated path; empty for the root.
    [[nodiscard]] const std::string& Path() const noexcept { return path_; }
    [[nodiscard]] const std::string& Description() const noexcept { return description_; }
    [[nodiscard]] const std::string& Overview() const noexcept { return overview_; }
    [[nodiscard]] const Children& ChildNodes() const noexcept { return children_; }

    /// Only meaningful for tool nodes.
    [[nodiscard]] const ToolBinding& Binding() const noexcept { return *binding_; }

    [[nodiscard]] const HierarchyNode* FindChild(const std::string& name) const;

    /// Loader-only. Returns false if the name is already taken.
    bool AddChild(const std::string& name, std::unique_ptr<HierarchyNode> child);

private:
    NodeKind kind_;
    std::string path_;
    std::string description_;
    std::string overview_;
    Children children_;
    std::optional<ToolBinding> binding_;
};

} // namespace lazymcp
