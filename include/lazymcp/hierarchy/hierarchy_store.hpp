#pragma once

#include <lazymcp/core/result.hpp>
#include <lazymcp/hierarchy/hierarchy_node.hpp>

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace lazymcp {

constexpr char kPathSeparator = '.';

// ---------------------------------------------------------------------------
// CategoryListing: the children of one category, split by kind.
// ---------------------------------------------------------------------------
struct CategoryListing {
    std::string path;
    std::string overview;
    std::map<std::string, std::string> categories;  // name -> description
    std::map<std::string, std::string> tools;       // name -> description
    std::map<std::string, nlohmann::json> schemas;  // tool name -> input schema
};

// ---------------------------------------------------------------------------
// HierarchyStore: immutable tree of categories and tools.
//
// Persisted layout, one JSON object per category node:
//
//   {
//     "overview": "...",
//     "categories": { "<name>": "description" | { "description": "...", ... } },
//     "tools": { "<name>": { "description": "...", "server": "...",
//                            "maps_to": "...", "input_schema": {...} } }
//   }
//
// A category given as a plain description string is loaded from
// <dir>/<name>/<name>.json relative to the directory of the referencing
// file (directory layout), so it is only valid when loading from disk.
// ---------------------------------------------------------------------------
class HierarchyStore {
public:
    /// Build from an in-memory root object. Inline categories only.
    [[nodiscard]] static Result<HierarchyStore, Error> FromJson(const nlohmann::json& root);

    /// Load a single JSON file, or a directory containing root.json.
    [[nodiscard]] static Result<HierarchyStore, Error> Load(const std::string& path);

    HierarchyStore(HierarchyStore&&) noexcept = default;
    HierarchyStore& operator=(HierarchyStore&&) noexcept = default;
    HierarchyStore(const HierarchyStore&) = delete;
    HierarchyStore& operator=(const HierarchyStore&) = delete;

    /// Resolve a dot-separated path. "" is the root.
    [[nodiscard]] Result<const HierarchyNode*, Error> Lookup(std::string_view path) const;

    /// Children of the category at `path`. NotACategory for tool nodes.
    [[nodiscard]] Result<CategoryListing, Error> ListChildren(std::string_view path) const;

    [[nodiscard]] const HierarchyNode& Root() const noexcept { return *root_; }

    /// Number of tool nodes in the whole tree.
    [[nodiscard]] std::size_t ToolCount() const noexcept { return tool_count_; }

    /// Distinct backend names referenced by tool nodes.
    [[nodiscard]] std::vector<std::string> ReferencedServers() const;

private:
    HierarchyStore(std::unique_ptr<HierarchyNode> root, std::size_t tool_count)
        : root_(std::move(root)), tool_count_(tool_count) {}

    std::unique_ptr<HierarchyNode> root_;
    std::size_t tool_count_ = 0;
};

} // namespace lazymcp
