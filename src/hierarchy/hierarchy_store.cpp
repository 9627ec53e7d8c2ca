#include <lazymcp/hierarchy/hierarchy_store.hpp>

#include <lazymcp/core/log.hpp>

#include <filesystem>
#include <fstream>
#include <optional>
#include <set>
#include <sstream>

namespace lazymcp {

namespace fs = std::filesystem;

namespace {

constexpr const char* kComponent = "hierarchy";
constexpr int kMaxDepth = 64;
constexpr const char* kRootFile = "root.json";

Error MakeLoadError(const std::string& target, const std::string& message) {
    return Error::Make(ErrorCategory::Config, "LoadHierarchy", target, message);
}

std::string JoinPath(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + kPathSeparator + name;
}

bool IsValidName(const std::string& name) {
    return !name.empty() && name.find(kPathSeparator) == std::string::npos;
}

std::string StringField(const nlohmann::json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return "";
}

Result<nlohmann::json, Error> ReadJsonFile(const fs::path& file) {
    std::ifstream in(file);
    if (!in) {
        return Result<nlohmann::json, Error>::Err(
            MakeLoadError(file.string(), "Cannot open file"));
    }
    try {
        return Result<nlohmann::json, Error>::Ok(nlohmann::json::parse(in));
    } catch (const nlohmann::json::parse_error& e) {
        return Result<nlohmann::json, Error>::Err(
            MakeLoadError(file.string(), std::string("Invalid JSON: ") + e.what()));
    }
}

// ---------------------------------------------------------------------------
// Loader: recursive descent over category objects.
// ---------------------------------------------------------------------------
class Loader {
public:
    using NodeResult = Result<std::unique_ptr<HierarchyNode>, Error>;

    // `dir` is set when loading from disk; string categories resolve against it.
    NodeResult ParseCategory(const nlohmann::json& obj,
                             const std::string& path,
                             const std::string& description,
                             const std::optional<fs::path>& dir,
                             int depth) {
        if (depth > kMaxDepth) {
            return NodeResult::Err(MakeLoadError(path, "Hierarchy nested too deeply"));
        }
        if (!obj.is_object()) {
            return NodeResult::Err(MakeLoadError(path, "Category node must be a JSON object"));
        }

        auto node = HierarchyNode::MakeCategory(path, description, StringField(obj, "overview"));

        if (obj.contains("categories")) {
            const auto& cats = obj["categories"];
            if (!cats.is_object()) {
                return NodeResult::Err(MakeLoadError(path, "'categories' must be an object"));
            }
            for (const auto& [name, value] : cats.items()) {
                auto child_path = JoinPath(path, name);
                if (!IsValidName(name)) {
                    return NodeResult::Err(MakeLoadError(
                        child_path, "Invalid category name '" + name + "'"));
                }
                auto child = LoadCategoryEntry(name, value, child_path, dir, depth + 1);
                if (child.IsErr()) {
                    return child;
                }
                if (!node->AddChild(name, std::move(child).Value())) {
                    return NodeResult::Err(MakeLoadError(child_path, "Duplicate child name"));
                }
            }
        }

        if (obj.contains("tools")) {
            const auto& tools = obj["tools"];
            if (!tools.is_object()) {
                return NodeResult::Err(MakeLoadError(path, "'tools' must be an object"));
            }
            for (const auto& [name, value] : tools.items()) {
                auto tool_path = JoinPath(path, name);
                if (!IsValidName(name)) {
                    return NodeResult::Err(MakeLoadError(
                        tool_path, "Invalid tool name '" + name + "'"));
                }
                auto tool = ParseTool(name, value, tool_path);
                if (tool.IsErr()) {
                    return tool;
                }
                if (!node->AddChild(name, std::move(tool).Value())) {
                    return NodeResult::Err(MakeLoadError(
                        tool_path, "Name used by both a category and a tool"));
                }
                ++tool_count_;
            }
        }

        return NodeResult::Ok(std::move(node));
    }

    [[nodiscard]] std::size_t ToolCount() const noexcept { return tool_count_; }

private:
    NodeResult LoadCategoryEntry(const std::string& name,
                                 const nlohmann::json& value,
                                 const std::string& path,
                                 const std::optional<fs::path>& dir,
                                 int depth) {
        if (value.is_object()) {
            return ParseCategory(value, path, StringField(value, "description"), dir, depth);
        }
        if (!value.is_string()) {
            return NodeResult::Err(MakeLoadError(
                path, "Category entry must be an object or a description string"));
        }
        if (!dir.has_value()) {
            return NodeResult::Err(MakeLoadError(
                path, "Category '" + name + "' refers to a file but no directory is known"));
        }

        auto child_dir = *dir / name;
        auto file = child_dir / (name + ".json");
        auto json = ReadJsonFile(file);
        if (json.IsErr()) {
            return NodeResult::Err(std::move(json).Error());
        }
        // The referencing file's description wins; the child's own is a fallback.
        auto description = value.get<std::string>();
        if (description.empty()) {
            description = StringField(json.Value(), "description");
        }
        return ParseCategory(json.Value(), path, description, child_dir, depth);
    }

    NodeResult ParseTool(const std::string& name,
                         const nlohmann::json& value,
                         const std::string& path) {
        if (!value.is_object()) {
            return NodeResult::Err(MakeLoadError(path, "Tool entry must be a JSON object"));
        }
        ToolBinding binding;
        binding.server = StringField(value, "server");
        if (binding.server.empty()) {
            return NodeResult::Err(MakeLoadError(path, "Tool is missing 'server'"));
        }
        binding.native_tool_id = StringField(value, "maps_to");
        if (binding.native_tool_id.empty()) {
            binding.native_tool_id = name;
        }
        // Crawlers copy the backend's tools/list entry, which uses camelCase.
        for (const char* key : {"input_schema", "inputSchema"}) {
            if (value.contains(key)) {
                if (!value[key].is_object()) {
                    return NodeResult::Err(MakeLoadError(
                        path, std::string("'") + key + "' must be an object"));
                }
                binding.input_schema = value[key];
                break;
            }
        }
        return NodeResult::Ok(
            HierarchyNode::MakeTool(path, StringField(value, "description"), std::move(binding)));
    }

    std::size_t tool_count_ = 0;
};

void CollectServers(const HierarchyNode& node, std::set<std::string>& out) {
    if (node.IsTool()) {
        out.insert(node.Binding().server);
        return;
    }
    for (const auto& [_, child] : node.ChildNodes()) {
        CollectServers(*child, out);
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
Result<HierarchyStore, Error> HierarchyStore::FromJson(const nlohmann::json& root) {
    Loader loader;
    auto node = loader.ParseCategory(root, "", StringField(root, "description"),
                                     std::nullopt, 0);
    if (node.IsErr()) {
        return Result<HierarchyStore, Error>::Err(std::move(node).Error());
    }
    return Result<HierarchyStore, Error>::Ok(
        HierarchyStore(std::move(node).Value(), loader.ToolCount()));
}

Result<HierarchyStore, Error> HierarchyStore::Load(const std::string& path) {
    std::error_code ec;
    fs::path input(path);
    fs::path file = input;
    if (fs::is_directory(input, ec)) {
        file = input / kRootFile;
    } else if (!fs::exists(input, ec)) {
        return Result<HierarchyStore, Error>::Err(
            MakeLoadError(path, "Hierarchy path does not exist"));
    }

    auto json = ReadJsonFile(file);
    if (json.IsErr()) {
        return Result<HierarchyStore, Error>::Err(std::move(json).Error());
    }

    auto dir = file.parent_path();
    Loader loader;
    auto node = loader.ParseCategory(json.Value(), "", StringField(json.Value(), "description"),
                                     dir, 0);
    if (node.IsErr()) {
        return Result<HierarchyStore, Error>::Err(std::move(node).Error());
    }

    LogInfo(kComponent, "Loaded hierarchy from " + file.string() + " (" +
                            std::to_string(loader.ToolCount()) + " tools)");
    return Result<HierarchyStore, Error>::Ok(
        HierarchyStore(std::move(node).Value(), loader.ToolCount()));
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------
Result<const HierarchyNode*, Error> HierarchyStore::Lookup(std::string_view path) const {
    using R = Result<const HierarchyNode*, Error>;
    const HierarchyNode* node = root_.get();
    if (path.empty()) {
        return R::Ok(node);
    }

    std::string walked;
    std::size_t start = 0;
    for (;;) {
        auto end = path.find(kPathSeparator, start);
        auto segment = std::string(path.substr(start, end == std::string_view::npos
                                                          ? std::string_view::npos
                                                          : end - start));
        if (segment.empty()) {
            return R::Err(Error::Make(ErrorCategory::PathNotFound, "Lookup",
                                      std::string(path), "Empty path segment"));
        }
        const HierarchyNode* child = node->IsCategory() ? node->FindChild(segment) : nullptr;
        if (child == nullptr) {
            auto where = walked.empty() ? std::string("root") : "'" + walked + "'";
            return R::Err(Error::Make(ErrorCategory::PathNotFound, "Lookup",
                                      std::string(path),
                                      "No entry '" + segment + "' under " + where));
        }
        node = child;
        walked = JoinPath(walked, segment);
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return R::Ok(node);
}

Result<CategoryListing, Error> HierarchyStore::ListChildren(std::string_view path) const {
    using R = Result<CategoryListing, Error>;
    auto found = Lookup(path);
    if (found.IsErr()) {
        return R::Err(std::move(found).Error());
    }
    const HierarchyNode* node = found.Value();
    if (!node->IsCategory()) {
        return R::Err(Error::Make(ErrorCategory::NotACategory, "ListChildren",
                                  std::string(path),
                                  "Path names a tool, not a category"));
    }

    CategoryListing listing;
    listing.path = node->Path();
    listing.overview = node->Overview();
    for (const auto& [name, child] : node->ChildNodes()) {
        if (child->IsCategory()) {
            listing.categories.emplace(name, child->Description());
        } else {
            listing.tools.emplace(name, child->Description());
            listing.schemas.emplace(name, child->Binding().input_schema);
        }
    }
    return R::Ok(std::move(listing));
}

std::vector<std::string> HierarchyStore::ReferencedServers() const {
    std::set<std::string> servers;
    CollectServers(*root_, servers);
    return {servers.begin(), servers.end()};
}

} // namespace lazymcp
