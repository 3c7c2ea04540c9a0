#include "group_tree.hpp"

#include <filesystem>
#include <utility>

namespace pbxpatch::model {

namespace {

constexpr char kGroupTree[]  = "<group>";
constexpr char kSourceRoot[] = "SOURCE_ROOT";

std::string Join(const std::string& directory, const std::string& path) {
  if (path.empty()) return directory;
  auto joined = (std::filesystem::path(directory) / path).lexically_normal().generic_string();
  if (joined == ".") return {};
  if (!joined.empty() && joined.back() == '/') joined.pop_back();
  return joined;
}

} // namespace

GroupTree::GroupTree(const Descriptor& descriptor) : descriptor_(&descriptor) {
  const auto* main = descriptor.Groups().Find(descriptor.MainGroup());
  if (!main) return;

  // Depth-first, children in list order. A group listed twice keeps its first parent.
  std::vector<std::pair<const Group*, std::optional<std::string>>> stack;
  stack.emplace_back(main, Resolve(std::string(), main->source_tree, main->path));

  while (!stack.empty()) {
    auto [group, directory] = std::move(stack.back());
    stack.pop_back();
    if (directories_.contains(group->id)) continue;

    directories_.emplace(group->id, directory);
    order_.push_back(group->id);

    const auto& children = group->children.ids;
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      parents_.emplace(*it, group->id);
      const auto* child = descriptor.Groups().Find(*it);
      if (child && !directories_.contains(child->id)) stack.emplace_back(child, Resolve(directory, child->source_tree, child->path));
    }
  }
}

std::optional<std::string> GroupTree::Resolve(const std::optional<std::string>& parent_directory, const std::string& source_tree, const std::string& path) {
  if (source_tree == kGroupTree) {
    if (!parent_directory) return std::nullopt;
    return Join(*parent_directory, path);
  }
  if (source_tree == kSourceRoot) return Join(std::string(), path);
  return std::nullopt;
}

std::string GroupTree::RelativeTo(const std::string& path, const std::string& directory) {
  if (directory.empty()) return path;
  return std::filesystem::path(path).lexically_relative(directory).generic_string();
}

std::optional<std::string> GroupTree::DirectoryOf(const ObjectId& group) const {
  auto it = directories_.find(group);
  if (it == directories_.end()) return std::nullopt;
  return it->second;
}

const Group* GroupTree::FindByDirectory(std::string_view directory) const {
  for (const auto& id : order_) {
    const auto& resolved = directories_.at(id);
    if (!resolved || *resolved != directory) continue;
    const auto* group = descriptor_->Groups().Find(id);
    if (group && group->isa == "PBXGroup") return group;
  }
  return nullptr;
}

const Group* GroupTree::ParentOf(const ObjectId& id) const {
  auto it = parents_.find(id);
  return it == parents_.end() ? nullptr : descriptor_->Groups().Find(it->second);
}

std::optional<std::string> GroupTree::Locate(const FileReference& ref) const {
  std::optional<std::string> parent_directory;
  if (const auto* parent = ParentOf(ref.id)) parent_directory = DirectoryOf(parent->id);
  return Resolve(parent_directory, ref.source_tree, ref.path);
}

} // namespace pbxpatch::model
