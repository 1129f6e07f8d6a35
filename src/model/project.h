#pragma once

/// @file project.h
/// @brief Project: rooted item tree with a flat id index

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "model/item.h"

namespace plotwise::model {

/// @brief A project owns a tree of items rooted at a folder
///
/// Invariants: ids are unique across the tree, every non-root item has
/// exactly one existing parent folder and the tree has no cycles. All
/// structural changes go through AddItem / RemoveItem / MoveItem so the flat
/// index stays in sync with the tree.
class Project {
public:
    static constexpr const char* kFormatVersion = "1.0";

    explicit Project(std::string name, std::string description = "");

    Project(const Project&) = delete;
    Project& operator=(const Project&) = delete;

    const std::string& name() const { return name_; }
    void set_name(std::string name) { name_ = std::move(name); }

    const std::string& description() const { return description_; }
    void set_description(std::string description) { description_ = std::move(description); }

    const std::string& version() const { return version_; }

    nlohmann::json& metadata() { return metadata_; }
    const nlohmann::json& metadata() const { return metadata_; }

    Folder& root() { return *root_; }
    const Folder& root() const { return *root_; }

    /// @brief Item by id, or nullptr
    Item* FindItem(std::string_view id);
    const Item* FindItem(std::string_view id) const;

    /// @brief Item by id; NotFound if absent
    absl::StatusOr<Item*> GetItem(std::string_view id);

    /// @brief Dataset by id; NotFound if absent or not a dataset
    absl::StatusOr<Dataset*> GetDataset(std::string_view id);

    /// @brief Direct children of a folder (empty for non-folders and unknown ids)
    std::vector<Item*> GetChildren(std::string_view id) const;

    /// @brief Attach an item (with its subtree) under parent_id
    ///
    /// An empty parent_id means the root. Fails with AlreadyExists if any id
    /// in the subtree is already present, NotFound for an unknown parent and
    /// InvalidArgument if the parent is not a folder.
    absl::StatusOr<Item*> AddItem(std::unique_ptr<Item> item,
                                  std::string_view parent_id = "",
                                  std::optional<size_t> position = std::nullopt);

    /// @brief The checks AddItem performs, without taking ownership
    absl::Status CanAddItem(Item& item, std::string_view parent_id = "");

    /// @brief Detach an item and its subtree, returning ownership
    absl::StatusOr<std::unique_ptr<Item>> RemoveItem(std::string_view id);

    /// @brief Move an item under another folder (empty id means the root)
    ///
    /// Rejects moving the root and moving a folder into its own subtree.
    absl::Status MoveItem(std::string_view id,
                          std::string_view new_parent_id,
                          std::optional<size_t> position = std::nullopt);

    /// @brief Position of an item within its parent
    std::optional<size_t> IndexOf(std::string_view id) const;

    /// @brief Every item except the root, depth-first in tree order
    std::vector<Item*> AllItems() const;

    /// @brief Number of items excluding the root
    size_t ItemCount() const { return index_.size() - 1; }

    nlohmann::json ToJson() const;
    static absl::StatusOr<std::unique_ptr<Project>> FromJson(const nlohmann::json& j);

private:
    Folder* ResolveFolder(std::string_view id, absl::Status* error);
    void IndexSubtree(Item* item);
    void UnindexSubtree(Item* item);

    std::string name_;
    std::string description_;
    std::string version_ = kFormatVersion;
    nlohmann::json metadata_ = nlohmann::json::object();

    std::unique_ptr<Folder> root_;
    std::unordered_map<std::string, Item*> index_;
};

/// @brief Visit every item of a subtree depth-first, parent before children
template <typename Fn>
void ForEachInSubtree(Item* item, Fn&& fn) {
    fn(item);
    if (item->Type() == ItemType::kFolder) {
        for (const auto& child : static_cast<Folder*>(item)->children()) {
            ForEachInSubtree(child.get(), fn);
        }
    }
}

}  // namespace plotwise::model
