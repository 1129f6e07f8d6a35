/// @file project.cpp
/// @brief Project tree implementation

#include "model/project.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace plotwise::model {

using json = nlohmann::json;

Project::Project(std::string name, std::string description)
    : name_(std::move(name)),
      description_(std::move(description)),
      root_(std::make_unique<Folder>("Root")) {
    index_[root_->id()] = root_.get();
}

Item* Project::FindItem(std::string_view id) {
    auto it = index_.find(std::string(id));
    return it == index_.end() ? nullptr : it->second;
}

const Item* Project::FindItem(std::string_view id) const {
    auto it = index_.find(std::string(id));
    return it == index_.end() ? nullptr : it->second;
}

absl::StatusOr<Item*> Project::GetItem(std::string_view id) {
    Item* item = FindItem(id);
    if (item == nullptr) {
        return absl::NotFoundError(absl::StrCat("Item '", id, "' not found"));
    }
    return item;
}

absl::StatusOr<Dataset*> Project::GetDataset(std::string_view id) {
    Item* item = FindItem(id);
    if (item == nullptr) {
        return absl::NotFoundError(absl::StrCat("Dataset '", id, "' not found"));
    }
    if (item->Type() != ItemType::kDataset) {
        return absl::NotFoundError(absl::StrCat("Item '", id, "' is not a dataset"));
    }
    return static_cast<Dataset*>(item);
}

std::vector<Item*> Project::GetChildren(std::string_view id) const {
    std::vector<Item*> result;
    const Item* item = id.empty() ? root_.get() : FindItem(id);
    if (item == nullptr || item->Type() != ItemType::kFolder) {
        return result;
    }
    for (const auto& child : static_cast<const Folder*>(item)->children()) {
        result.push_back(child.get());
    }
    return result;
}

Folder* Project::ResolveFolder(std::string_view id, absl::Status* error) {
    if (id.empty()) {
        return root_.get();
    }
    Item* item = FindItem(id);
    if (item == nullptr) {
        *error = absl::NotFoundError(absl::StrCat("Parent folder '", id, "' not found"));
        return nullptr;
    }
    if (item->Type() != ItemType::kFolder) {
        *error = absl::InvalidArgumentError(
            absl::StrCat("Parent '", id, "' is not a folder"));
        return nullptr;
    }
    return static_cast<Folder*>(item);
}

void Project::IndexSubtree(Item* item) {
    ForEachInSubtree(item, [this](Item* node) { index_[node->id()] = node; });
}

void Project::UnindexSubtree(Item* item) {
    ForEachInSubtree(item, [this](Item* node) { index_.erase(node->id()); });
}

absl::Status Project::CanAddItem(Item& item, std::string_view parent_id) {
    absl::Status error;
    if (ResolveFolder(parent_id, &error) == nullptr) {
        return error;
    }

    std::string duplicate;
    ForEachInSubtree(&item, [this, &duplicate](Item* node) {
        if (duplicate.empty() && index_.count(node->id()) > 0) {
            duplicate = node->id();
        }
    });
    if (!duplicate.empty()) {
        return MakeError(ErrorCode::kDuplicateId,
                         absl::StrCat("Item id '", duplicate, "' already exists in project"));
    }
    return absl::OkStatus();
}

absl::StatusOr<Item*> Project::AddItem(std::unique_ptr<Item> item,
                                       std::string_view parent_id,
                                       std::optional<size_t> position) {
    if (!item) {
        return absl::InvalidArgumentError("Cannot add a null item");
    }
    PLOTWISE_RETURN_IF_ERROR(CanAddItem(*item, parent_id));

    absl::Status error;
    Folder* parent = ResolveFolder(parent_id, &error);
    Item* added = parent->InsertChild(std::move(item), position);
    IndexSubtree(added);
    return added;
}

absl::StatusOr<std::unique_ptr<Item>> Project::RemoveItem(std::string_view id) {
    if (id == root_->id()) {
        return absl::InvalidArgumentError("Cannot remove the project root");
    }
    Item* item = FindItem(id);
    if (item == nullptr) {
        return absl::NotFoundError(absl::StrCat("Item '", id, "' not found"));
    }

    Item* parent = FindItem(item->parent_id());
    if (parent == nullptr || parent->Type() != ItemType::kFolder) {
        return absl::InternalError(
            absl::StrCat("Item '", id, "' has no parent folder in the index"));
    }

    std::unique_ptr<Item> detached = static_cast<Folder*>(parent)->DetachChild(id);
    if (!detached) {
        return absl::InternalError(
            absl::StrCat("Item '", id, "' is missing from its parent folder"));
    }
    UnindexSubtree(detached.get());
    return detached;
}

absl::Status Project::MoveItem(std::string_view id,
                               std::string_view new_parent_id,
                               std::optional<size_t> position) {
    if (id == root_->id()) {
        return absl::InvalidArgumentError("Cannot move the project root");
    }
    Item* item = FindItem(id);
    if (item == nullptr) {
        return absl::NotFoundError(absl::StrCat("Item '", id, "' not found"));
    }

    absl::Status error;
    Folder* target = ResolveFolder(new_parent_id, &error);
    if (target == nullptr) {
        return error;
    }

    // Walk up from the target; meeting the item means the move would create a cycle
    for (const Item* node = target; node != nullptr; node = FindItem(node->parent_id())) {
        if (node == item) {
            return absl::InvalidArgumentError(absl::StrCat(
                "Cannot move '", item->name(), "' into itself or one of its descendants"));
        }
    }

    auto detached = RemoveItem(id);
    if (!detached.ok()) {
        return detached.status();
    }
    auto added = AddItem(std::move(*detached), target->id(), position);
    return added.status();
}

std::optional<size_t> Project::IndexOf(std::string_view id) const {
    const Item* item = FindItem(id);
    if (item == nullptr) {
        return std::nullopt;
    }
    const Item* parent = FindItem(item->parent_id());
    if (parent == nullptr || parent->Type() != ItemType::kFolder) {
        return std::nullopt;
    }
    return static_cast<const Folder*>(parent)->IndexOf(id);
}

std::vector<Item*> Project::AllItems() const {
    std::vector<Item*> items;
    items.reserve(index_.size());
    for (const auto& child : root_->children()) {
        ForEachInSubtree(child.get(), [&items](Item* node) { items.push_back(node); });
    }
    return items;
}

json Project::ToJson() const {
    json items = json::array();
    for (const auto& child : root_->children()) {
        items.push_back(child->ToJson());
    }
    return json{
        {"name", name_},
        {"description", description_},
        {"version", version_},
        {"metadata", metadata_},
        {"root_id", root_->id()},
        {"items", std::move(items)},
    };
}

absl::StatusOr<std::unique_ptr<Project>> Project::FromJson(const json& j) {
    if (!j.is_object()) {
        return absl::InvalidArgumentError("Project JSON must be an object");
    }
    if (!j.contains("name") || !j["name"].is_string()) {
        return absl::InvalidArgumentError("Project JSON is missing 'name'");
    }

    PLOTWISE_ASSIGN_OR_RETURN(std::string description, OptionalString(j, "description"));
    auto project = std::make_unique<Project>(j["name"].get<std::string>(),
                                             std::move(description));
    if (j.contains("version") && j["version"].is_string()) {
        project->version_ = j["version"].get<std::string>();
    }
    if (j.contains("metadata") && j["metadata"].is_object()) {
        project->metadata_ = j["metadata"];
    }
    if (j.contains("root_id") && j["root_id"].is_string() &&
        !j["root_id"].get<std::string>().empty()) {
        project->index_.clear();
        project->root_ = std::make_unique<Folder>("Root", j["root_id"].get<std::string>());
        project->index_[project->root_->id()] = project->root_.get();
    }

    if (j.contains("items")) {
        if (!j["items"].is_array()) {
            return absl::InvalidArgumentError("Project 'items' must be an array");
        }
        for (const auto& item_json : j["items"]) {
            auto item = ItemFromJson(item_json);
            if (!item.ok()) {
                return item.status();
            }
            auto added = project->AddItem(std::move(*item));
            if (!added.ok()) {
                return absl::InvalidArgumentError(added.status().message());
            }
        }
    }
    return project;
}

}  // namespace plotwise::model
