/// @file item_commands.cpp
/// @brief Project tree command implementations

#include "commands/item_commands.h"

#include <vector>

#include <absl/strings/str_cat.h>

#include "commands/command_support.h"
#include "common/error.h"
#include "common/logging.h"
#include "model/item.h"

namespace plotwise::commands {

namespace et = events::event_types;

namespace {

absl::Status NeverExecuted(std::string_view description) {
    return MakeError(ErrorCode::kInvalidState,
                     absl::StrCat("'", description, "' has not been executed"));
}

absl::Status RequireName(std::string_view name, std::string_view what) {
    if (name.empty()) {
        return InvalidInputError(absl::StrCat(what, " name must not be empty"));
    }
    return absl::OkStatus();
}

}  // namespace

// ============================================================================
// CreateFolderCommand
// ============================================================================

CreateFolderCommand::CreateFolderCommand(state::AppState& state,
                                         std::string name,
                                         std::optional<std::string> parent_id)
    : state_(state), name_(std::move(name)), parent_id_(std::move(parent_id)) {}

absl::Status CreateFolderCommand::Execute() {
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    PLOTWISE_RETURN_IF_ERROR(RequireName(name_, "Folder"));

    auto folder = std::make_unique<model::Folder>(name_);
    std::string id = folder->id();
    PLOTWISE_ASSIGN_OR_RETURN(
        model::Item * added,
        project->AddItem(std::move(folder), ResolveFolderId(*project, parent_id_.value_or(""))));
    folder_id_ = std::move(id);

    EmitItemEvent(state_, et::kFolderCreated, *added, {{"parent_id", added->parent_id()}});
    PLOTWISE_LOG_INFO("Created folder '{}' ({})", name_, folder_id_);
    return absl::OkStatus();
}

absl::Status CreateFolderCommand::Undo() {
    if (folder_id_.empty()) {
        return NeverExecuted(Description());
    }
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    PLOTWISE_RETURN_IF_ERROR(detached_.Detach(*project, folder_id_));
    EmitItemEvent(state_, et::kItemDeleted, *detached_.item());
    return absl::OkStatus();
}

absl::Status CreateFolderCommand::Redo() {
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    PLOTWISE_ASSIGN_OR_RETURN(model::Item * item, detached_.Reattach(*project));
    EmitItemEvent(state_, et::kFolderCreated, *item, {{"parent_id", item->parent_id()}});
    return absl::OkStatus();
}

std::string CreateFolderCommand::Description() const {
    return absl::StrCat("Create Folder '", name_, "'");
}

// ============================================================================
// CreateNoteCommand
// ============================================================================

CreateNoteCommand::CreateNoteCommand(state::AppState& state,
                                     std::string name,
                                     std::string content,
                                     std::optional<std::string> parent_id)
    : state_(state),
      name_(std::move(name)),
      content_(std::move(content)),
      parent_id_(std::move(parent_id)) {}

absl::Status CreateNoteCommand::Execute() {
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    PLOTWISE_RETURN_IF_ERROR(RequireName(name_, "Note"));

    auto note = std::make_unique<model::Note>(name_, content_);
    std::string id = note->id();
    PLOTWISE_ASSIGN_OR_RETURN(
        model::Item * added,
        project->AddItem(std::move(note), ResolveFolderId(*project, parent_id_.value_or(""))));
    note_id_ = std::move(id);

    EmitItemEvent(state_, et::kNoteCreated, *added, {{"parent_id", added->parent_id()}});
    PLOTWISE_LOG_INFO("Created note '{}' ({})", name_, note_id_);
    return absl::OkStatus();
}

absl::Status CreateNoteCommand::Undo() {
    if (note_id_.empty()) {
        return NeverExecuted(Description());
    }
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    PLOTWISE_RETURN_IF_ERROR(detached_.Detach(*project, note_id_));
    EmitItemEvent(state_, et::kItemDeleted, *detached_.item());
    return absl::OkStatus();
}

absl::Status CreateNoteCommand::Redo() {
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    PLOTWISE_ASSIGN_OR_RETURN(model::Item * item, detached_.Reattach(*project));
    EmitItemEvent(state_, et::kNoteCreated, *item, {{"parent_id", item->parent_id()}});
    return absl::OkStatus();
}

std::string CreateNoteCommand::Description() const {
    return absl::StrCat("Create Note '", name_, "'");
}

// ============================================================================
// CreateChartCommand
// ============================================================================

CreateChartCommand::CreateChartCommand(state::AppState& state,
                                       std::string dataset_id,
                                       std::optional<std::string> name,
                                       std::optional<std::string> parent_id)
    : state_(state),
      dataset_id_(std::move(dataset_id)),
      name_(std::move(name)),
      parent_id_(std::move(parent_id)) {}

absl::Status CreateChartCommand::Execute() {
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    PLOTWISE_ASSIGN_OR_RETURN(model::Dataset * dataset, ResolveDataset(state_, dataset_id_));
    dataset_name_ = dataset->name();

    std::string name = name_.value_or(absl::StrCat("Chart from ", dataset_name_));
    PLOTWISE_RETURN_IF_ERROR(RequireName(name, "Chart"));

    auto chart = std::make_unique<model::Chart>(std::move(name), "line");
    const std::vector<std::string> columns = dataset->data().ColumnNames();
    if (!columns.empty()) {
        const bool indexed = columns.size() == 1;
        const std::string& y_column = indexed ? columns[0] : columns[1];
        chart->AddSeries(model::ChartSeries{
            .dataset_id = dataset_id_,
            .x_column = indexed ? std::string() : columns[0],
            .y_column = y_column,
            .label = absl::StrCat(dataset_name_, ":", y_column),
        });
    }

    std::string id = chart->id();
    PLOTWISE_ASSIGN_OR_RETURN(
        model::Item * added,
        project->AddItem(std::move(chart), ResolveFolderId(*project, parent_id_.value_or(""))));
    chart_id_ = std::move(id);

    EmitItemEvent(state_, et::kChartCreated, *added,
                  {{"parent_id", added->parent_id()}, {"dataset_id", dataset_id_}});
    PLOTWISE_LOG_INFO("Created chart '{}' ({}) from dataset {}", added->name(), chart_id_,
                      dataset_id_);
    return absl::OkStatus();
}

absl::Status CreateChartCommand::Undo() {
    if (chart_id_.empty()) {
        return NeverExecuted(Description());
    }
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    PLOTWISE_RETURN_IF_ERROR(detached_.Detach(*project, chart_id_));
    EmitItemEvent(state_, et::kItemDeleted, *detached_.item());
    return absl::OkStatus();
}

absl::Status CreateChartCommand::Redo() {
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    PLOTWISE_ASSIGN_OR_RETURN(model::Item * item, detached_.Reattach(*project));
    EmitItemEvent(state_, et::kChartCreated, *item,
                  {{"parent_id", item->parent_id()}, {"dataset_id", dataset_id_}});
    return absl::OkStatus();
}

std::string CreateChartCommand::Description() const {
    return absl::StrCat("Create Chart from '",
                        dataset_name_.empty() ? dataset_id_ : dataset_name_, "'");
}

// ============================================================================
// EditNoteCommand
// ============================================================================

EditNoteCommand::EditNoteCommand(state::AppState& state,
                                 std::string note_id,
                                 std::string new_content)
    : state_(state), note_id_(std::move(note_id)), new_content_(std::move(new_content)) {}

absl::Status EditNoteCommand::Apply(const std::string& content, const char* event_type) {
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    PLOTWISE_ASSIGN_OR_RETURN(model::Item * item, project->GetItem(note_id_));
    if (item->Type() != model::ItemType::kNote) {
        return InvalidInputError(absl::StrCat("Item '", note_id_, "' is not a note"));
    }

    auto* note = static_cast<model::Note*>(item);
    if (!old_content_.has_value()) {
        old_content_ = note->content();
    }
    note_name_ = note->name();
    note->SetContent(content);

    EmitItemEvent(state_, event_type, *note, {{"content_length", content.size()}});
    return absl::OkStatus();
}

absl::Status EditNoteCommand::Execute() {
    return Apply(new_content_, et::kNoteEdited);
}

absl::Status EditNoteCommand::Undo() {
    if (!old_content_.has_value()) {
        return NeverExecuted(Description());
    }
    return Apply(*old_content_, et::kNoteEdited);
}

absl::Status EditNoteCommand::Redo() {
    return Apply(new_content_, et::kNoteEdited);
}

std::string EditNoteCommand::Description() const {
    if (note_name_.empty()) {
        return "Edit Note";
    }
    return absl::StrCat("Edit Note '", note_name_, "'");
}

// ============================================================================
// RenameItemCommand
// ============================================================================

RenameItemCommand::RenameItemCommand(state::AppState& state,
                                     std::string item_id,
                                     std::string new_name)
    : state_(state), item_id_(std::move(item_id)), new_name_(std::move(new_name)) {}

absl::Status RenameItemCommand::Apply(const std::string& from, const std::string& to) {
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    PLOTWISE_ASSIGN_OR_RETURN(model::Item * item, project->GetItem(item_id_));
    if (item == &project->root()) {
        return InvalidInputError("The project root cannot be renamed");
    }
    item->SetName(to);
    EmitItemEvent(state_, et::kItemRenamed, *item, {{"old_name", from}, {"new_name", to}});
    return absl::OkStatus();
}

absl::Status RenameItemCommand::Execute() {
    PLOTWISE_RETURN_IF_ERROR(RequireName(new_name_, "Item"));
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    PLOTWISE_ASSIGN_OR_RETURN(model::Item * item, project->GetItem(item_id_));

    std::string old_name = item->name();
    PLOTWISE_RETURN_IF_ERROR(Apply(old_name, new_name_));
    old_name_ = std::move(old_name);
    PLOTWISE_LOG_INFO("Renamed '{}' to '{}'", *old_name_, new_name_);
    return absl::OkStatus();
}

absl::Status RenameItemCommand::Undo() {
    if (!old_name_.has_value()) {
        return NeverExecuted(Description());
    }
    return Apply(new_name_, *old_name_);
}

absl::Status RenameItemCommand::Redo() {
    if (!old_name_.has_value()) {
        return NeverExecuted(Description());
    }
    return Apply(*old_name_, new_name_);
}

std::string RenameItemCommand::Description() const {
    return absl::StrCat("Rename to '", new_name_, "'");
}

// ============================================================================
// DeleteItemCommand
// ============================================================================

DeleteItemCommand::DeleteItemCommand(state::AppState& state, std::string item_id)
    : state_(state), item_id_(std::move(item_id)) {}

absl::Status DeleteItemCommand::Execute() {
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    if (item_id_ == project->root().id()) {
        return InvalidInputError("The project root cannot be deleted");
    }
    PLOTWISE_RETURN_IF_ERROR(detached_.Detach(*project, item_id_));

    const model::Item& item = *detached_.item();
    item_name_ = item.name();
    EmitItemEvent(state_, et::kItemDeleted, item,
                  {{"parent_id", detached_.parent_id()},
                   {"position", detached_.position().value_or(0)}});
    PLOTWISE_LOG_INFO("Deleted {}", item.DebugString());
    return absl::OkStatus();
}

absl::Status DeleteItemCommand::Undo() {
    if (!detached_.holding()) {
        return NeverExecuted(Description());
    }
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    PLOTWISE_ASSIGN_OR_RETURN(model::Item * item, detached_.Reattach(*project));

    EmitItemEvent(state_, et::kItemRestored, *item,
                  {{"parent_id", item->parent_id()},
                   {"position", project->IndexOf(item->id()).value_or(0)}});
    PLOTWISE_LOG_INFO("Restored {}", item->DebugString());
    return absl::OkStatus();
}

absl::Status DeleteItemCommand::Redo() {
    return Execute();
}

std::string DeleteItemCommand::Description() const {
    if (item_name_.empty()) {
        return "Delete Item";
    }
    return absl::StrCat("Delete '", item_name_, "'");
}

// ============================================================================
// MoveItemCommand
// ============================================================================

MoveItemCommand::MoveItemCommand(state::AppState& state,
                                 std::string item_id,
                                 std::string target_folder_id,
                                 std::optional<size_t> position)
    : state_(state),
      item_id_(std::move(item_id)),
      target_folder_id_(std::move(target_folder_id)),
      position_(position) {}

absl::Status MoveItemCommand::Execute() {
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    PLOTWISE_ASSIGN_OR_RETURN(model::Item * item, project->GetItem(item_id_));

    std::string from = item->parent_id();
    std::optional<size_t> from_position = project->IndexOf(item_id_);
    std::string to = ResolveFolderId(*project, target_folder_id_);

    PLOTWISE_RETURN_IF_ERROR(project->MoveItem(item_id_, to, position_));
    source_parent_id_ = from;
    source_position_ = from_position;
    item_name_ = item->name();

    EmitItemEvent(state_, et::kItemMoved, *item, {{"old_parent_id", from}, {"new_parent_id", to}});
    PLOTWISE_LOG_INFO("Moved '{}' from {} to {}", item_name_, from, to);
    return absl::OkStatus();
}

absl::Status MoveItemCommand::Undo() {
    if (!source_parent_id_.has_value()) {
        return NeverExecuted(Description());
    }
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    PLOTWISE_ASSIGN_OR_RETURN(model::Item * item, project->GetItem(item_id_));

    std::string from = item->parent_id();
    PLOTWISE_RETURN_IF_ERROR(project->MoveItem(item_id_, *source_parent_id_, source_position_));

    EmitItemEvent(state_, et::kItemMoved, *item,
                  {{"old_parent_id", from}, {"new_parent_id", *source_parent_id_}});
    return absl::OkStatus();
}

absl::Status MoveItemCommand::Redo() {
    return Execute();
}

std::string MoveItemCommand::Description() const {
    if (item_name_.empty()) {
        return "Move Item";
    }
    return absl::StrCat("Move '", item_name_, "'");
}

}  // namespace plotwise::commands
