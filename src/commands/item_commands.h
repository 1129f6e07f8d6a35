#pragma once

/// @file item_commands.h
/// @brief Commands that edit the project tree: folders, notes, rename, delete, move

#include <optional>
#include <string>

#include <absl/status/status.h>

#include "commands/command.h"
#include "commands/snapshot.h"
#include "state/app_state.h"

namespace plotwise::commands {

/// @brief Create a folder under parent_id (the root when absent or "root")
class CreateFolderCommand : public Command {
public:
    CreateFolderCommand(state::AppState& state,
                        std::string name,
                        std::optional<std::string> parent_id = std::nullopt);

    absl::Status Execute() override;
    absl::Status Undo() override;
    absl::Status Redo() override;
    std::string Description() const override;

    const std::string& folder_id() const { return folder_id_; }

private:
    state::AppState& state_;
    std::string name_;
    std::optional<std::string> parent_id_;
    std::string folder_id_;
    DetachedItem detached_;
};

/// @brief Create a note with initial content
class CreateNoteCommand : public Command {
public:
    CreateNoteCommand(state::AppState& state,
                      std::string name,
                      std::string content = "",
                      std::optional<std::string> parent_id = std::nullopt);

    absl::Status Execute() override;
    absl::Status Undo() override;
    absl::Status Redo() override;
    std::string Description() const override;

    const std::string& note_id() const { return note_id_; }

private:
    state::AppState& state_;
    std::string name_;
    std::string content_;
    std::optional<std::string> parent_id_;
    std::string note_id_;
    DetachedItem detached_;
};

/// @brief Create a line chart plotting a dataset
///
/// The default series plots the second column against the first; a dataset
/// with a single column is plotted against its row index (empty x_column).
/// A dataset without columns gets a chart with no series.
class CreateChartCommand : public Command {
public:
    CreateChartCommand(state::AppState& state,
                       std::string dataset_id,
                       std::optional<std::string> name = std::nullopt,
                       std::optional<std::string> parent_id = std::nullopt);

    absl::Status Execute() override;
    absl::Status Undo() override;
    absl::Status Redo() override;
    std::string Description() const override;

    const std::string& chart_id() const { return chart_id_; }

private:
    state::AppState& state_;
    std::string dataset_id_;
    std::optional<std::string> name_;
    std::optional<std::string> parent_id_;
    std::string dataset_name_;
    std::string chart_id_;
    DetachedItem detached_;
};

/// @brief Replace a note's content
class EditNoteCommand : public Command {
public:
    EditNoteCommand(state::AppState& state, std::string note_id, std::string new_content);

    absl::Status Execute() override;
    absl::Status Undo() override;
    absl::Status Redo() override;
    std::string Description() const override;

private:
    absl::Status Apply(const std::string& content, const char* event_type);

    state::AppState& state_;
    std::string note_id_;
    std::string new_content_;
    std::optional<std::string> old_content_;
    std::string note_name_;
};

/// @brief Rename any item except the root
class RenameItemCommand : public Command {
public:
    RenameItemCommand(state::AppState& state, std::string item_id, std::string new_name);

    absl::Status Execute() override;
    absl::Status Undo() override;
    absl::Status Redo() override;
    std::string Description() const override;

private:
    absl::Status Apply(const std::string& from, const std::string& to);

    state::AppState& state_;
    std::string item_id_;
    std::string new_name_;
    std::optional<std::string> old_name_;
};

/// @brief Remove an item and its subtree, remembering where it was
///
/// Undo puts the same instance back at the same parent and position, so ids
/// of everything in the subtree are preserved.
class DeleteItemCommand : public Command {
public:
    DeleteItemCommand(state::AppState& state, std::string item_id);

    absl::Status Execute() override;
    absl::Status Undo() override;
    absl::Status Redo() override;
    std::string Description() const override;

private:
    state::AppState& state_;
    std::string item_id_;
    std::string item_name_;
    DetachedItem detached_;
};

/// @brief Move an item into another folder ("root" or empty means the root)
class MoveItemCommand : public Command {
public:
    MoveItemCommand(state::AppState& state,
                    std::string item_id,
                    std::string target_folder_id,
                    std::optional<size_t> position = std::nullopt);

    absl::Status Execute() override;
    absl::Status Undo() override;
    absl::Status Redo() override;
    std::string Description() const override;

private:
    state::AppState& state_;
    std::string item_id_;
    std::string target_folder_id_;
    std::optional<size_t> position_;
    std::string item_name_;
    std::optional<std::string> source_parent_id_;
    std::optional<size_t> source_position_;
};

}  // namespace plotwise::commands
