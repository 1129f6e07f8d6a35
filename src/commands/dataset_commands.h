#pragma once

/// @file dataset_commands.h
/// @brief Commands that create datasets or change a table's shape

#include <optional>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "commands/command.h"
#include "commands/snapshot.h"
#include "model/table.h"
#include "state/app_state.h"

namespace plotwise::commands {

/// @brief Append a column filled with one value to every row
///
/// Without an explicit default the column is filled with 0 when the table
/// already has a numeric column and with "" otherwise. Undo restores the
/// whole pre-mutation table; redo applies the change again.
class AddColumnCommand : public Command {
public:
    AddColumnCommand(state::AppState& state,
                     std::string dataset_id,
                     std::string column_name,
                     std::optional<model::Value> default_value = std::nullopt);

    absl::Status Execute() override;
    absl::Status Undo() override;
    absl::Status Redo() override;
    std::string Description() const override;

    /// @brief Value the column was filled with on the last execute
    const model::Value& applied_default() const { return applied_default_; }

private:
    state::AppState& state_;
    std::string dataset_id_;
    std::string column_name_;
    std::optional<model::Value> requested_default_;
    model::Value applied_default_;
    TableSnapshot snapshot_;
};

/// @brief Insert a row of per-type defaults
///
/// A missing position, or one at or past the row count, appends.
class AddRowCommand : public Command {
public:
    AddRowCommand(state::AppState& state,
                  std::string dataset_id,
                  std::optional<size_t> position = std::nullopt);

    absl::Status Execute() override;
    absl::Status Undo() override;
    absl::Status Redo() override;
    std::string Description() const override;

    /// @brief Row index used by the last execute
    std::optional<size_t> inserted_at() const { return inserted_at_; }

private:
    state::AppState& state_;
    std::string dataset_id_;
    std::optional<size_t> position_;
    std::optional<size_t> inserted_at_;
    TableSnapshot snapshot_;
};

/// @brief Create a dataset with three empty string columns and one row
class CreateEmptyDatasetCommand : public Command {
public:
    CreateEmptyDatasetCommand(state::AppState& state,
                              std::string name,
                              std::optional<std::string> folder_id = std::nullopt);

    absl::Status Execute() override;
    absl::Status Undo() override;
    absl::Status Redo() override;
    std::string Description() const override;

    /// @brief Id of the created dataset (empty before execute)
    const std::string& dataset_id() const { return dataset_id_; }

    /// @brief Table a new empty dataset starts with: three string columns
    /// holding one blank row
    static absl::StatusOr<model::Table> EmptyTable();

private:
    state::AppState& state_;
    std::string name_;
    std::optional<std::string> folder_id_;
    std::string dataset_id_;
    DetachedItem detached_;
};

/// @brief Import a CSV file as a new dataset named after the file stem
class ImportCsvCommand : public Command {
public:
    ImportCsvCommand(state::AppState& state,
                     std::string file_path,
                     std::optional<std::string> folder_id = std::nullopt);

    absl::Status Execute() override;
    absl::Status Undo() override;
    absl::Status Redo() override;
    std::string Description() const override;

    const std::string& dataset_id() const { return dataset_id_; }

private:
    state::AppState& state_;
    std::string file_path_;
    std::optional<std::string> folder_id_;
    std::string dataset_id_;
    DetachedItem detached_;
};

}  // namespace plotwise::commands
