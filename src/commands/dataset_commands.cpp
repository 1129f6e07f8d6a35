/// @file dataset_commands.cpp
/// @brief Dataset creation and shape-changing commands

#include "commands/dataset_commands.h"

#include <filesystem>

#include <absl/strings/str_cat.h>

#include "commands/command_support.h"
#include "common/error.h"
#include "common/logging.h"
#include "model/item.h"
#include "services/csv_reader.h"

namespace plotwise::commands {

namespace et = events::event_types;

namespace {

absl::Status NeverExecuted(std::string_view description) {
    return MakeError(ErrorCode::kInvalidState,
                     absl::StrCat("'", description, "' has not been executed"));
}

}  // namespace

// ============================================================================
// AddColumnCommand
// ============================================================================

AddColumnCommand::AddColumnCommand(state::AppState& state,
                                   std::string dataset_id,
                                   std::string column_name,
                                   std::optional<model::Value> default_value)
    : state_(state),
      dataset_id_(std::move(dataset_id)),
      column_name_(std::move(column_name)),
      requested_default_(std::move(default_value)) {}

absl::Status AddColumnCommand::Execute() {
    PLOTWISE_ASSIGN_OR_RETURN(model::Dataset * dataset, ResolveDataset(state_, dataset_id_));
    const model::Table& table = dataset->data();

    if (table.Empty()) {
        PLOTWISE_LOG_WARN("Add column: dataset '{}' is empty", dataset->name());
        return InvalidInputError("Cannot add column to empty dataset");
    }
    if (column_name_.empty()) {
        return InvalidInputError("Column name must not be empty");
    }
    if (table.HasColumn(column_name_)) {
        PLOTWISE_LOG_WARN("Add column: '{}' already exists in '{}'", column_name_,
                          dataset->name());
        return MakeError(ErrorCode::kDuplicateName,
                         absl::StrCat("Column '", column_name_, "' already exists"));
    }

    if (requested_default_.has_value()) {
        applied_default_ = *requested_default_;
    } else if (table.HasNumericColumn()) {
        applied_default_ = int64_t{0};
    } else {
        applied_default_ = std::string();
    }

    snapshot_.Capture(table);

    model::Table updated = table;
    PLOTWISE_RETURN_IF_ERROR(updated.AddColumn(model::Column{
        .name = column_name_,
        .dtype = model::InferDataType(applied_default_),
        .values = std::vector<model::Value>(table.RowCount(), applied_default_),
    }));
    dataset->SetData(std::move(updated));

    EmitDatasetEvent(state_, et::kDatasetColumnAdded, *dataset,
                     {{"column_name", column_name_},
                      {"default_value", model::ValueToJson(applied_default_)}});
    PLOTWISE_LOG_INFO("Added column '{}' to dataset '{}' ({})", column_name_, dataset->name(),
                      dataset_id_);
    return absl::OkStatus();
}

absl::Status AddColumnCommand::Undo() {
    if (!snapshot_.captured()) {
        return NeverExecuted(Description());
    }
    PLOTWISE_ASSIGN_OR_RETURN(model::Dataset * dataset, ResolveDataset(state_, dataset_id_));
    dataset->SetData(snapshot_.table());

    EmitDatasetEvent(state_, et::kDatasetColumnRemoved, *dataset,
                     {{"column_name", column_name_}});
    PLOTWISE_LOG_INFO("Removed column '{}' from dataset '{}'", column_name_, dataset->name());
    return absl::OkStatus();
}

absl::Status AddColumnCommand::Redo() {
    return Execute();
}

std::string AddColumnCommand::Description() const {
    return absl::StrCat("Add column '", column_name_, "' to dataset");
}

// ============================================================================
// AddRowCommand
// ============================================================================

AddRowCommand::AddRowCommand(state::AppState& state,
                             std::string dataset_id,
                             std::optional<size_t> position)
    : state_(state), dataset_id_(std::move(dataset_id)), position_(position) {}

absl::Status AddRowCommand::Execute() {
    PLOTWISE_ASSIGN_OR_RETURN(model::Dataset * dataset, ResolveDataset(state_, dataset_id_));
    const model::Table& table = dataset->data();

    if (table.ColumnCount() == 0) {
        PLOTWISE_LOG_WARN("Add row: dataset '{}' has no columns", dataset->name());
        return InvalidInputError("Cannot add row to dataset without columns");
    }

    size_t rows = table.RowCount();
    size_t position = (position_.has_value() && *position_ < rows) ? *position_ : rows;

    std::vector<model::Value> row;
    row.reserve(table.ColumnCount());
    for (const auto& column : table.Columns()) {
        row.push_back(model::DefaultValueFor(column.dtype));
    }

    snapshot_.Capture(table);

    model::Table updated = table;
    PLOTWISE_RETURN_IF_ERROR(updated.InsertRow(position, std::move(row)));
    dataset->SetData(std::move(updated));
    inserted_at_ = position;

    EmitDatasetEvent(state_, et::kDatasetRowAdded, *dataset, {{"row_position", position}});
    PLOTWISE_LOG_INFO("Inserted row {} into dataset '{}'", position, dataset->name());
    return absl::OkStatus();
}

absl::Status AddRowCommand::Undo() {
    if (!snapshot_.captured()) {
        return NeverExecuted(Description());
    }
    PLOTWISE_ASSIGN_OR_RETURN(model::Dataset * dataset, ResolveDataset(state_, dataset_id_));
    dataset->SetData(snapshot_.table());

    EmitDatasetEvent(state_, et::kDatasetRowRemoved, *dataset,
                     {{"row_position", inserted_at_.value_or(0)}});
    return absl::OkStatus();
}

absl::Status AddRowCommand::Redo() {
    return Execute();
}

std::string AddRowCommand::Description() const {
    if (position_.has_value()) {
        return absl::StrCat("Insert row at ", *position_, " in dataset");
    }
    return "Add row to dataset";
}

// ============================================================================
// CreateEmptyDatasetCommand
// ============================================================================

CreateEmptyDatasetCommand::CreateEmptyDatasetCommand(state::AppState& state,
                                                     std::string name,
                                                     std::optional<std::string> folder_id)
    : state_(state), name_(std::move(name)), folder_id_(std::move(folder_id)) {}

absl::StatusOr<model::Table> CreateEmptyDatasetCommand::EmptyTable() {
    model::Table table;
    for (int i = 1; i <= 3; ++i) {
        PLOTWISE_RETURN_IF_ERROR(table.AddColumn(model::Column{
            .name = absl::StrCat("Column", i),
            .dtype = model::DataType::kString,
            .values = {model::Value{std::string()}},
        }));
    }
    return table;
}

absl::Status CreateEmptyDatasetCommand::Execute() {
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    if (name_.empty()) {
        return InvalidInputError("Dataset name must not be empty");
    }

    PLOTWISE_ASSIGN_OR_RETURN(model::Table table, EmptyTable());
    auto dataset = std::make_unique<model::Dataset>(name_, std::move(table));
    std::string id = dataset->id();
    std::string parent_id = ResolveFolderId(*project, folder_id_.value_or(""));

    PLOTWISE_ASSIGN_OR_RETURN(model::Item * added,
                              project->AddItem(std::move(dataset), parent_id));
    dataset_id_ = std::move(id);

    EmitDatasetEvent(state_, et::kDatasetCreated, static_cast<model::Dataset&>(*added),
                     {{"parent_id", parent_id}});
    PLOTWISE_LOG_INFO("Created dataset '{}' ({})", name_, dataset_id_);
    return absl::OkStatus();
}

absl::Status CreateEmptyDatasetCommand::Undo() {
    if (dataset_id_.empty()) {
        return NeverExecuted(Description());
    }
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    PLOTWISE_RETURN_IF_ERROR(detached_.Detach(*project, dataset_id_));

    EmitItemEvent(state_, et::kDatasetRemoved, *detached_.item());
    return absl::OkStatus();
}

absl::Status CreateEmptyDatasetCommand::Redo() {
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    PLOTWISE_ASSIGN_OR_RETURN(model::Item * item, detached_.Reattach(*project));

    EmitDatasetEvent(state_, et::kDatasetCreated, static_cast<model::Dataset&>(*item),
                     {{"parent_id", item->parent_id()}});
    return absl::OkStatus();
}

std::string CreateEmptyDatasetCommand::Description() const {
    return absl::StrCat("Create dataset '", name_, "'");
}

// ============================================================================
// ImportCsvCommand
// ============================================================================

ImportCsvCommand::ImportCsvCommand(state::AppState& state,
                                   std::string file_path,
                                   std::optional<std::string> folder_id)
    : state_(state), file_path_(std::move(file_path)), folder_id_(std::move(folder_id)) {}

absl::Status ImportCsvCommand::Execute() {
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));

    services::CsvReader reader;
    PLOTWISE_ASSIGN_OR_RETURN(model::Table table, reader.Read(file_path_));

    std::string name = std::filesystem::path(file_path_).stem().string();
    auto dataset = std::make_unique<model::Dataset>(name, std::move(table));
    dataset->set_source_file(file_path_);
    std::string id = dataset->id();
    std::string parent_id = ResolveFolderId(*project, folder_id_.value_or(""));

    PLOTWISE_ASSIGN_OR_RETURN(model::Item * added,
                              project->AddItem(std::move(dataset), parent_id));
    dataset_id_ = std::move(id);

    const auto& imported = static_cast<model::Dataset&>(*added);
    EmitDatasetEvent(state_, et::kDatasetImported, imported,
                     {{"file_path", file_path_},
                      {"rows", imported.data().RowCount()},
                      {"columns", imported.data().ColumnCount()}});
    PLOTWISE_LOG_INFO("Imported '{}' as dataset '{}' ({} rows)", file_path_, name,
                      imported.data().RowCount());
    return absl::OkStatus();
}

absl::Status ImportCsvCommand::Undo() {
    if (dataset_id_.empty()) {
        return NeverExecuted(Description());
    }
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    PLOTWISE_RETURN_IF_ERROR(detached_.Detach(*project, dataset_id_));

    EmitItemEvent(state_, et::kDatasetRemoved, *detached_.item());
    return absl::OkStatus();
}

absl::Status ImportCsvCommand::Redo() {
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));
    PLOTWISE_ASSIGN_OR_RETURN(model::Item * item, detached_.Reattach(*project));

    EmitDatasetEvent(state_, et::kDatasetImported, static_cast<model::Dataset&>(*item),
                     {{"file_path", file_path_}});
    return absl::OkStatus();
}

std::string ImportCsvCommand::Description() const {
    return absl::StrCat("Import '", std::filesystem::path(file_path_).filename().string(), "'");
}

}  // namespace plotwise::commands
