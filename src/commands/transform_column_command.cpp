/// @file transform_column_command.cpp
/// @brief Column transform command implementation

#include "commands/transform_column_command.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "commands/command_support.h"
#include "common/error.h"
#include "common/logging.h"

namespace plotwise::commands {

namespace et = events::event_types;

namespace {

model::Value ConvertTo(const model::Value& value, model::DataType dtype) {
    if (model::IsMissing(value) || dtype != model::DataType::kFloat64) {
        return value;
    }
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? 1.0 : 0.0;
    }
    return value;
}

}  // namespace

absl::StatusOr<model::DataType> CommonDataType(const std::vector<model::Value>& values) {
    bool seen[4] = {false, false, false, false};
    for (const auto& value : values) {
        if (!model::IsMissing(value)) {
            seen[static_cast<int>(model::InferDataType(value))] = true;
        }
    }

    int kinds = 0;
    model::DataType only = model::DataType::kFloat64;
    for (int i = 0; i < 4; ++i) {
        if (seen[i]) {
            ++kinds;
            only = static_cast<model::DataType>(i);
        }
    }

    if (kinds == 0) {
        return model::DataType::kFloat64;
    }
    if (kinds == 1) {
        return only;
    }
    if (seen[static_cast<int>(model::DataType::kString)]) {
        return InvalidInputError("Transform produced a mix of text and numeric values");
    }
    return model::DataType::kFloat64;
}

TransformColumnCommand::TransformColumnCommand(state::AppState& state,
                                               std::string dataset_id,
                                               TransformRequest request,
                                               const ExpressionEvaluator& evaluator)
    : state_(state),
      dataset_id_(std::move(dataset_id)),
      request_(std::move(request)),
      evaluator_(evaluator) {}

absl::Status TransformColumnCommand::Validate(const model::Table& table) const {
    if (request_.new_column_name.empty()) {
        return InvalidInputError("New column name must not be empty");
    }
    if (request_.expression.empty()) {
        return InvalidInputError("Transform expression must not be empty");
    }
    if (request_.source_columns.empty()) {
        return InvalidInputError("At least one source column is required");
    }
    for (const auto& name : request_.source_columns) {
        if (!table.HasColumn(name)) {
            return NotFoundError(absl::StrCat("Source column '", name, "' not found"));
        }
    }
    if (table.HasColumn(request_.new_column_name) && !request_.replace_existing) {
        return MakeError(ErrorCode::kDuplicateName,
                         absl::StrCat("Column '", request_.new_column_name, "' already exists"));
    }
    auto valid = evaluator_.Validate(request_.expression);
    if (!valid.ok()) {
        return InvalidInputError(absl::StrCat("Invalid expression: ", valid.message()));
    }
    return absl::OkStatus();
}

absl::Status TransformColumnCommand::Execute() {
    PLOTWISE_ASSIGN_OR_RETURN(model::Dataset * dataset, ResolveDataset(state_, dataset_id_));
    const model::Table& table = dataset->data();

    if (auto status = Validate(table); !status.ok()) {
        PLOTWISE_LOG_WARN("Transform on '{}' rejected: {}", dataset->name(), status.message());
        return status;
    }

    model::Table inputs;
    for (const auto& name : request_.source_columns) {
        PLOTWISE_RETURN_IF_ERROR(inputs.SetColumn(*table.GetColumn(name)));
    }

    auto evaluated = evaluator_.Evaluate(request_.expression, inputs, request_.scope);
    if (!evaluated.ok()) {
        return InvalidInputError(
            absl::StrCat("Expression evaluation failed: ", evaluated.status().message()));
    }

    size_t rows = table.RowCount();
    std::vector<model::Value> values = *std::move(evaluated);
    if (values.size() == 1 && rows != 1) {
        values.assign(rows, values.front());
    } else if (values.size() != rows) {
        return InvalidInputError(absl::StrCat("Expression produced ", values.size(),
                                              " values for ", rows, " rows"));
    }

    PLOTWISE_ASSIGN_OR_RETURN(model::DataType dtype, CommonDataType(values));
    for (auto& value : values) {
        value = ConvertTo(value, dtype);
    }

    snapshot_.Capture(table, request_.new_column_name);

    model::Table updated = table;
    PLOTWISE_RETURN_IF_ERROR(updated.SetColumn(model::Column{
        .name = request_.new_column_name,
        .dtype = dtype,
        .values = std::move(values),
    }));
    dataset->SetData(std::move(updated));

    EmitDatasetEvent(state_, et::kDatasetTransformApplied, *dataset,
                     {{"column_name", request_.new_column_name},
                      {"scope", ToString(request_.scope)},
                      {"source_columns", request_.source_columns},
                      {"expression", request_.expression},
                      {"replaced", snapshot_.existed_before()}});
    PLOTWISE_LOG_INFO("Transformed [{}] into '{}' in dataset '{}'",
                      absl::StrJoin(request_.source_columns, ", "), request_.new_column_name,
                      dataset->name());
    return absl::OkStatus();
}

absl::Status TransformColumnCommand::Undo() {
    if (!snapshot_.captured()) {
        return MakeError(ErrorCode::kInvalidState,
                         absl::StrCat("'", Description(), "' has not been executed"));
    }
    PLOTWISE_ASSIGN_OR_RETURN(model::Dataset * dataset, ResolveDataset(state_, dataset_id_));
    PLOTWISE_ASSIGN_OR_RETURN(model::Table restored, snapshot_.Restore(dataset->data()));
    dataset->SetData(std::move(restored));

    EmitDatasetEvent(state_, et::kDatasetTransformReverted, *dataset,
                     {{"column_name", request_.new_column_name},
                      {"column_removed", !snapshot_.existed_before()}});
    return absl::OkStatus();
}

absl::Status TransformColumnCommand::Redo() {
    return Execute();
}

std::string TransformColumnCommand::Description() const {
    return absl::StrCat("Transform column '", request_.new_column_name, "'");
}

}  // namespace plotwise::commands
