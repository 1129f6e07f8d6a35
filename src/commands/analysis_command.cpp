/// @file analysis_command.cpp
/// @brief Analysis command implementation

#include "commands/analysis_command.h"

#include <algorithm>

#include <absl/strings/str_cat.h>

#include "analysis/analysis_engine.h"
#include "commands/command_support.h"
#include "common/error.h"
#include "common/logging.h"

namespace plotwise::commands {

namespace et = events::event_types;

AnalysisCommand::AnalysisCommand(state::AppState& state,
                                 std::string dataset_id,
                                 AnalysisRequest request)
    : state_(state), dataset_id_(std::move(dataset_id)), request_(std::move(request)) {}

absl::Status AnalysisCommand::Validate(const model::Table& table) const {
    if (request_.new_column_name.empty()) {
        return InvalidInputError("New column name must not be empty");
    }
    for (const std::string* name : {&request_.x_column, &request_.y_column}) {
        if (!table.HasColumn(*name)) {
            return NotFoundError(absl::StrCat("Column '", *name, "' not found in dataset"));
        }
    }
    if (table.HasColumn(request_.new_column_name) && !request_.replace_existing) {
        return MakeError(ErrorCode::kDuplicateName,
                         absl::StrCat("Column '", request_.new_column_name,
                                      "' already exists; enable replace to overwrite it"));
    }
    for (const std::string* name : {&request_.x_column, &request_.y_column}) {
        if (!model::IsNumeric(table.GetColumn(*name)->dtype)) {
            return InvalidInputError(absl::StrCat("Column '", *name, "' is not numeric"));
        }
    }
    return absl::OkStatus();
}

absl::Status AnalysisCommand::Execute() {
    PLOTWISE_ASSIGN_OR_RETURN(model::Dataset * dataset, ResolveDataset(state_, dataset_id_));
    const model::Table& table = dataset->data();

    if (auto status = Validate(table); !status.ok()) {
        PLOTWISE_LOG_WARN("Analysis on '{}' rejected: {}", dataset->name(), status.message());
        return status;
    }

    PLOTWISE_ASSIGN_OR_RETURN(std::vector<double> x, table.NumericValues(request_.x_column));
    PLOTWISE_ASSIGN_OR_RETURN(std::vector<double> y, table.NumericValues(request_.y_column));

    auto result = analysis::AnalysisEngine::Analyze(
        request_.type, x, y, {.x = request_.x_column, .y = request_.y_column},
        request_.parameters);
    if (!result.ok()) {
        PLOTWISE_LOG_WARN("Analysis '{}' failed: {}", analysis::ToString(request_.type),
                          result.status().message());
        return InvalidInputError(result.status().message());
    }

    snapshot_.Capture(table, request_.new_column_name);

    size_t rows = table.RowCount();
    const std::vector<double>& series = result->result_series;
    size_t copied = std::min(rows, series.size());

    model::Column column{
        .name = request_.new_column_name,
        .dtype = model::DataType::kFloat64,
        .values = std::vector<model::Value>(rows, model::Value{}),
    };
    for (size_t i = 0; i < copied; ++i) {
        column.values[i] = series[i];
    }
    if (series.size() > rows) {
        PLOTWISE_LOG_DEBUG("Truncating {} result values to {} rows", series.size(), rows);
    }

    model::Table updated = table;
    PLOTWISE_RETURN_IF_ERROR(updated.SetColumn(std::move(column)));
    dataset->SetData(std::move(updated));

    EmitDatasetEvent(state_, et::kDatasetAnalysisApplied, *dataset,
                     {{"analysis_type", analysis::ToString(request_.type)},
                      {"column_name", request_.new_column_name},
                      {"x_column", request_.x_column},
                      {"y_column", request_.y_column},
                      {"replaced", snapshot_.existed_before()},
                      {"statistics", result->statistics}});
    PLOTWISE_LOG_INFO("Applied {} to '{}' in dataset '{}' -> '{}'",
                      analysis::ToString(request_.type), request_.y_column, dataset->name(),
                      request_.new_column_name);

    last_result_ = *std::move(result);
    return absl::OkStatus();
}

absl::Status AnalysisCommand::Undo() {
    if (!snapshot_.captured()) {
        return MakeError(ErrorCode::kInvalidState,
                         absl::StrCat("'", Description(), "' has not been executed"));
    }
    PLOTWISE_ASSIGN_OR_RETURN(model::Dataset * dataset, ResolveDataset(state_, dataset_id_));
    PLOTWISE_ASSIGN_OR_RETURN(model::Table restored, snapshot_.Restore(dataset->data()));
    dataset->SetData(std::move(restored));

    EmitDatasetEvent(state_, et::kDatasetAnalysisReverted, *dataset,
                     {{"analysis_type", analysis::ToString(request_.type)},
                      {"column_name", request_.new_column_name},
                      {"column_removed", !snapshot_.existed_before()}});
    PLOTWISE_LOG_INFO("Reverted {} column '{}' in dataset '{}'",
                      analysis::ToString(request_.type), request_.new_column_name,
                      dataset->name());
    return absl::OkStatus();
}

absl::Status AnalysisCommand::Redo() {
    return Execute();
}

std::string AnalysisCommand::Description() const {
    return absl::StrCat("Apply ", analysis::ToString(request_.type), " analysis to '",
                        request_.y_column, "' as '", request_.new_column_name, "'");
}

}  // namespace plotwise::commands
