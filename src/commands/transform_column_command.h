#pragma once

/// @file transform_column_command.h
/// @brief Derive a column from a user expression over source columns

#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "commands/command.h"
#include "commands/expression_evaluator.h"
#include "commands/snapshot.h"
#include "state/app_state.h"

namespace plotwise::commands {

struct TransformRequest {
    std::string new_column_name;
    TransformScope scope = TransformScope::kColumn;
    std::vector<std::string> source_columns;
    std::string expression;
    bool replace_existing = false;
};

/// @brief Writes evaluator output into a new or replaced column
///
/// The evaluator is borrowed and must outlive the command. Undo restores the
/// target column's previous values or drops it; redo evaluates again.
class TransformColumnCommand : public Command {
public:
    TransformColumnCommand(state::AppState& state,
                           std::string dataset_id,
                           TransformRequest request,
                           const ExpressionEvaluator& evaluator);

    absl::Status Execute() override;
    absl::Status Undo() override;
    absl::Status Redo() override;
    std::string Description() const override;

private:
    absl::Status Validate(const model::Table& table) const;

    state::AppState& state_;
    std::string dataset_id_;
    TransformRequest request_;
    const ExpressionEvaluator& evaluator_;
    ColumnSnapshot snapshot_;
};

/// @brief Column type for evaluator output
///
/// Integers mixed with floats or bools widen to float64; strings mixed with
/// anything else are rejected. All-missing output is float64.
absl::StatusOr<model::DataType> CommonDataType(const std::vector<model::Value>& values);

}  // namespace plotwise::commands
