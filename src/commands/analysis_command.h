#pragma once

/// @file analysis_command.h
/// @brief Apply an analysis to two dataset columns and store the result column

#include <optional>
#include <string>

#include <absl/status/status.h>

#include "analysis/analysis_types.h"
#include "commands/command.h"
#include "commands/snapshot.h"
#include "state/app_state.h"

namespace plotwise::commands {

/// @brief What to analyse and where to put the result
struct AnalysisRequest {
    analysis::AnalysisType type = analysis::AnalysisType::kDerivative;
    std::string x_column;
    std::string y_column;
    std::string new_column_name;
    bool replace_existing = false;
    analysis::AnalysisParameters parameters;
};

/// @brief Runs the analysis engine on (x_column, y_column) and writes a float64 column
///
/// Validation happens before anything is captured: the new column name must
/// be non-empty, both source columns must exist, the target must be absent
/// unless replace_existing, and both sources must be numeric. A result
/// shorter than the table leaves the remaining rows missing; a longer one is
/// cut to the row count.
///
/// Undo restores the target column's previous values, or drops the column if
/// it did not exist before. Redo runs the analysis again.
class AnalysisCommand : public Command {
public:
    AnalysisCommand(state::AppState& state, std::string dataset_id, AnalysisRequest request);

    absl::Status Execute() override;
    absl::Status Undo() override;
    absl::Status Redo() override;
    std::string Description() const override;

    const AnalysisRequest& request() const { return request_; }

    /// @brief Result of the most recent successful execute, for display
    const std::optional<analysis::AnalysisResult>& last_result() const { return last_result_; }

private:
    absl::Status Validate(const model::Table& table) const;

    state::AppState& state_;
    std::string dataset_id_;
    AnalysisRequest request_;
    ColumnSnapshot snapshot_;
    std::optional<analysis::AnalysisResult> last_result_;
};

}  // namespace plotwise::commands
