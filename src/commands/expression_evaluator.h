#pragma once

/// @file expression_evaluator.h
/// @brief Interface to the user-expression evaluator used by column transforms

#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "model/table.h"

namespace plotwise::commands {

/// @brief How an expression sees its inputs
enum class TransformScope {
    /// Whole source column bound as one series
    kColumn,
    /// Evaluated once per row with that row's cells bound
    kRow,
    /// All source columns bound together
    kMultiColumn
};

std::string ToString(TransformScope scope);
absl::StatusOr<TransformScope> ParseTransformScope(std::string_view name);

/// @brief Sandboxed evaluator for user expressions
///
/// Implementations own the expression language and its safety rules.
/// Commands only validate, evaluate and check the shape of what comes back.
class ExpressionEvaluator {
public:
    virtual ~ExpressionEvaluator() = default;

    /// @brief Reject expressions that are malformed or not allowed
    virtual absl::Status Validate(std::string_view expression) const = 0;

    /// @brief Evaluate over the source columns
    ///
    /// inputs holds only the source columns, in request order. The result
    /// has either one value (broadcast to every row) or one value per row.
    virtual absl::StatusOr<std::vector<model::Value>> Evaluate(
        std::string_view expression,
        const model::Table& inputs,
        TransformScope scope) const = 0;
};

}  // namespace plotwise::commands
