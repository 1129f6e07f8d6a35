#include "commands/expression_evaluator.h"

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace plotwise::commands {

std::string ToString(TransformScope scope) {
    switch (scope) {
        case TransformScope::kColumn:
            return "column";
        case TransformScope::kRow:
            return "row";
        case TransformScope::kMultiColumn:
            return "multi_column";
    }
    return "unknown";
}

absl::StatusOr<TransformScope> ParseTransformScope(std::string_view name) {
    std::string lower = absl::AsciiStrToLower(name);
    if (lower == "column") {
        return TransformScope::kColumn;
    }
    if (lower == "row") {
        return TransformScope::kRow;
    }
    if (lower == "multi_column") {
        return TransformScope::kMultiColumn;
    }
    return absl::InvalidArgumentError(absl::StrCat("Unknown transform scope: ", name));
}

}  // namespace plotwise::commands
