#pragma once

/// @file analysis_types.h
/// @brief Analysis enumerations, parameters and result bundle

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

namespace plotwise::analysis {

/// @brief Kind of analysis operation
enum class AnalysisType {
    kDerivative,
    kIntegral,
    kArcLength,
    kSmoothing,
    kInterpolation
};

enum class DerivativeMethod {
    kCentral,
    kForward,
    kBackward
};

enum class SmoothingMethod {
    kSavgol,
    kRollingMean,
    kLowess
};

enum class InterpolationMethod {
    kLinear,
    kCubic,
    kQuadratic,
    kNearest
};

std::string ToString(AnalysisType type);
std::string ToString(DerivativeMethod method);
std::string ToString(SmoothingMethod method);
std::string ToString(InterpolationMethod method);

absl::StatusOr<AnalysisType> ParseAnalysisType(std::string_view name);
absl::StatusOr<DerivativeMethod> ParseDerivativeMethod(std::string_view name);
absl::StatusOr<SmoothingMethod> ParseSmoothingMethod(std::string_view name);
absl::StatusOr<InterpolationMethod> ParseInterpolationMethod(std::string_view name);

/// @brief Default method name for an analysis type ("" when it has none)
std::string DefaultMethod(AnalysisType type);

/// @brief Parameters of one analysis run
struct AnalysisParameters {
    /// Method name; empty selects the default for the analysis type
    std::string method;

    /// First row of the slice
    int start_index = 0;

    /// One past the last row; -1 means "to the end of the series"
    int end_index = -1;

    std::optional<int> window_length;
    std::optional<int> polynomial_order;
    std::optional<int> num_points;

    /// Extra numeric knobs, e.g. "frac" for LOWESS or "window" for its fallback
    std::map<std::string, double> additional;
};

/// @brief Output bundle of an analysis operation
///
/// Built once by the engine and handed out by value.
struct AnalysisResult {
    AnalysisType analysis_type = AnalysisType::kDerivative;
    std::vector<std::string> source_columns;

    std::vector<double> x_slice;
    std::vector<double> y_slice;
    std::vector<double> result_series;

    AnalysisParameters parameters;
    std::map<std::string, double> statistics;
    std::map<std::string, std::string> metadata;

    /// @brief Suggested column name: "<first source column>_<type>"
    std::string ColumnName() const;
};

}  // namespace plotwise::analysis
