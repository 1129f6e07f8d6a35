#pragma once

/// @file analysis_engine.h
/// @brief Stateless numeric analysis over aligned (x, y) series

#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "analysis/analysis_types.h"

namespace plotwise::analysis {

/// @brief Column names of the series being analysed
struct SeriesNames {
    std::string x;
    std::string y;
};

/// @brief Numeric analysis operations
///
/// Every operation slices both series to [start_index, end_index) before
/// computing. end_index == -1 means "to the end"; larger values are clamped
/// to the series length. Inputs that cannot be analysed (length mismatch,
/// negative start, empty slice, slice too short for the operation) fail with
/// InvalidArgument instead of producing a partial result.
///
/// Example usage:
/// @code
///   auto result = AnalysisEngine::CalculateDerivative(
///       time, position, {.x = "time", .y = "position"},
///       DerivativeMethod::kCentral);
///   if (result.ok()) {
///       double peak = result->statistics.at("max");
///   }
/// @endcode
class AnalysisEngine {
public:
    AnalysisEngine() = delete;

    /// @brief dy/dx by central, forward or backward differences
    ///
    /// Forward and backward differences produce n - 1 values, padded to n by
    /// repeating the last (forward) or first (backward) value.
    static absl::StatusOr<AnalysisResult> CalculateDerivative(
        const std::vector<double>& x,
        const std::vector<double>& y,
        const SeriesNames& names,
        DerivativeMethod method = DerivativeMethod::kCentral,
        int start_index = 0,
        int end_index = -1);

    /// @brief Cumulative trapezoidal integral seeded at 0
    static absl::StatusOr<AnalysisResult> CalculateIntegral(
        const std::vector<double>& x,
        const std::vector<double>& y,
        const SeriesNames& names,
        int start_index = 0,
        int end_index = -1);

    /// @brief Cumulative Euclidean arc length seeded at 0
    static absl::StatusOr<AnalysisResult> CalculateArcLength(
        const std::vector<double>& x,
        const std::vector<double>& y,
        const SeriesNames& names,
        int start_index = 0,
        int end_index = -1);

    /// @brief Savitzky-Golay, rolling mean or LOWESS smoothing
    ///
    /// Uses params.window_length / params.polynomial_order for Savitzky-Golay,
    /// params.window_length (or additional["window"]) for the rolling mean and
    /// additional["frac"] for LOWESS. LOWESS falls back to a rolling mean when
    /// the local regression cannot run.
    static absl::StatusOr<AnalysisResult> SmoothData(
        const std::vector<double>& x,
        const std::vector<double>& y,
        const SeriesNames& names,
        SmoothingMethod method,
        const AnalysisParameters& params = {});

    /// @brief Resample y onto params.num_points evenly spaced x values
    ///
    /// Cubic requests on fewer than 4 points, or on x that is not strictly
    /// increasing, are served by linear interpolation.
    static absl::StatusOr<AnalysisResult> InterpolateData(
        const std::vector<double>& x,
        const std::vector<double>& y,
        const SeriesNames& names,
        InterpolationMethod method,
        const AnalysisParameters& params = {});

    /// @brief Dispatch on analysis type, parsing params.method for that type
    static absl::StatusOr<AnalysisResult> Analyze(
        AnalysisType type,
        const std::vector<double>& x,
        const std::vector<double>& y,
        const SeriesNames& names,
        const AnalysisParameters& params = {});
};

}  // namespace plotwise::analysis
