/// @file analysis_types.cpp
/// @brief Analysis enumeration conversions

#include "analysis/analysis_types.h"

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace plotwise::analysis {

std::string ToString(AnalysisType type) {
    switch (type) {
        case AnalysisType::kDerivative: return "derivative";
        case AnalysisType::kIntegral: return "integral";
        case AnalysisType::kArcLength: return "arc_length";
        case AnalysisType::kSmoothing: return "smoothing";
        case AnalysisType::kInterpolation: return "interpolation";
    }
    return "unknown";
}

std::string ToString(DerivativeMethod method) {
    switch (method) {
        case DerivativeMethod::kCentral: return "central";
        case DerivativeMethod::kForward: return "forward";
        case DerivativeMethod::kBackward: return "backward";
    }
    return "unknown";
}

std::string ToString(SmoothingMethod method) {
    switch (method) {
        case SmoothingMethod::kSavgol: return "savgol";
        case SmoothingMethod::kRollingMean: return "rolling_mean";
        case SmoothingMethod::kLowess: return "lowess";
    }
    return "unknown";
}

std::string ToString(InterpolationMethod method) {
    switch (method) {
        case InterpolationMethod::kLinear: return "linear";
        case InterpolationMethod::kCubic: return "cubic";
        case InterpolationMethod::kQuadratic: return "quadratic";
        case InterpolationMethod::kNearest: return "nearest";
    }
    return "unknown";
}

absl::StatusOr<AnalysisType> ParseAnalysisType(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(name);
    if (lowered == "derivative") return AnalysisType::kDerivative;
    if (lowered == "integral") return AnalysisType::kIntegral;
    if (lowered == "arc_length") return AnalysisType::kArcLength;
    if (lowered == "smoothing") return AnalysisType::kSmoothing;
    if (lowered == "interpolation") return AnalysisType::kInterpolation;
    return absl::InvalidArgumentError(absl::StrCat("Unknown analysis type: ", name));
}

absl::StatusOr<DerivativeMethod> ParseDerivativeMethod(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(name);
    if (lowered.empty() || lowered == "central") return DerivativeMethod::kCentral;
    if (lowered == "forward") return DerivativeMethod::kForward;
    if (lowered == "backward") return DerivativeMethod::kBackward;
    return absl::InvalidArgumentError(absl::StrCat("Unknown derivative method: ", name));
}

absl::StatusOr<SmoothingMethod> ParseSmoothingMethod(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(name);
    if (lowered.empty() || lowered == "savgol") return SmoothingMethod::kSavgol;
    if (lowered == "rolling_mean") return SmoothingMethod::kRollingMean;
    if (lowered == "lowess") return SmoothingMethod::kLowess;
    return absl::InvalidArgumentError(absl::StrCat("Unknown smoothing method: ", name));
}

absl::StatusOr<InterpolationMethod> ParseInterpolationMethod(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(name);
    if (lowered.empty() || lowered == "cubic") return InterpolationMethod::kCubic;
    if (lowered == "linear") return InterpolationMethod::kLinear;
    if (lowered == "quadratic") return InterpolationMethod::kQuadratic;
    if (lowered == "nearest") return InterpolationMethod::kNearest;
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown interpolation method: ", name));
}

std::string DefaultMethod(AnalysisType type) {
    switch (type) {
        case AnalysisType::kDerivative: return "central";
        case AnalysisType::kSmoothing: return "savgol";
        case AnalysisType::kInterpolation: return "cubic";
        case AnalysisType::kIntegral:
        case AnalysisType::kArcLength:
            return "";
    }
    return "";
}

std::string AnalysisResult::ColumnName() const {
    std::string base = "data";
    if (!source_columns.empty() && !source_columns.front().empty()) {
        base = source_columns.front();
    }
    return absl::StrCat(base, "_", ToString(analysis_type));
}

}  // namespace plotwise::analysis
