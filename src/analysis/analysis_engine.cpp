/// @file analysis_engine.cpp
/// @brief Analysis engine implementation

#include "analysis/analysis_engine.h"

#include <algorithm>
#include <cmath>

#include <absl/strings/str_cat.h>

#include "analysis/interpolators.h"
#include "analysis/smoothers.h"
#include "analysis/statistics.h"
#include "common/logging.h"

namespace plotwise::analysis {

namespace {

constexpr double kDefaultLowessFraction = 0.2;
constexpr int kDefaultLowessFallbackWindow = 5;
constexpr int kLowessIterations = 3;
constexpr size_t kMinCubicPoints = 4;

struct Slice {
    std::vector<double> x;
    std::vector<double> y;
    int start = 0;
    int end = 0;
};

absl::StatusOr<Slice> ResolveSlice(const std::vector<double>& x,
                                   const std::vector<double>& y,
                                   int start_index,
                                   int end_index,
                                   size_t min_points,
                                   std::string_view operation) {
    if (x.size() != y.size()) {
        return absl::InvalidArgumentError(absl::StrCat(
            operation, ": x and y lengths differ (", x.size(), " vs ", y.size(), ")"));
    }
    if (start_index < 0) {
        return absl::InvalidArgumentError(
            absl::StrCat(operation, ": start_index must be >= 0, got ", start_index));
    }
    if (end_index < -1) {
        return absl::InvalidArgumentError(
            absl::StrCat(operation, ": end_index must be >= -1, got ", end_index));
    }

    const int length = static_cast<int>(x.size());
    int end = end_index == -1 ? length : std::min(end_index, length);
    if (start_index >= end) {
        return absl::InvalidArgumentError(absl::StrCat(
            operation, ": empty slice [", start_index, ", ", end, ") of ", length, " points"));
    }

    Slice slice;
    slice.start = start_index;
    slice.end = end;
    slice.x.assign(x.begin() + start_index, x.begin() + end);
    slice.y.assign(y.begin() + start_index, y.begin() + end);

    if (slice.x.size() < min_points) {
        return absl::InvalidArgumentError(absl::StrCat(
            operation, " needs at least ", min_points, " points, slice has ", slice.x.size()));
    }
    return slice;
}

std::vector<double> CentralGradient(const std::vector<double>& x, const std::vector<double>& y) {
    const size_t n = y.size();
    std::vector<double> grad(n);

    grad[0] = (y[1] - y[0]) / (x[1] - x[0]);
    grad[n - 1] = (y[n - 1] - y[n - 2]) / (x[n - 1] - x[n - 2]);

    for (size_t i = 1; i + 1 < n; ++i) {
        const double hs = x[i] - x[i - 1];
        const double hd = x[i + 1] - x[i];
        grad[i] = (hs * hs * y[i + 1] + (hd * hd - hs * hs) * y[i] - hd * hd * y[i - 1]) /
                  (hs * hd * (hd + hs));
    }
    return grad;
}

std::vector<double> Differences(const std::vector<double>& x, const std::vector<double>& y) {
    std::vector<double> diffs;
    diffs.reserve(y.size() - 1);
    for (size_t i = 0; i + 1 < y.size(); ++i) {
        diffs.push_back((y[i + 1] - y[i]) / (x[i + 1] - x[i]));
    }
    return diffs;
}

double AdditionalOr(const AnalysisParameters& params, const std::string& key, double fallback) {
    auto it = params.additional.find(key);
    return it != params.additional.end() ? it->second : fallback;
}

}  // namespace

// =============================================================================
// Derivative
// =============================================================================

absl::StatusOr<AnalysisResult> AnalysisEngine::CalculateDerivative(
    const std::vector<double>& x,
    const std::vector<double>& y,
    const SeriesNames& names,
    DerivativeMethod method,
    int start_index,
    int end_index) {

    auto slice = ResolveSlice(x, y, start_index, end_index, 2, "Derivative");
    if (!slice.ok()) {
        return slice.status();
    }

    std::vector<double> derivative;
    switch (method) {
        case DerivativeMethod::kCentral:
            derivative = CentralGradient(slice->x, slice->y);
            break;
        case DerivativeMethod::kForward:
            derivative = Differences(slice->x, slice->y);
            derivative.push_back(derivative.back());
            break;
        case DerivativeMethod::kBackward:
            derivative = Differences(slice->x, slice->y);
            derivative.insert(derivative.begin(), derivative.front());
            break;
    }

    AnalysisResult result;
    result.analysis_type = AnalysisType::kDerivative;
    result.source_columns = {names.y};
    result.parameters.method = ToString(method);
    result.parameters.start_index = slice->start;
    result.parameters.end_index = slice->end;
    result.statistics = {
        {"min", Min(derivative)},
        {"max", Max(derivative)},
        {"mean", Mean(derivative)},
        {"std", PopulationStdDev(derivative)},
    };
    result.metadata = {{"method_used", ToString(method)}};
    result.x_slice = std::move(slice->x);
    result.y_slice = std::move(slice->y);
    result.result_series = std::move(derivative);
    return result;
}

// =============================================================================
// Integral
// =============================================================================

absl::StatusOr<AnalysisResult> AnalysisEngine::CalculateIntegral(
    const std::vector<double>& x,
    const std::vector<double>& y,
    const SeriesNames& names,
    int start_index,
    int end_index) {

    auto slice = ResolveSlice(x, y, start_index, end_index, 1, "Integral");
    if (!slice.ok()) {
        return slice.status();
    }

    const auto& xs = slice->x;
    const auto& ys = slice->y;
    std::vector<double> cumulative(xs.size(), 0.0);
    for (size_t i = 1; i < xs.size(); ++i) {
        cumulative[i] = cumulative[i - 1] + (ys[i - 1] + ys[i]) / 2.0 * (xs[i] - xs[i - 1]);
    }
    const double total = cumulative.back();
    const double span = xs.back() - xs.front();

    AnalysisResult result;
    result.analysis_type = AnalysisType::kIntegral;
    result.source_columns = {names.y};
    result.parameters.start_index = slice->start;
    result.parameters.end_index = slice->end;
    result.statistics = {
        {"total_integral", total},
        {"final_value", cumulative.back()},
        {"mean_rate", xs.size() > 1 ? total / span : 0.0},
    };
    result.metadata = {{"method", "trapezoidal"}};
    result.x_slice = std::move(slice->x);
    result.y_slice = std::move(slice->y);
    result.result_series = std::move(cumulative);
    return result;
}

// =============================================================================
// Arc length
// =============================================================================

absl::StatusOr<AnalysisResult> AnalysisEngine::CalculateArcLength(
    const std::vector<double>& x,
    const std::vector<double>& y,
    const SeriesNames& names,
    int start_index,
    int end_index) {

    auto slice = ResolveSlice(x, y, start_index, end_index, 1, "Arc length");
    if (!slice.ok()) {
        return slice.status();
    }

    const auto& xs = slice->x;
    const auto& ys = slice->y;
    std::vector<double> segments;
    segments.reserve(xs.size());
    std::vector<double> cumulative(xs.size(), 0.0);
    for (size_t i = 1; i < xs.size(); ++i) {
        double segment = std::hypot(xs[i] - xs[i - 1], ys[i] - ys[i - 1]);
        segments.push_back(segment);
        cumulative[i] = cumulative[i - 1] + segment;
    }

    AnalysisResult result;
    result.analysis_type = AnalysisType::kArcLength;
    result.source_columns = {names.x, names.y};
    result.parameters.start_index = slice->start;
    result.parameters.end_index = slice->end;
    result.statistics = {
        {"total_length", cumulative.back()},
        {"mean_segment", segments.empty() ? 0.0 : Mean(segments)},
        {"max_segment", segments.empty() ? 0.0 : Max(segments)},
    };
    result.metadata = {{"method", "euclidean_distance"}};
    result.x_slice = std::move(slice->x);
    result.y_slice = std::move(slice->y);
    result.result_series = std::move(cumulative);
    return result;
}

// =============================================================================
// Smoothing
// =============================================================================

absl::StatusOr<AnalysisResult> AnalysisEngine::SmoothData(
    const std::vector<double>& x,
    const std::vector<double>& y,
    const SeriesNames& names,
    SmoothingMethod method,
    const AnalysisParameters& params) {

    auto slice = ResolveSlice(x, y, params.start_index, params.end_index, 1, "Smoothing");
    if (!slice.ok()) {
        return slice.status();
    }

    const auto& ys = slice->y;
    const int n = static_cast<int>(ys.size());

    AnalysisResult result;
    result.parameters = params;
    result.parameters.method = ToString(method);
    result.parameters.start_index = slice->start;
    result.parameters.end_index = slice->end;
    result.metadata = {{"method_used", ToString(method)}};

    std::vector<double> smoothed;
    switch (method) {
        case SmoothingMethod::kSavgol: {
            SavgolWindow window =
                ResolveSavgolWindow(ys.size(), params.window_length, params.polynomial_order);
            smoothed = SavgolFilter(ys, window);
            result.parameters.window_length = window.window_length;
            result.parameters.polynomial_order = window.polynomial_order;
            break;
        }
        case SmoothingMethod::kRollingMean: {
            int window = params.window_length.value_or(static_cast<int>(
                AdditionalOr(params, "window", std::min(5, n / 4))));
            window = std::clamp(window, 1, n);
            smoothed = RollingMean(ys, window);
            result.parameters.window_length = window;
            break;
        }
        case SmoothingMethod::kLowess: {
            double frac = AdditionalOr(params, "frac", kDefaultLowessFraction);
            smoothed = Lowess(slice->x, ys, frac, kLowessIterations);
            if (smoothed.empty()) {
                int window = static_cast<int>(
                    AdditionalOr(params, "window", kDefaultLowessFallbackWindow));
                window = std::clamp(window, 1, n);
                PLOTWISE_LOG_DEBUG("LOWESS unavailable for {} points (frac={}), "
                                   "using rolling mean with window {}", n, frac, window);
                smoothed = RollingMean(ys, window);
                result.metadata["fallback"] = ToString(SmoothingMethod::kRollingMean);
            }
            break;
        }
    }

    const double original_std = PopulationStdDev(ys);
    const double smoothed_std = PopulationStdDev(smoothed);
    const double noise_reduction =
        original_std > 0.0 ? (original_std - smoothed_std) / original_std * 100.0 : 0.0;

    result.analysis_type = AnalysisType::kSmoothing;
    result.source_columns = {names.y};
    result.statistics = {
        {"original_std", original_std},
        {"smoothed_std", smoothed_std},
        {"noise_reduction_percent", noise_reduction},
        {"correlation", PearsonCorrelation(ys, smoothed)},
    };
    result.x_slice = std::move(slice->x);
    result.y_slice = std::move(slice->y);
    result.result_series = std::move(smoothed);
    return result;
}

// =============================================================================
// Interpolation
// =============================================================================

absl::StatusOr<AnalysisResult> AnalysisEngine::InterpolateData(
    const std::vector<double>& x,
    const std::vector<double>& y,
    const SeriesNames& names,
    InterpolationMethod method,
    const AnalysisParameters& params) {

    auto slice = ResolveSlice(x, y, params.start_index, params.end_index, 2, "Interpolation");
    if (!slice.ok()) {
        return slice.status();
    }

    const size_t n = slice->x.size();
    const int num_points = params.num_points.value_or(static_cast<int>(n) * 2);
    if (num_points < 1) {
        return absl::InvalidArgumentError(
            absl::StrCat("Interpolation: num_points must be >= 1, got ", num_points));
    }

    const double x_min = Min(slice->x);
    const double x_max = Max(slice->x);
    std::vector<double> x_new = Linspace(x_min, x_max, static_cast<size_t>(num_points));

    InterpolationMethod effective = method;
    if (effective == InterpolationMethod::kCubic && n < kMinCubicPoints) {
        effective = InterpolationMethod::kLinear;
    }

    std::vector<double> y_new;
    switch (effective) {
        case InterpolationMethod::kCubic: {
            auto spline = CubicSpline::Build(slice->x, slice->y);
            if (spline.has_value()) {
                y_new = spline->Evaluate(x_new);
            } else {
                PLOTWISE_LOG_DEBUG("Cubic spline construction failed, using linear");
                y_new = InterpolateLinear(slice->x, slice->y, x_new);
            }
            break;
        }
        case InterpolationMethod::kLinear:
            y_new = InterpolateLinear(slice->x, slice->y, x_new);
            break;
        case InterpolationMethod::kNearest:
            y_new = InterpolateNearest(slice->x, slice->y, x_new);
            break;
        case InterpolationMethod::kQuadratic: {
            auto values = InterpolateQuadratic(slice->x, slice->y, x_new);
            if (!values.ok()) {
                return values.status();
            }
            y_new = std::move(*values);
            break;
        }
    }

    AnalysisResult result;
    result.analysis_type = AnalysisType::kInterpolation;
    result.source_columns = {names.y};
    result.parameters = params;
    result.parameters.method = ToString(effective);
    result.parameters.num_points = num_points;
    result.parameters.start_index = slice->start;
    result.parameters.end_index = slice->end;
    result.statistics = {
        {"original_points", static_cast<double>(n)},
        {"interpolated_points", static_cast<double>(num_points)},
        {"x_range", x_max - x_min},
        {"point_density_ratio", static_cast<double>(num_points) / static_cast<double>(n)},
    };
    result.metadata = {{"method_used", ToString(effective)}};
    result.x_slice = std::move(x_new);
    result.y_slice = std::move(slice->y);
    result.result_series = std::move(y_new);
    return result;
}

// =============================================================================
// Dispatch
// =============================================================================

absl::StatusOr<AnalysisResult> AnalysisEngine::Analyze(
    AnalysisType type,
    const std::vector<double>& x,
    const std::vector<double>& y,
    const SeriesNames& names,
    const AnalysisParameters& params) {

    switch (type) {
        case AnalysisType::kDerivative: {
            auto method = ParseDerivativeMethod(params.method);
            if (!method.ok()) {
                return method.status();
            }
            return CalculateDerivative(x, y, names, *method,
                                       params.start_index, params.end_index);
        }
        case AnalysisType::kIntegral:
            return CalculateIntegral(x, y, names, params.start_index, params.end_index);
        case AnalysisType::kArcLength:
            return CalculateArcLength(x, y, names, params.start_index, params.end_index);
        case AnalysisType::kSmoothing: {
            auto method = ParseSmoothingMethod(params.method);
            if (!method.ok()) {
                return method.status();
            }
            return SmoothData(x, y, names, *method, params);
        }
        case AnalysisType::kInterpolation: {
            auto method = ParseInterpolationMethod(params.method);
            if (!method.ok()) {
                return method.status();
            }
            return InterpolateData(x, y, names, *method, params);
        }
    }
    return absl::InvalidArgumentError("Unknown analysis type");
}

}  // namespace plotwise::analysis
