#pragma once

/// @file interpolators.h
/// @brief One-dimensional interpolants used by the analysis engine

#include <optional>
#include <vector>

#include <absl/status/statusor.h>

namespace plotwise::analysis {

/// @brief Piecewise linear interpolation
///
/// Samples need not be sorted; they are ordered by x first. Query points are
/// expected inside [min x, max x].
std::vector<double> InterpolateLinear(const std::vector<double>& x,
                                      const std::vector<double>& y,
                                      const std::vector<double>& x_new);

/// @brief Nearest-neighbour interpolation; ties at a midpoint go to the lower neighbour
std::vector<double> InterpolateNearest(const std::vector<double>& x,
                                       const std::vector<double>& y,
                                       const std::vector<double>& x_new);

/// @brief Quadratic B-spline interpolant
///
/// Knots are the end points with multiplicity 3 and the midpoints between
/// consecutive samples, omitting the first and last midpoint.
/// Fails with InvalidArgument for fewer than 3 points or repeated x.
absl::StatusOr<std::vector<double>> InterpolateQuadratic(const std::vector<double>& x,
                                                         const std::vector<double>& y,
                                                         const std::vector<double>& x_new);

/// @brief Cubic spline with not-a-knot end conditions
class CubicSpline {
public:
    /// @brief Build the spline; x must be finite and strictly increasing, n >= 4
    static std::optional<CubicSpline> Build(const std::vector<double>& x,
                                            const std::vector<double>& y);

    double operator()(double value) const;

    std::vector<double> Evaluate(const std::vector<double>& x_new) const;

private:
    CubicSpline(std::vector<double> x, std::vector<double> y, std::vector<double> m);

    std::vector<double> x_;
    std::vector<double> y_;
    /// Second derivative at each knot
    std::vector<double> m_;
};

}  // namespace plotwise::analysis
