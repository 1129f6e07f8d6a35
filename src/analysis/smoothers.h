#pragma once

/// @file smoothers.h
/// @brief Series smoothing kernels used by the analysis engine

#include <cstddef>
#include <optional>
#include <vector>

namespace plotwise::analysis {

/// @brief Savitzky-Golay window after auto-correction
struct SavgolWindow {
    int window_length = 1;
    int polynomial_order = 0;
};

/// @brief Resolve the Savitzky-Golay window for a series of n points
///
/// Defaults: window = min(11, largest odd <= n + 1), order = min(3, window - 1).
/// An even window is bumped to odd, then raised to at least order + 1 and
/// made odd again. Finally the window is clamped to the largest odd value
/// <= n and the order to window - 1.
SavgolWindow ResolveSavgolWindow(size_t n,
                                 std::optional<int> requested_window,
                                 std::optional<int> requested_order);

/// @brief Savitzky-Golay filter with polynomial edge fitting ("interp" mode)
///
/// Every output point is the value at that point of the least-squares
/// polynomial fitted over its window. Near the edges the window is pinned to
/// the first or last window_length points.
std::vector<double> SavgolFilter(const std::vector<double>& y, const SavgolWindow& window);

/// @brief Centered rolling mean, edges back-filled then forward-filled
///
/// The window for row i covers [i + off - w + 1, i + off] with
/// off = (w - 1) / 2. Windows that run off the series or contain a
/// non-finite value produce no value and are filled from neighbours.
std::vector<double> RollingMean(const std::vector<double>& y, int window);

/// @brief Robust locally weighted linear regression
///
/// @param x Abscissa, in any order
/// @param y Ordinate
/// @param frac Fraction of points used for each local fit
/// @param iterations Number of bisquare robustness iterations
/// @return Smoothed values in the caller's row order, or an empty vector when
///         the regression cannot run (too few neighbours, non-finite input,
///         or all x equal)
std::vector<double> Lowess(const std::vector<double>& x,
                           const std::vector<double>& y,
                           double frac,
                           int iterations = 3);

}  // namespace plotwise::analysis
