/// @file smoothers.cpp
/// @brief Savitzky-Golay, rolling mean and LOWESS kernels

#include "analysis/smoothers.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace plotwise::analysis {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

/// Solve a small dense system in place with partial pivoting.
/// Returns false if the matrix is singular.
bool SolveDense(std::vector<std::vector<double>>& a, std::vector<double>& b) {
    const size_t n = b.size();
    for (size_t col = 0; col < n; ++col) {
        size_t pivot = col;
        for (size_t row = col + 1; row < n; ++row) {
            if (std::abs(a[row][col]) > std::abs(a[pivot][col])) {
                pivot = row;
            }
        }
        if (std::abs(a[pivot][col]) < 1e-300) {
            return false;
        }
        std::swap(a[col], a[pivot]);
        std::swap(b[col], b[pivot]);

        for (size_t row = col + 1; row < n; ++row) {
            double factor = a[row][col] / a[col][col];
            for (size_t k = col; k < n; ++k) {
                a[row][k] -= factor * a[col][k];
            }
            b[row] -= factor * b[col];
        }
    }

    for (size_t i = n; i-- > 0;) {
        double sum = b[i];
        for (size_t k = i + 1; k < n; ++k) {
            sum -= a[i][k] * b[k];
        }
        b[i] = sum / a[i][i];
    }
    return true;
}

/// Least-squares polynomial through y[first, first + len), evaluated at eval_index
double FitPolynomialAt(const std::vector<double>& y, size_t first, size_t len,
                       int order, size_t eval_index) {
    const size_t terms = static_cast<size_t>(order) + 1;
    const double center = static_cast<double>(first) + static_cast<double>(len - 1) / 2.0;
    const double scale = std::max(1.0, static_cast<double>(len - 1) / 2.0);

    std::vector<std::vector<double>> normal(terms, std::vector<double>(terms, 0.0));
    std::vector<double> rhs(terms, 0.0);
    std::vector<double> powers(2 * terms - 1);

    for (size_t j = first; j < first + len; ++j) {
        double t = (static_cast<double>(j) - center) / scale;
        powers[0] = 1.0;
        for (size_t p = 1; p < powers.size(); ++p) {
            powers[p] = powers[p - 1] * t;
        }
        for (size_t r = 0; r < terms; ++r) {
            rhs[r] += powers[r] * y[j];
            for (size_t c = 0; c < terms; ++c) {
                normal[r][c] += powers[r + c];
            }
        }
    }

    if (!SolveDense(normal, rhs)) {
        return y[eval_index];
    }

    double t = (static_cast<double>(eval_index) - center) / scale;
    double value = 0.0;
    for (size_t p = terms; p-- > 0;) {
        value = value * t + rhs[p];
    }
    return value;
}

/// Tricube kernel on a normalized distance
double Tricube(double u) {
    u = std::abs(u);
    if (u >= 1.0) {
        return 0.0;
    }
    double v = 1.0 - u * u * u;
    return v * v * v;
}

double Median(std::vector<double> values) {
    if (values.empty()) {
        return kNaN;
    }
    size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    double upper = values[mid];
    if (values.size() % 2 == 1) {
        return upper;
    }
    double lower = *std::max_element(values.begin(), values.begin() + mid);
    return (lower + upper) / 2.0;
}

}  // namespace

// =============================================================================
// Savitzky-Golay
// =============================================================================

SavgolWindow ResolveSavgolWindow(size_t n,
                                 std::optional<int> requested_window,
                                 std::optional<int> requested_order) {
    const int size = static_cast<int>(n);

    int window = requested_window.value_or(std::min(11, size / 2 * 2 + 1));
    window = std::max(window, 1);
    int order = requested_order.value_or(std::min(3, window - 1));
    order = std::max(order, 0);

    if (window % 2 == 0) {
        window += 1;
    }
    window = std::max(window, order + 1);
    if (window % 2 == 0) {
        window += 1;
    }

    int max_odd = size % 2 == 1 ? size : size - 1;
    window = std::max(1, std::min(window, max_odd));
    order = std::min(order, window - 1);

    return SavgolWindow{.window_length = window, .polynomial_order = order};
}

std::vector<double> SavgolFilter(const std::vector<double>& y, const SavgolWindow& window) {
    const size_t n = y.size();
    const size_t len = static_cast<size_t>(window.window_length);
    if (n == 0 || len <= 1 || len > n) {
        return y;
    }

    const size_t half = len / 2;
    std::vector<double> result(n);
    for (size_t i = 0; i < n; ++i) {
        size_t first = i < half ? 0 : std::min(i - half, n - len);
        result[i] = FitPolynomialAt(y, first, len, window.polynomial_order, i);
    }
    return result;
}

// =============================================================================
// Rolling mean
// =============================================================================

std::vector<double> RollingMean(const std::vector<double>& y, int window) {
    const long n = static_cast<long>(y.size());
    std::vector<double> result(y.size(), kNaN);
    if (n == 0) {
        return result;
    }

    const long w = std::clamp<long>(window, 1, n);
    const long offset = (w - 1) / 2;

    for (long i = 0; i < n; ++i) {
        long last = i + offset;
        long first = last - w + 1;
        if (first < 0 || last >= n) {
            continue;
        }
        double sum = 0.0;
        bool complete = true;
        for (long j = first; j <= last; ++j) {
            if (!std::isfinite(y[j])) {
                complete = false;
                break;
            }
            sum += y[j];
        }
        if (complete) {
            result[i] = sum / static_cast<double>(w);
        }
    }

    // Back-fill, then forward-fill
    double next = kNaN;
    for (long i = n - 1; i >= 0; --i) {
        if (std::isnan(result[i])) {
            result[i] = next;
        } else {
            next = result[i];
        }
    }
    double prev = kNaN;
    for (long i = 0; i < n; ++i) {
        if (std::isnan(result[i])) {
            result[i] = prev;
        } else {
            prev = result[i];
        }
    }

    return result;
}

// =============================================================================
// LOWESS
// =============================================================================

std::vector<double> Lowess(const std::vector<double>& x,
                           const std::vector<double>& y,
                           double frac,
                           int iterations) {
    const size_t n = x.size();
    if (n != y.size() || n == 0) {
        return {};
    }
    for (size_t i = 0; i < n; ++i) {
        if (!std::isfinite(x[i]) || !std::isfinite(y[i])) {
            return {};
        }
    }

    const size_t k = static_cast<size_t>(std::floor(frac * static_cast<double>(n) + 1e-10));
    if (k < 2 || k > n) {
        return {};
    }

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&x](size_t a, size_t b) { return x[a] < x[b]; });

    std::vector<double> xs(n);
    std::vector<double> ys(n);
    for (size_t i = 0; i < n; ++i) {
        xs[i] = x[order[i]];
        ys[i] = y[order[i]];
    }
    if (xs.front() == xs.back()) {
        return {};
    }

    double y_magnitude = 0.0;
    for (double v : ys) {
        y_magnitude = std::max(y_magnitude, std::abs(v));
    }

    std::vector<double> fitted(n, 0.0);
    std::vector<double> robustness(n, 1.0);

    for (int iter = 0; iter <= iterations; ++iter) {
        size_t left = 0;
        for (size_t i = 0; i < n; ++i) {
            // Slide the k-point neighbourhood so it stays centred on xs[i]
            while (left + k < n && xs[i] - xs[left] > xs[left + k] - xs[i]) {
                ++left;
            }
            const size_t right = left + k - 1;
            const double radius = std::max(xs[i] - xs[left], xs[right] - xs[i]);

            double sw = 0.0;
            double swx = 0.0;
            double swy = 0.0;
            for (size_t j = left; j <= right; ++j) {
                double weight = radius > 0.0 ? Tricube((xs[j] - xs[i]) / radius) : 1.0;
                weight *= robustness[j];
                sw += weight;
                swx += weight * xs[j];
                swy += weight * ys[j];
            }
            if (sw <= 0.0) {
                fitted[i] = ys[i];
                continue;
            }

            const double mean_x = swx / sw;
            const double mean_y = swy / sw;
            double sxx = 0.0;
            double sxy = 0.0;
            for (size_t j = left; j <= right; ++j) {
                double weight = radius > 0.0 ? Tricube((xs[j] - xs[i]) / radius) : 1.0;
                weight *= robustness[j];
                sxx += weight * (xs[j] - mean_x) * (xs[j] - mean_x);
                sxy += weight * (xs[j] - mean_x) * (ys[j] - mean_y);
            }

            // Locally flat x: the weighted mean is the best linear fit
            if (sxx <= 1e-12 * radius * radius * sw) {
                fitted[i] = mean_y;
            } else {
                fitted[i] = mean_y + (sxy / sxx) * (xs[i] - mean_x);
            }
        }

        if (iter == iterations) {
            break;
        }

        std::vector<double> abs_residuals(n);
        for (size_t i = 0; i < n; ++i) {
            abs_residuals[i] = std::abs(ys[i] - fitted[i]);
        }
        // Residuals at rounding level mean the fit is already exact
        const double scale = 6.0 * Median(abs_residuals);
        if (scale <= 1e-12 * y_magnitude) {
            break;
        }
        for (size_t i = 0; i < n; ++i) {
            double u = abs_residuals[i] / scale;
            robustness[i] = u < 1.0 ? (1.0 - u * u) * (1.0 - u * u) : 0.0;
        }
    }

    std::vector<double> result(n);
    for (size_t i = 0; i < n; ++i) {
        result[order[i]] = fitted[i];
    }
    return result;
}

}  // namespace plotwise::analysis
