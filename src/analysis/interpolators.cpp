/// @file interpolators.cpp
/// @brief Linear, nearest, quadratic B-spline and cubic spline interpolants

#include "analysis/interpolators.h"

#include <algorithm>
#include <cmath>
#include <numeric>

#include <absl/strings/str_cat.h>

namespace plotwise::analysis {

namespace {

constexpr int kQuadraticDegree = 2;

struct SortedSamples {
    std::vector<double> x;
    std::vector<double> y;
};

SortedSamples SortByX(const std::vector<double>& x, const std::vector<double>& y) {
    std::vector<size_t> order(x.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&x](size_t a, size_t b) { return x[a] < x[b]; });

    SortedSamples sorted;
    sorted.x.reserve(x.size());
    sorted.y.reserve(y.size());
    for (size_t idx : order) {
        sorted.x.push_back(x[idx]);
        sorted.y.push_back(y[idx]);
    }
    return sorted;
}

/// Banded matrix stored row-wise; entry (i, j) lives at rows[i][j - i + lower]
struct BandedMatrix {
    size_t size = 0;
    size_t lower = 0;
    size_t upper = 0;
    std::vector<std::vector<double>> rows;

    double& At(size_t i, size_t j) { return rows[i][j + lower - i]; }
};

/// Gaussian elimination without pivoting. B-spline collocation matrices are
/// totally positive, so elimination in natural order is stable for them.
bool SolveBanded(BandedMatrix& a, std::vector<double>& b) {
    const size_t n = a.size;
    for (size_t k = 0; k < n; ++k) {
        double pivot = a.At(k, k);
        if (pivot == 0.0) {
            return false;
        }
        size_t row_end = std::min(n - 1, k + a.lower);
        size_t col_end = std::min(n - 1, k + a.upper);
        for (size_t i = k + 1; i <= row_end; ++i) {
            double factor = a.At(i, k) / pivot;
            if (factor == 0.0) {
                continue;
            }
            for (size_t j = k; j <= col_end; ++j) {
                a.At(i, j) -= factor * a.At(k, j);
            }
            b[i] -= factor * b[k];
        }
    }

    for (size_t i = n; i-- > 0;) {
        double sum = b[i];
        size_t col_end = std::min(n - 1, i + a.upper);
        for (size_t j = i + 1; j <= col_end; ++j) {
            sum -= a.At(i, j) * b[j];
        }
        b[i] = sum / a.At(i, i);
    }
    return true;
}

/// Knot span index mu with t[mu] <= value < t[mu + 1], clamped to [degree, num_coeffs - 1]
size_t FindSpan(const std::vector<double>& knots, size_t num_coeffs, int degree, double value) {
    auto first = knots.begin() + degree;
    auto last = knots.begin() + static_cast<std::ptrdiff_t>(num_coeffs);
    auto it = std::upper_bound(first, last, value);
    size_t span = static_cast<size_t>(it - knots.begin());
    span = span == 0 ? 0 : span - 1;
    return std::clamp(span, static_cast<size_t>(degree), num_coeffs - 1);
}

/// Non-zero B-spline basis values N[mu - degree .. mu] at value (de Boor/Cox recursion)
std::vector<double> BasisFunctions(const std::vector<double>& knots, size_t span,
                                   int degree, double value) {
    std::vector<double> basis(degree + 1, 0.0);
    std::vector<double> left(degree + 1, 0.0);
    std::vector<double> right(degree + 1, 0.0);
    basis[0] = 1.0;

    for (int j = 1; j <= degree; ++j) {
        left[j] = value - knots[span + 1 - j];
        right[j] = knots[span + j] - value;
        double saved = 0.0;
        for (int r = 0; r < j; ++r) {
            double denom = right[r + 1] + left[j - r];
            double temp = denom != 0.0 ? basis[r] / denom : 0.0;
            basis[r] = saved + right[r + 1] * temp;
            saved = left[j - r] * temp;
        }
        basis[j] = saved;
    }
    return basis;
}

}  // namespace

// =============================================================================
// Linear / nearest
// =============================================================================

std::vector<double> InterpolateLinear(const std::vector<double>& x,
                                      const std::vector<double>& y,
                                      const std::vector<double>& x_new) {
    if (x.size() == 1) {
        return std::vector<double>(x_new.size(), y.front());
    }

    SortedSamples s = SortByX(x, y);
    const size_t n = s.x.size();

    std::vector<double> result;
    result.reserve(x_new.size());
    for (double value : x_new) {
        size_t idx = static_cast<size_t>(
            std::lower_bound(s.x.begin(), s.x.end(), value) - s.x.begin());
        idx = std::clamp<size_t>(idx, 1, n - 1);
        const size_t lo = idx - 1;
        const size_t hi = idx;

        double dx = s.x[hi] - s.x[lo];
        if (dx == 0.0) {
            result.push_back(s.y[lo]);
            continue;
        }
        double slope = (s.y[hi] - s.y[lo]) / dx;
        result.push_back(s.y[lo] + slope * (value - s.x[lo]));
    }
    return result;
}

std::vector<double> InterpolateNearest(const std::vector<double>& x,
                                       const std::vector<double>& y,
                                       const std::vector<double>& x_new) {
    SortedSamples s = SortByX(x, y);

    std::vector<double> midpoints;
    midpoints.reserve(s.x.size());
    for (size_t i = 0; i + 1 < s.x.size(); ++i) {
        midpoints.push_back((s.x[i] + s.x[i + 1]) / 2.0);
    }

    std::vector<double> result;
    result.reserve(x_new.size());
    for (double value : x_new) {
        size_t idx = static_cast<size_t>(
            std::lower_bound(midpoints.begin(), midpoints.end(), value) - midpoints.begin());
        result.push_back(s.y[idx]);
    }
    return result;
}

// =============================================================================
// Quadratic B-spline
// =============================================================================

absl::StatusOr<std::vector<double>> InterpolateQuadratic(const std::vector<double>& x,
                                                         const std::vector<double>& y,
                                                         const std::vector<double>& x_new) {
    const size_t n = x.size();
    if (n < 3) {
        return absl::InvalidArgumentError(
            absl::StrCat("Quadratic interpolation needs at least 3 points, got ", n));
    }

    SortedSamples s = SortByX(x, y);
    for (size_t i = 0; i + 1 < n; ++i) {
        if (!(s.x[i] < s.x[i + 1])) {
            return absl::InvalidArgumentError(
                "Quadratic interpolation requires distinct, finite x values");
        }
    }

    // [x0]*3 + interior midpoints + [xn]*3
    std::vector<double> knots(kQuadraticDegree + 1, s.x.front());
    for (size_t i = 1; i + 2 < n; ++i) {
        knots.push_back((s.x[i] + s.x[i + 1]) / 2.0);
    }
    knots.insert(knots.end(), kQuadraticDegree + 1, s.x.back());
    const size_t num_coeffs = knots.size() - kQuadraticDegree - 1;

    // Collocation rows; each has degree + 1 non-zeros ending at its span
    std::vector<size_t> spans(n);
    std::vector<std::vector<double>> row_basis(n);
    size_t lower = 0;
    size_t upper = 0;
    for (size_t i = 0; i < n; ++i) {
        spans[i] = FindSpan(knots, num_coeffs, kQuadraticDegree, s.x[i]);
        row_basis[i] = BasisFunctions(knots, spans[i], kQuadraticDegree, s.x[i]);
        size_t first_col = spans[i] - kQuadraticDegree;
        if (first_col < i) lower = std::max(lower, i - first_col);
        if (spans[i] > i) upper = std::max(upper, spans[i] - i);
    }

    BandedMatrix matrix;
    matrix.size = num_coeffs;
    matrix.lower = lower;
    matrix.upper = upper;
    matrix.rows.assign(num_coeffs, std::vector<double>(lower + upper + 1, 0.0));
    for (size_t i = 0; i < n; ++i) {
        size_t first_col = spans[i] - kQuadraticDegree;
        for (int r = 0; r <= kQuadraticDegree; ++r) {
            matrix.At(i, first_col + r) = row_basis[i][r];
        }
    }

    std::vector<double> coeffs = s.y;
    if (!SolveBanded(matrix, coeffs)) {
        return absl::InvalidArgumentError("Quadratic collocation matrix is singular");
    }

    std::vector<double> result;
    result.reserve(x_new.size());
    for (double value : x_new) {
        size_t span = FindSpan(knots, num_coeffs, kQuadraticDegree, value);
        std::vector<double> basis = BasisFunctions(knots, span, kQuadraticDegree, value);
        double sum = 0.0;
        for (int r = 0; r <= kQuadraticDegree; ++r) {
            sum += coeffs[span - kQuadraticDegree + r] * basis[r];
        }
        result.push_back(sum);
    }
    return result;
}

// =============================================================================
// CubicSpline
// =============================================================================

CubicSpline::CubicSpline(std::vector<double> x, std::vector<double> y, std::vector<double> m)
    : x_(std::move(x)), y_(std::move(y)), m_(std::move(m)) {}

std::optional<CubicSpline> CubicSpline::Build(const std::vector<double>& x,
                                              const std::vector<double>& y) {
    const size_t n = x.size();
    if (n < 4 || y.size() != n) {
        return std::nullopt;
    }
    for (size_t i = 0; i < n; ++i) {
        if (!std::isfinite(x[i])) {
            return std::nullopt;
        }
        if (i > 0 && !(x[i] > x[i - 1])) {
            return std::nullopt;
        }
    }

    std::vector<double> h(n - 1);
    for (size_t i = 0; i + 1 < n; ++i) {
        h[i] = x[i + 1] - x[i];
    }

    // Tridiagonal system for M[1..n-2]; the not-a-knot conditions eliminate
    // M[0] and M[n-1] from the first and last rows.
    const size_t m = n - 2;
    std::vector<double> sub(m, 0.0);
    std::vector<double> diag(m, 0.0);
    std::vector<double> sup(m, 0.0);
    std::vector<double> rhs(m, 0.0);

    for (size_t r = 0; r < m; ++r) {
        size_t i = r + 1;
        sub[r] = h[i - 1];
        diag[r] = 2.0 * (h[i - 1] + h[i]);
        sup[r] = h[i];
        rhs[r] = 6.0 * ((y[i + 1] - y[i]) / h[i] - (y[i] - y[i - 1]) / h[i - 1]);
    }

    const double h0 = h[0];
    const double h1 = h[1];
    diag[0] = 3.0 * h0 + 2.0 * h1 + h0 * h0 / h1;
    sup[0] = (h1 * h1 - h0 * h0) / h1;
    sub[0] = 0.0;

    const double ha = h[n - 3];
    const double hb = h[n - 2];
    diag[m - 1] = 2.0 * ha + 3.0 * hb + hb * hb / ha;
    sub[m - 1] = (ha * ha - hb * hb) / ha;
    sup[m - 1] = 0.0;

    // Thomas algorithm
    for (size_t r = 1; r < m; ++r) {
        double factor = sub[r] / diag[r - 1];
        diag[r] -= factor * sup[r - 1];
        rhs[r] -= factor * rhs[r - 1];
    }
    std::vector<double> second(n, 0.0);
    second[m] = rhs[m - 1] / diag[m - 1];
    for (size_t r = m - 1; r-- > 0;) {
        second[r + 1] = (rhs[r] - sup[r] * second[r + 2]) / diag[r];
    }

    second[0] = second[1] * (1.0 + h0 / h1) - (h0 / h1) * second[2];
    second[n - 1] = second[n - 2] * (1.0 + hb / ha) - (hb / ha) * second[n - 3];

    return CubicSpline(x, y, std::move(second));
}

double CubicSpline::operator()(double value) const {
    const size_t n = x_.size();
    size_t idx = static_cast<size_t>(
        std::upper_bound(x_.begin(), x_.end(), value) - x_.begin());
    idx = std::clamp<size_t>(idx, 1, n - 1);
    const size_t i = idx - 1;

    const double h = x_[i + 1] - x_[i];
    const double a = x_[i + 1] - value;
    const double b = value - x_[i];

    return m_[i] * a * a * a / (6.0 * h) +
           m_[i + 1] * b * b * b / (6.0 * h) +
           (y_[i] / h - m_[i] * h / 6.0) * a +
           (y_[i + 1] / h - m_[i + 1] * h / 6.0) * b;
}

std::vector<double> CubicSpline::Evaluate(const std::vector<double>& x_new) const {
    std::vector<double> result;
    result.reserve(x_new.size());
    for (double value : x_new) {
        result.push_back((*this)(value));
    }
    return result;
}

}  // namespace plotwise::analysis
