#include "analysis/statistics.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace plotwise::analysis {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

}  // namespace

double Mean(const std::vector<double>& values) {
    if (values.empty()) {
        return kNaN;
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double PopulationStdDev(const std::vector<double>& values) {
    if (values.empty()) {
        return kNaN;
    }
    double mean = Mean(values);
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / static_cast<double>(values.size()));
}

double PearsonCorrelation(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size()) {
        return kNaN;
    }
    if (a.size() <= 1) {
        return 1.0;
    }

    double mean_a = Mean(a);
    double mean_b = Mean(b);

    double cov = 0.0;
    double var_a = 0.0;
    double var_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double da = a[i] - mean_a;
        double db = b[i] - mean_b;
        cov += da * db;
        var_a += da * da;
        var_b += db * db;
    }

    if (var_a == 0.0 || var_b == 0.0) {
        return kNaN;
    }

    double r = cov / std::sqrt(var_a * var_b);
    // Rounding can push |r| marginally past 1
    return std::clamp(r, -1.0, 1.0);
}

double Min(const std::vector<double>& values) {
    if (values.empty()) {
        return kNaN;
    }
    return *std::min_element(values.begin(), values.end());
}

double Max(const std::vector<double>& values) {
    if (values.empty()) {
        return kNaN;
    }
    return *std::max_element(values.begin(), values.end());
}

std::vector<double> Linspace(double start, double stop, size_t num) {
    std::vector<double> result;
    if (num == 0) {
        return result;
    }
    result.reserve(num);
    if (num == 1) {
        result.push_back(start);
        return result;
    }

    double step = (stop - start) / static_cast<double>(num - 1);
    for (size_t i = 0; i < num; ++i) {
        result.push_back(start + step * static_cast<double>(i));
    }
    // Pin the endpoint exactly
    result.back() = stop;
    return result;
}

}  // namespace plotwise::analysis
