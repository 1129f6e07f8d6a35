#pragma once

/// @file statistics.h
/// @brief Descriptive statistics over numeric series

#include <cstddef>
#include <vector>

namespace plotwise::analysis {

/// @brief Arithmetic mean; NaN for an empty series
double Mean(const std::vector<double>& values);

/// @brief Population standard deviation (ddof = 0); NaN for an empty series
double PopulationStdDev(const std::vector<double>& values);

/// @brief Pearson correlation coefficient
///
/// Returns 1.0 when the series hold at most one point and NaN when either
/// series is constant or the lengths differ.
double PearsonCorrelation(const std::vector<double>& a, const std::vector<double>& b);

double Min(const std::vector<double>& values);
double Max(const std::vector<double>& values);

/// @brief num evenly spaced samples over [start, stop], endpoints included
std::vector<double> Linspace(double start, double stop, size_t num);

}  // namespace plotwise::analysis
