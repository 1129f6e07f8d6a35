/// @file analysis_engine_test.cpp
/// @brief Tests for the analysis engine operations

#include <cmath>
#include <numeric>

#include <gtest/gtest.h>

#include "analysis/analysis_engine.h"

namespace plotwise::analysis {
namespace {

class AnalysisEngineTest : public ::testing::Test {
protected:
    static std::vector<double> Range(int n) {
        std::vector<double> values(static_cast<size_t>(n));
        std::iota(values.begin(), values.end(), 0.0);
        return values;
    }

    static std::vector<double> Map(const std::vector<double>& x, double (*fn)(double)) {
        std::vector<double> out;
        out.reserve(x.size());
        for (double v : x) {
            out.push_back(fn(v));
        }
        return out;
    }

    const SeriesNames names_{.x = "t", .y = "v"};
};

// ============================================================================
// Derivative
// ============================================================================

TEST_F(AnalysisEngineTest, CentralDerivativeOfSquare) {
    auto x = Range(5);
    auto y = Map(x, [](double v) { return v * v; });

    auto result = AnalysisEngine::CalculateDerivative(x, y, names_, DerivativeMethod::kCentral);
    ASSERT_TRUE(result.ok()) << result.status().message();

    std::vector<double> expected = {1.0, 2.0, 4.0, 6.0, 7.0};
    ASSERT_EQ(result->result_series.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_NEAR(result->result_series[i], expected[i], 1e-12) << "at " << i;
    }
    EXPECT_EQ(result->analysis_type, AnalysisType::kDerivative);
    EXPECT_EQ(result->source_columns, std::vector<std::string>{"v"});
    EXPECT_EQ(result->ColumnName(), "v_derivative");
    EXPECT_DOUBLE_EQ(result->statistics.at("min"), 1.0);
    EXPECT_DOUBLE_EQ(result->statistics.at("max"), 7.0);
    EXPECT_DOUBLE_EQ(result->statistics.at("mean"), 4.0);
    EXPECT_EQ(result->metadata.at("method_used"), "central");
}

TEST_F(AnalysisEngineTest, ForwardDerivativeRepeatsLastValue) {
    auto x = Range(5);
    auto y = Map(x, [](double v) { return v * v; });

    auto result = AnalysisEngine::CalculateDerivative(x, y, names_, DerivativeMethod::kForward);
    ASSERT_TRUE(result.ok());

    const auto& d = result->result_series;
    ASSERT_EQ(d.size(), 5);
    EXPECT_DOUBLE_EQ(d[0], 1.0);
    EXPECT_DOUBLE_EQ(d[3], 7.0);
    EXPECT_DOUBLE_EQ(d[4], d[3]);
}

TEST_F(AnalysisEngineTest, BackwardDerivativeRepeatsFirstValue) {
    auto x = Range(5);
    auto y = Map(x, [](double v) { return v * v; });

    auto result = AnalysisEngine::CalculateDerivative(x, y, names_, DerivativeMethod::kBackward);
    ASSERT_TRUE(result.ok());

    const auto& d = result->result_series;
    ASSERT_EQ(d.size(), 5);
    EXPECT_DOUBLE_EQ(d[0], d[1]);
    EXPECT_DOUBLE_EQ(d[1], 1.0);
    EXPECT_DOUBLE_EQ(d[4], 7.0);
}

TEST_F(AnalysisEngineTest, DerivativeLengthMatchesSlice) {
    auto x = Range(10);
    auto y = Map(x, [](double v) { return std::sin(v); });

    for (auto method : {DerivativeMethod::kCentral, DerivativeMethod::kForward,
                        DerivativeMethod::kBackward}) {
        auto result = AnalysisEngine::CalculateDerivative(x, y, names_, method, 2, 7);
        ASSERT_TRUE(result.ok());
        EXPECT_EQ(result->result_series.size(), 5);
        EXPECT_EQ(result->x_slice.front(), 2.0);
        EXPECT_EQ(result->parameters.start_index, 2);
        EXPECT_EQ(result->parameters.end_index, 7);
    }
}

TEST_F(AnalysisEngineTest, EndIndexPastLengthIsClamped) {
    auto x = Range(6);
    auto y = Range(6);

    auto result = AnalysisEngine::CalculateDerivative(x, y, names_, DerivativeMethod::kCentral,
                                                      1, 100);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->result_series.size(), 5);
    EXPECT_EQ(result->parameters.end_index, 6);
}

TEST_F(AnalysisEngineTest, RejectsUnusableInput) {
    auto x = Range(5);
    auto y = Range(4);
    EXPECT_EQ(AnalysisEngine::CalculateDerivative(x, y, names_).status().code(),
              absl::StatusCode::kInvalidArgument);

    auto y5 = Range(5);
    EXPECT_FALSE(AnalysisEngine::CalculateDerivative(x, y5, names_,
                                                     DerivativeMethod::kCentral, 3, 3).ok());
    EXPECT_FALSE(AnalysisEngine::CalculateDerivative(x, y5, names_,
                                                     DerivativeMethod::kCentral, -1).ok());
    EXPECT_FALSE(AnalysisEngine::CalculateDerivative(x, y5, names_,
                                                     DerivativeMethod::kCentral, 4).ok());
    EXPECT_FALSE(AnalysisEngine::CalculateIntegral({}, {}, names_).ok());
}

// ============================================================================
// Integral and arc length
// ============================================================================

TEST_F(AnalysisEngineTest, CumulativeIntegralOfLine) {
    auto x = Range(5);
    auto y = Map(x, [](double v) { return 2.0 * v; });

    auto result = AnalysisEngine::CalculateIntegral(x, y, names_);
    ASSERT_TRUE(result.ok());

    std::vector<double> expected = {0.0, 1.0, 4.0, 9.0, 16.0};
    EXPECT_EQ(result->result_series, expected);
    EXPECT_DOUBLE_EQ(result->result_series.front(), 0.0);
    EXPECT_NEAR(result->result_series.back(), result->statistics.at("total_integral"), 1e-12);
    EXPECT_DOUBLE_EQ(result->statistics.at("mean_rate"), 4.0);
    EXPECT_EQ(result->metadata.at("method"), "trapezoidal");
}

TEST_F(AnalysisEngineTest, SinglePointIntegralIsZero) {
    auto result = AnalysisEngine::CalculateIntegral({3.0}, {7.0}, names_);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->result_series, std::vector<double>{0.0});
    EXPECT_DOUBLE_EQ(result->statistics.at("mean_rate"), 0.0);
}

TEST_F(AnalysisEngineTest, ArcLengthSumsSegments) {
    std::vector<double> x = {0.0, 3.0, 6.0, 6.0};
    std::vector<double> y = {0.0, 4.0, 8.0, 10.0};

    auto result = AnalysisEngine::CalculateArcLength(x, y, names_);
    ASSERT_TRUE(result.ok());

    std::vector<double> expected = {0.0, 5.0, 10.0, 12.0};
    ASSERT_EQ(result->result_series.size(), 4);
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_NEAR(result->result_series[i], expected[i], 1e-12);
    }
    EXPECT_NEAR(result->statistics.at("total_length"), 12.0, 1e-12);
    EXPECT_NEAR(result->statistics.at("mean_segment"), 4.0, 1e-12);
    EXPECT_NEAR(result->statistics.at("max_segment"), 5.0, 1e-12);
    EXPECT_EQ(result->source_columns, (std::vector<std::string>{"t", "v"}));
}

// ============================================================================
// Smoothing
// ============================================================================

TEST_F(AnalysisEngineTest, ConstantInputHasZeroNoiseReduction) {
    auto x = Range(12);
    std::vector<double> y(12, 3.5);

    for (auto method : {SmoothingMethod::kSavgol, SmoothingMethod::kRollingMean,
                        SmoothingMethod::kLowess}) {
        auto result = AnalysisEngine::SmoothData(x, y, names_, method);
        ASSERT_TRUE(result.ok()) << ToString(method);
        EXPECT_DOUBLE_EQ(result->statistics.at("noise_reduction_percent"), 0.0)
            << ToString(method);
        EXPECT_TRUE(std::isnan(result->statistics.at("correlation"))) << ToString(method);
        for (double v : result->result_series) {
            EXPECT_NEAR(v, 3.5, 1e-9);
        }
    }
}

TEST_F(AnalysisEngineTest, SavgolPreservesCubic) {
    auto x = Range(15);
    auto y = Map(x, [](double v) { return 0.5 * v * v * v - v; });

    auto result = AnalysisEngine::SmoothData(x, y, names_, SmoothingMethod::kSavgol);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result->result_series.size(), y.size());
    for (size_t i = 0; i < y.size(); ++i) {
        EXPECT_NEAR(result->result_series[i], y[i], 1e-6) << "at " << i;
    }
    EXPECT_EQ(result->parameters.window_length, 11);
    EXPECT_EQ(result->parameters.polynomial_order, 3);
}

TEST_F(AnalysisEngineTest, RollingMeanFillsEdges) {
    std::vector<double> x = Range(8);
    std::vector<double> y = {1, 2, 3, 4, 5, 6, 7, 8};

    AnalysisParameters params;
    params.window_length = 3;
    auto result = AnalysisEngine::SmoothData(x, y, names_, SmoothingMethod::kRollingMean, params);
    ASSERT_TRUE(result.ok());

    std::vector<double> expected = {2, 2, 3, 4, 5, 6, 7, 7};
    ASSERT_EQ(result->result_series.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_NEAR(result->result_series[i], expected[i], 1e-12) << "at " << i;
    }
    EXPECT_GT(result->statistics.at("noise_reduction_percent"), 0.0);
}

TEST_F(AnalysisEngineTest, LowessFallsBackToRollingMean) {
    auto x = Range(5);
    std::vector<double> y = {1, 4, 2, 5, 3};

    auto result = AnalysisEngine::SmoothData(x, y, names_, SmoothingMethod::kLowess);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->metadata.at("fallback"), "rolling_mean");
    EXPECT_EQ(result->metadata.at("method_used"), "lowess");
    EXPECT_EQ(result->result_series.size(), 5);
}

TEST_F(AnalysisEngineTest, LowessFollowsLinearTrend) {
    auto x = Range(30);
    auto y = Map(x, [](double v) { return 2.0 * v + 1.0; });

    AnalysisParameters params;
    params.additional["frac"] = 0.3;
    auto result = AnalysisEngine::SmoothData(x, y, names_, SmoothingMethod::kLowess, params);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->metadata.count("fallback"), 0);
    for (size_t i = 0; i < y.size(); ++i) {
        EXPECT_NEAR(result->result_series[i], y[i], 1e-6);
    }
}

// ============================================================================
// Interpolation
// ============================================================================

TEST_F(AnalysisEngineTest, CubicDowngradesToLinearOnThreePoints) {
    std::vector<double> x = {0.0, 1.0, 2.0};
    std::vector<double> y = {0.0, 3.0, 1.0};

    auto cubic = AnalysisEngine::InterpolateData(x, y, names_, InterpolationMethod::kCubic);
    auto linear = AnalysisEngine::InterpolateData(x, y, names_, InterpolationMethod::kLinear);
    ASSERT_TRUE(cubic.ok());
    ASSERT_TRUE(linear.ok());

    EXPECT_EQ(cubic->result_series, linear->result_series);
    EXPECT_EQ(cubic->metadata.at("method_used"), "linear");
    EXPECT_EQ(cubic->parameters.method, "linear");
}

TEST_F(AnalysisEngineTest, InterpolationDefaultsToTwicePoints) {
    auto x = Range(6);
    auto y = Map(x, [](double v) { return 2.0 * v + 1.0; });

    auto result = AnalysisEngine::InterpolateData(x, y, names_, InterpolationMethod::kLinear);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result->result_series.size(), 12);
    ASSERT_EQ(result->x_slice.size(), 12);
    EXPECT_DOUBLE_EQ(result->x_slice.front(), 0.0);
    EXPECT_DOUBLE_EQ(result->x_slice.back(), 5.0);
    for (size_t i = 0; i < 12; ++i) {
        EXPECT_NEAR(result->result_series[i], 2.0 * result->x_slice[i] + 1.0, 1e-12);
    }
    EXPECT_DOUBLE_EQ(result->statistics.at("original_points"), 6.0);
    EXPECT_DOUBLE_EQ(result->statistics.at("interpolated_points"), 12.0);
    EXPECT_DOUBLE_EQ(result->statistics.at("point_density_ratio"), 2.0);
    EXPECT_DOUBLE_EQ(result->statistics.at("x_range"), 5.0);
}

TEST_F(AnalysisEngineTest, CubicReproducesCubicPolynomial) {
    auto x = Range(7);
    auto y = Map(x, [](double v) { return v * v * v - 2.0 * v; });

    AnalysisParameters params;
    params.num_points = 25;
    auto result = AnalysisEngine::InterpolateData(x, y, names_, InterpolationMethod::kCubic,
                                                  params);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->metadata.at("method_used"), "cubic");
    for (size_t i = 0; i < result->x_slice.size(); ++i) {
        double xv = result->x_slice[i];
        EXPECT_NEAR(result->result_series[i], xv * xv * xv - 2.0 * xv, 1e-8);
    }
}

TEST_F(AnalysisEngineTest, RejectsZeroInterpolationPoints) {
    auto x = Range(5);
    AnalysisParameters params;
    params.num_points = 0;
    auto result = AnalysisEngine::InterpolateData(x, x, names_, InterpolationMethod::kLinear,
                                                  params);
    EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(AnalysisEngineTest, AnalyzeUsesDefaultMethod) {
    auto x = Range(5);
    auto y = Map(x, [](double v) { return v * v; });

    auto result = AnalysisEngine::Analyze(AnalysisType::kDerivative, x, y, names_);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->parameters.method, "central");
}

TEST_F(AnalysisEngineTest, AnalyzeRejectsUnknownMethod) {
    auto x = Range(5);
    AnalysisParameters params;
    params.method = "spline";

    auto result = AnalysisEngine::Analyze(AnalysisType::kSmoothing, x, x, names_, params);
    EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(AnalysisEngineTest, AnalyzeRespectsSliceParameters) {
    auto x = Range(10);
    auto y = Range(10);
    AnalysisParameters params;
    params.start_index = 4;

    auto result = AnalysisEngine::Analyze(AnalysisType::kIntegral, x, y, names_, params);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->result_series.size(), 6);
}

}  // namespace
}  // namespace plotwise::analysis
