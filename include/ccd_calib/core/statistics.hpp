#pragma once

#include "types.hpp"

#include <vector>

namespace ccd_calib::core {

using FlagVector = Eigen::Array<bool, Eigen::Dynamic, 1>;

// How a 2D array is reduced to the 1D sample that gets classified.
enum class Axis {
    ALL,  // every pixel, row-major order
    ROWS  // summed along rows: one value per column
};

// Distance metric deciding what counts as a distribution extreme.
enum class ExtremeMetric {
    SIGMA,      // |x - mean| > sigma * std, iterated
    PERCENTILE  // x > P(upper) or x < P(lower)
};

struct ExtremeCriterion {
    ExtremeMetric metric = ExtremeMetric::SIGMA;
    float sigma = 5.0f;
    int max_iters = 5;
    float upper_percentile = 95.0f;
    float lower_percentile = 10.0f;

    static ExtremeCriterion sigma_clip(float sigma, int max_iters) {
        ExtremeCriterion c;
        c.metric = ExtremeMetric::SIGMA;
        c.sigma = sigma;
        c.max_iters = max_iters;
        return c;
    }

    static ExtremeCriterion percentile(float upper, float lower) {
        ExtremeCriterion c;
        c.metric = ExtremeMetric::PERCENTILE;
        c.upper_percentile = upper;
        c.lower_percentile = lower;
        return c;
    }
};

struct ExtremeFlags {
    FlagVector high;
    FlagVector low;
    FlagVector nonfinite;  // NaN or Inf, excluded from every statistic

    FlagVector any() const { return high || low || nonfinite; }
    int count() const {
        return static_cast<int>(high.count() + low.count() + nonfinite.count());
    }
};

VectorXf reduce_axis(const Matrix2Df& data, Axis axis);

ExtremeFlags flag_extremes(const VectorXf& values, const ExtremeCriterion& criterion);

// Convenience: reduce then classify.
ExtremeFlags flag_extremes(const Matrix2Df& data, Axis axis, const ExtremeCriterion& criterion);

float compute_median(std::vector<float> values);

// Linear interpolation between order statistics (NumPy default).
float compute_percentile(const VectorXf& data, float percentile);

} // namespace ccd_calib::core
