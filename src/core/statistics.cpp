#include "ccd_calib/core/statistics.hpp"
#include "ccd_calib/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace ccd_calib::core {

namespace {

ExtremeFlags flag_sigma(const VectorXf& values, float sigma, int max_iters) {
    const Eigen::Index n = values.size();
    ExtremeFlags flags{FlagVector::Constant(n, false), FlagVector::Constant(n, false),
                       !values.array().isFinite()};
    auto excluded = [&](Eigen::Index i) {
        return flags.high[i] || flags.low[i] || flags.nonfinite[i];
    };

    for (int iter = 0; iter < max_iters; ++iter) {
        double sum = 0.0;
        Eigen::Index count = 0;
        for (Eigen::Index i = 0; i < n; ++i) {
            if (excluded(i)) continue;
            sum += static_cast<double>(values[i]);
            ++count;
        }
        if (count == 0) break;
        const double mean = sum / static_cast<double>(count);

        double var = 0.0;
        for (Eigen::Index i = 0; i < n; ++i) {
            if (excluded(i)) continue;
            const double d = static_cast<double>(values[i]) - mean;
            var += d * d;
        }
        var /= static_cast<double>(count);
        const double stddev = std::sqrt(var);
        if (!(stddev > 0.0)) break;

        const double thr = static_cast<double>(sigma) * stddev;
        int newly_flagged = 0;
        for (Eigen::Index i = 0; i < n; ++i) {
            if (excluded(i)) continue;
            const double d = static_cast<double>(values[i]) - mean;
            if (d > thr) {
                flags.high[i] = true;
                ++newly_flagged;
            } else if (-d > thr) {
                flags.low[i] = true;
                ++newly_flagged;
            }
        }
        if (newly_flagged == 0) break;
    }

    return flags;
}

ExtremeFlags flag_percentile(const VectorXf& values, float upper, float lower) {
    ExtremeFlags flags;
    flags.nonfinite = !values.array().isFinite();

    // Cuts come from the finite values only.
    VectorXf finite(values.size() - flags.nonfinite.count());
    Eigen::Index k = 0;
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        if (!flags.nonfinite[i]) finite[k++] = values[i];
    }
    const float hi = compute_percentile(finite, upper);
    const float lo = compute_percentile(finite, lower);
    flags.high = values.array() > hi && !flags.nonfinite;
    flags.low = values.array() < lo && !flags.nonfinite;
    return flags;
}

} // namespace

VectorXf reduce_axis(const Matrix2Df& data, Axis axis) {
    if (axis == Axis::ALL) {
        return Eigen::Map<const VectorXf>(data.data(), data.size());
    }

    VectorXf profile(data.cols());
    for (Eigen::Index x = 0; x < data.cols(); ++x) {
        double s = 0.0;
        for (Eigen::Index y = 0; y < data.rows(); ++y) {
            s += static_cast<double>(data(y, x));
        }
        profile[x] = static_cast<float>(s);
    }
    return profile;
}

ExtremeFlags flag_extremes(const VectorXf& values, const ExtremeCriterion& criterion) {
    if (values.size() == 0) {
        return {FlagVector(), FlagVector(), FlagVector()};
    }

    switch (criterion.metric) {
        case ExtremeMetric::SIGMA:
            if (!(criterion.sigma > 0.0f) || criterion.max_iters < 1) {
                throw ValidationError("sigma clipping needs sigma > 0 and max_iters >= 1");
            }
            return flag_sigma(values, criterion.sigma, criterion.max_iters);
        case ExtremeMetric::PERCENTILE:
            if (criterion.lower_percentile < 0.0f || criterion.upper_percentile > 100.0f ||
                criterion.lower_percentile > criterion.upper_percentile) {
                throw ValidationError("percentile cuts must satisfy 0 <= lower <= upper <= 100");
            }
            return flag_percentile(values, criterion.upper_percentile, criterion.lower_percentile);
    }
    throw ValidationError("unknown extreme metric");
}

ExtremeFlags flag_extremes(const Matrix2Df& data, Axis axis, const ExtremeCriterion& criterion) {
    return flag_extremes(reduce_axis(data, axis), criterion);
}

float compute_median(std::vector<float> v) {
    if (v.empty()) return 0.0f;
    const size_t n = v.size();
    const size_t mid = n / 2;
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid), v.end());
    const float hi = v[mid];
    if ((n % 2) == 1) return hi;
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid - 1), v.end());
    const float lo = v[mid - 1];
    return 0.5f * (lo + hi);
}

float compute_percentile(const VectorXf& data, float percentile) {
    if (data.size() == 0) return 0.0f;

    std::vector<float> sorted(data.data(), data.data() + data.size());
    std::sort(sorted.begin(), sorted.end());

    float clamped = std::min(std::max(percentile, 0.0f), 100.0f);
    double idx = static_cast<double>(clamped) / 100.0 * static_cast<double>(sorted.size() - 1);
    size_t lower = static_cast<size_t>(idx);
    size_t upper = std::min(lower + 1, sorted.size() - 1);
    double frac = idx - static_cast<double>(lower);

    return static_cast<float>(sorted[lower] * (1.0 - frac) + sorted[upper] * frac);
}

} // namespace ccd_calib::core
