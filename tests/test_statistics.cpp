#include "ccd_calib/core/errors.hpp"
#include "ccd_calib/core/statistics.hpp"

#include <limits>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using ccd_calib::Matrix2Df;
using ccd_calib::VectorXf;
namespace core = ccd_calib::core;

TEST_CASE("compute_percentile_interpolates_linearly") {
    VectorXf v(5);
    v << 5.0f, 1.0f, 4.0f, 2.0f, 3.0f;

    REQUIRE(core::compute_percentile(v, 50.0f) == Catch::Approx(3.0f));
    REQUIRE(core::compute_percentile(v, 10.0f) == Catch::Approx(1.4f));
    REQUIRE(core::compute_percentile(v, 0.0f) == Catch::Approx(1.0f));
    REQUIRE(core::compute_percentile(v, 100.0f) == Catch::Approx(5.0f));
}

TEST_CASE("compute_median_odd_and_even") {
    REQUIRE(core::compute_median({3.0f, 1.0f, 2.0f}) == 2.0f);
    REQUIRE(core::compute_median({4.0f, 1.0f, 3.0f, 2.0f}) == Catch::Approx(2.5f));
}

TEST_CASE("reduce_axis_rows_gives_column_sums") {
    Matrix2Df m(2, 3);
    m << 1.0f, 2.0f, 3.0f,
         4.0f, 5.0f, 6.0f;

    VectorXf profile = core::reduce_axis(m, core::Axis::ROWS);
    REQUIRE(profile.size() == 3);
    REQUIRE(profile[0] == 5.0f);
    REQUIRE(profile[1] == 7.0f);
    REQUIRE(profile[2] == 9.0f);

    VectorXf flat = core::reduce_axis(m, core::Axis::ALL);
    REQUIRE(flat.size() == 6);
    REQUIRE(flat[3] == 4.0f);
}

TEST_CASE("sigma_flags_single_outlier_on_high_side") {
    VectorXf v = VectorXf::Constant(64, 10.0f);
    v[17] = 10000.0f;

    auto flags = core::flag_extremes(v, core::ExtremeCriterion::sigma_clip(5.0f, 5));
    REQUIRE(flags.count() == 1);
    REQUIRE(flags.high[17]);
    REQUIRE_FALSE(flags.low[17]);
}

TEST_CASE("sigma_flags_nothing_when_std_is_zero") {
    VectorXf v = VectorXf::Constant(10, 3.0f);
    auto flags = core::flag_extremes(v, core::ExtremeCriterion::sigma_clip(5.0f, 5));
    REQUIRE(flags.count() == 0);
}

TEST_CASE("percentile_flags_split_high_and_low") {
    VectorXf v = VectorXf::Constant(20, 200.0f);
    v[3] = 2.0f;
    v[11] = 20000.0f;

    auto flags = core::flag_extremes(v, core::ExtremeCriterion::percentile(95.0f, 10.0f));
    REQUIRE(flags.count() == 2);
    REQUIRE(flags.high[11]);
    REQUIRE(flags.low[3]);
}

TEST_CASE("flag_extremes_empty_input_returns_empty_flags") {
    VectorXf v(0);
    auto flags = core::flag_extremes(v, core::ExtremeCriterion::sigma_clip(5.0f, 5));
    REQUIRE(flags.high.size() == 0);
    REQUIRE(flags.count() == 0);
}

TEST_CASE("flag_extremes_rejects_bad_parameters") {
    VectorXf v = VectorXf::Constant(4, 1.0f);
    REQUIRE_THROWS_AS(core::flag_extremes(v, core::ExtremeCriterion::sigma_clip(0.0f, 5)),
                      ccd_calib::ValidationError);
    REQUIRE_THROWS_AS(core::flag_extremes(v, core::ExtremeCriterion::sigma_clip(5.0f, 0)),
                      ccd_calib::ValidationError);
    REQUIRE_THROWS_AS(core::flag_extremes(v, core::ExtremeCriterion::percentile(10.0f, 90.0f)),
                      ccd_calib::ValidationError);
}

TEST_CASE("non_finite_values_are_flagged_and_ignored") {
    VectorXf v = VectorXf::Constant(64, 10.0f);
    v[0] = std::numeric_limits<float>::quiet_NaN();
    v[1] = std::numeric_limits<float>::infinity();
    v[40] = 10000.0f;

    auto sigma = core::flag_extremes(v, core::ExtremeCriterion::sigma_clip(5.0f, 5));
    REQUIRE(sigma.nonfinite[0]);
    REQUIRE(sigma.nonfinite[1]);
    REQUIRE(sigma.high[40]);
    REQUIRE(sigma.count() == 3);

    VectorXf profile = VectorXf::Constant(20, 200.0f);
    profile[2] = std::numeric_limits<float>::quiet_NaN();
    profile[9] = 20000.0f;
    auto pct = core::flag_extremes(profile, core::ExtremeCriterion::percentile(95.0f, 10.0f));
    REQUIRE(pct.nonfinite[2]);
    REQUIRE_FALSE(pct.high[2]);
    REQUIRE(pct.high[9]);
    REQUIRE(pct.low.count() == 0);
}
