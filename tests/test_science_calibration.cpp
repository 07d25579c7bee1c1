#include "ccd_calib/core/errors.hpp"
#include "ccd_calib/image/calibration.hpp"

#include "test_fixtures.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using ccd_calib::MasterFrame;
using ccd_calib::MasterKind;
using ccd_calib::Matrix2Df;
using ccd_calib::testing::RawFrameSpec;
using ccd_calib::testing::TempDir;
using ccd_calib::testing::write_frame_set;
using ccd_calib::testing::write_raw_frame;
namespace image = ccd_calib::image;

namespace {

RawFrameSpec spec_for(float value, double exptime) {
    RawFrameSpec s;
    s.rows = 9;
    s.cols = 10;
    s.value = value;
    s.exptime = exptime;
    return s;
}

// Bias 100, dark 160 @ 60 s, flat 1000 @ 30 s, science 1100 @ 30 s.
void write_observation(const TempDir& tmp) {
    write_frame_set(tmp / "Bias", 3, spec_for(100.0f, 0.0));
    write_frame_set(tmp / "Dark", 3, spec_for(160.0f, 60.0));
    write_frame_set(tmp / "Flat/V", 3, spec_for(1000.0f, 30.0));

    RawFrameSpec sci = spec_for(1100.0f, 30.0);
    sci.error_estimate = 0.5;
    sci.band = "V";
    write_frame_set(tmp / "Sci/V", 2, sci);
}

constexpr float kExpected = (1100.0f - 100.0f) / 30.0f - 1.0f;

} // namespace

TEST_CASE("science_end_to_end_from_sources") {
    TempDir tmp;
    write_observation(tmp);

    image::ScienceSource source{tmp / "Sci/V",
                                image::BiasSource{tmp / "Bias"},
                                image::DarkSource{tmp / "Dark", image::BiasSource{tmp / "Bias"}},
                                image::FlatSource{tmp / "Flat/V", image::BiasSource{tmp / "Bias"},
                                                  image::DarkSource{tmp / "Dark",
                                                                    image::BiasSource{tmp / "Bias"}}}};
    auto images = image::calibrate_science(source);

    REQUIRE(images.size() == 2);
    REQUIRE(images[0].filename == "frame_01.fits");
    REQUIRE(images[1].filename == "frame_02.fits");
    for (const auto& img : images) {
        REQUIRE(img.data.rows() == 9);
        REQUIRE(img.data.cols() == 10);
        REQUIRE(img.error_estimate == Catch::Approx(0.5));
        REQUIRE(img.band.value() == "V");
        REQUIRE(img.data.minCoeff() == Catch::Approx(32.333f).epsilon(1e-4));
        REQUIRE(img.data.maxCoeff() == Catch::Approx(32.333f).epsilon(1e-4));
    }
}

TEST_CASE("science_with_precomputed_masters_matches_sources") {
    TempDir tmp;
    write_observation(tmp);

    auto bias = image::build_master_bias({tmp / "Bias"}).master;
    auto dark = image::build_master_dark({tmp / "Dark", bias}).master;
    auto flat = image::build_master_flat({tmp / "Flat/V", bias, dark}).master;

    auto images = image::calibrate_science({tmp / "Sci/V", bias, dark, flat});
    REQUIRE(images.size() == 2);
    REQUIRE(images[0].data(4, 5) == Catch::Approx(kExpected));
}

TEST_CASE("science_frame_formula_uses_all_masters") {
    RawFrameSpec spec = spec_for(1100.0f, 30.0);
    spec.error_estimate = 0.1;

    ccd_calib::Frame raw;
    raw.path = "sci.fits";
    raw.data = ccd_calib::testing::raw_pixels(spec);
    raw.meta.exposure_time = 30.0f;
    raw.meta.overscan_columns = spec.cover;
    raw.meta.overscan_rows = spec.rover;
    raw.meta.error_estimate = 0.1;

    MasterFrame bias{MasterKind::BIAS, Matrix2Df::Constant(9, 10, 100.0f), 1};
    MasterFrame dark{MasterKind::DARK, Matrix2Df::Constant(9, 10, 1.0f), 1};
    MasterFrame flat{MasterKind::FLAT, Matrix2Df::Constant(9, 10, 2.0f), 1};

    auto img = image::calibrate_science_frame(raw, bias, dark, flat);
    REQUIRE(img.filename == "sci.fits");
    REQUIRE(img.data(0, 0) == Catch::Approx(kExpected / 2.0f));
    REQUIRE(img.error_estimate == Catch::Approx(0.1));
    REQUIRE_FALSE(img.band.has_value());
}

TEST_CASE("science_frame_requires_error_estimate") {
    RawFrameSpec spec = spec_for(1100.0f, 30.0);
    ccd_calib::Frame raw;
    raw.path = "sci.fits";
    raw.data = ccd_calib::testing::raw_pixels(spec);
    raw.meta.exposure_time = 30.0f;
    raw.meta.overscan_columns = spec.cover;
    raw.meta.overscan_rows = spec.rover;

    MasterFrame bias{MasterKind::BIAS, Matrix2Df::Constant(9, 10, 100.0f), 1};
    MasterFrame dark{MasterKind::DARK, Matrix2Df::Zero(9, 10), 1};
    MasterFrame flat{MasterKind::FLAT, Matrix2Df::Ones(9, 10), 1};

    REQUIRE_THROWS_AS(image::calibrate_science_frame(raw, bias, dark, flat),
                      ccd_calib::MalformedFrameError);
}

TEST_CASE("science_directory_without_error_card_is_malformed") {
    TempDir tmp;
    write_frame_set(tmp / "Sci", 1, spec_for(1100.0f, 30.0));

    MasterFrame bias{MasterKind::BIAS, Matrix2Df::Constant(9, 10, 100.0f), 1};
    MasterFrame dark{MasterKind::DARK, Matrix2Df::Zero(9, 10), 1};
    MasterFrame flat{MasterKind::FLAT, Matrix2Df::Ones(9, 10), 1};

    REQUIRE_THROWS_AS(image::calibrate_science({tmp / "Sci", bias, dark, flat}),
                      ccd_calib::MalformedFrameError);
}

TEST_CASE("science_empty_directory_throws") {
    TempDir tmp;
    MasterFrame bias{MasterKind::BIAS, Matrix2Df::Zero(9, 10), 1};
    MasterFrame dark{MasterKind::DARK, Matrix2Df::Zero(9, 10), 1};
    MasterFrame flat{MasterKind::FLAT, Matrix2Df::Ones(9, 10), 1};

    REQUIRE_THROWS_AS(image::calibrate_science({tmp / "Sci", bias, dark, flat}),
                      ccd_calib::EmptyDirectoryError);
}

TEST_CASE("science_line_removal_repairs_hot_column") {
    RawFrameSpec spec = spec_for(1100.0f, 30.0);
    ccd_calib::Frame raw;
    raw.path = "sci.fits";
    raw.data = ccd_calib::testing::raw_pixels(spec);
    raw.data.col(3).head(9).setConstant(100000.0f);
    raw.meta.exposure_time = 30.0f;
    raw.meta.overscan_columns = spec.cover;
    raw.meta.overscan_rows = spec.rover;
    raw.meta.error_estimate = 0.0;

    MasterFrame bias{MasterKind::BIAS, Matrix2Df::Constant(9, 10, 100.0f), 1};
    MasterFrame dark{MasterKind::DARK, Matrix2Df::Constant(9, 10, 1.0f), 1};
    MasterFrame flat{MasterKind::FLAT, Matrix2Df::Ones(9, 10), 1};

    auto repaired = image::calibrate_science_frame(raw, bias, dark, flat);
    REQUIRE(repaired.data(2, 3) == Catch::Approx(kExpected));

    image::CalibrationOptions no_lines;
    no_lines.remove_lines = false;
    auto kept = image::calibrate_science_frame(raw, bias, dark, flat, no_lines);
    REQUIRE(kept.data(2, 3) > 1000.0f);
}
