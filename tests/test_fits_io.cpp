#include "ccd_calib/core/errors.hpp"
#include "ccd_calib/io/fits_io.hpp"
#include "ccd_calib/io/frame_store.hpp"

#include "test_fixtures.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using ccd_calib::Matrix2Df;
using ccd_calib::testing::TempDir;
namespace io = ccd_calib::io;

TEST_CASE("write_fits_float_preserves_layout_and_cards") {
    TempDir tmp;
    Matrix2Df data(2, 3);
    data << 1.0f, 2.0f, 3.0f,
            4.0f, 5.0f, 6.0f;

    io::FitsHeader hdr;
    hdr.set("EXPTIME", 30.0);
    hdr.set("COVER", 4);
    hdr.set("FILTER", std::string("V"));
    const auto path = tmp / "img.fits";
    io::write_fits_float(path, data, hdr);

    auto [read, header] = io::read_fits_float(path);
    REQUIRE(read.rows() == 2);
    REQUIRE(read.cols() == 3);
    REQUIRE(read(0, 2) == 3.0f);
    REQUIRE(read(1, 0) == 4.0f);
    REQUIRE(header.get_number("EXPTIME").value() == Catch::Approx(30.0));
    REQUIRE(header.get_number("COVER").value() == Catch::Approx(4.0));
    REQUIRE(header.get_string("FILTER").value() == "V");

    auto [dims, header_only] = io::read_fits_header(path);
    REQUIRE(dims.naxis1 == 3);
    REQUIRE(dims.naxis2 == 2);
    REQUIRE(header_only.get_number("EXPTIME").has_value());
}

TEST_CASE("write_calibrated_tags_error_estimate") {
    TempDir tmp;
    ccd_calib::CalibratedImage img{"sci_001.fits", Matrix2Df::Constant(3, 3, 32.5f), 0.25};

    const auto out_dir = tmp / "clean/Sci/M67/V";
    auto path = io::write_calibrated(img, out_dir, 3);

    REQUIRE(path.filename().string() == "Sci_3.fits");
    auto [data, header] = io::read_fits_float(path);
    REQUIRE(header.get_number(io::kKeyOutputError).value() == Catch::Approx(0.25));
    REQUIRE(header.get_string(io::kKeyOutputSource).value() == "sci_001.fits");
    REQUIRE(data(1, 1) == 32.5f);
}

TEST_CASE("write_calibrated_rejects_zero_index") {
    TempDir tmp;
    ccd_calib::CalibratedImage img{"a.fits", Matrix2Df::Zero(2, 2), 0.0};
    REQUIRE_THROWS_AS(io::write_calibrated(img, tmp.path(), 0), ccd_calib::ValidationError);
}

TEST_CASE("write_master_uses_kind_filename") {
    TempDir tmp;
    ccd_calib::MasterFrame m{ccd_calib::MasterKind::DARK, Matrix2Df::Constant(2, 2, 1.5f), 4};

    auto path = io::write_master(m, tmp / "Dark");
    REQUIRE(path.filename().string() == "Dark.fits");
    REQUIRE(std::filesystem::exists(path));

    // Overwrites an existing file.
    m.data.setConstant(2.5f);
    io::write_master(m, tmp / "Dark");
    auto [data, header] = io::read_fits_float(path);
    REQUIRE(data(0, 0) == 2.5f);
    REQUIRE(header.get_number("NCOMBINE").value() == Catch::Approx(4.0));
}

TEST_CASE("read_fits_float_missing_file_throws") {
    TempDir tmp;
    REQUIRE_THROWS_AS(io::read_fits_float(tmp / "missing.fits"), ccd_calib::FitsError);
}
