#pragma once

#include "ccd_calib/core/types.hpp"
#include "ccd_calib/core/utils.hpp"
#include "ccd_calib/io/fits_io.hpp"
#include "ccd_calib/io/frame_loader.hpp"

#include <atomic>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace ccd_calib::testing {

namespace fs = std::filesystem;

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                ("ccd_calib_test_" + core::get_run_id() + "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& sub) const { return path_ / sub; }

private:
    fs::path path_;
};

struct RawFrameSpec {
    int rows = 8;         // trimmed rows
    int cols = 8;         // trimmed columns
    int cover = 2;
    int rover = 1;
    float value = 0.0f;
    float overscan_value = 5000.0f;
    double exptime = 0.0;
    std::optional<double> error_estimate;
    std::optional<std::string> band;
};

inline Matrix2Df raw_pixels(const RawFrameSpec& spec) {
    Matrix2Df data = Matrix2Df::Constant(spec.rows + spec.rover, spec.cols + spec.cover,
                                         spec.overscan_value);
    data.topLeftCorner(spec.rows, spec.cols).setConstant(spec.value);
    return data;
}

inline void write_raw_frame(const fs::path& path, const Matrix2Df& data, const RawFrameSpec& spec) {
    fs::create_directories(path.parent_path());
    io::FitsHeader hdr;
    hdr.set(io::kKeyExposure, spec.exptime);
    hdr.set(io::kKeyOverscanCols, spec.cover);
    hdr.set(io::kKeyOverscanRows, spec.rover);
    if (spec.error_estimate) {
        hdr.set(io::kKeyErrorEstimate, *spec.error_estimate);
    }
    if (spec.band) {
        hdr.set(io::kKeyBand, *spec.band);
    }
    io::write_fits_float(path, data, hdr);
}

inline void write_raw_frame(const fs::path& path, const RawFrameSpec& spec) {
    write_raw_frame(path, raw_pixels(spec), spec);
}

// `n` identical frames named frame_01.fits ... into `dir`.
inline void write_frame_set(const fs::path& dir, int n, const RawFrameSpec& spec) {
    for (int i = 1; i <= n; ++i) {
        std::string name = (i < 10 ? "frame_0" : "frame_") + std::to_string(i) + ".fits";
        write_raw_frame(dir / name, spec);
    }
}

} // namespace ccd_calib::testing
