#include "ccd_calib/io/frame_loader.hpp"
#include "ccd_calib/core/errors.hpp"
#include "ccd_calib/core/utils.hpp"

#include <cmath>
#include <iostream>
#include <limits>

namespace ccd_calib::io {

namespace {

double require_number(const FitsHeader& header, const char* key, const std::string& frame_name) {
    auto v = header.get_number(key);
    if (!v) {
        throw MalformedFrameError(frame_name + ": missing header key " + key);
    }
    if (!std::isfinite(*v)) {
        throw MalformedFrameError(frame_name + ": non-finite " + key);
    }
    return *v;
}

int require_extent(const FitsHeader& header, const char* key, const std::string& frame_name) {
    double v = require_number(header, key, frame_name);
    if (v < 0.0 || v != std::floor(v) ||
        v > static_cast<double>(std::numeric_limits<int>::max())) {
        throw MalformedFrameError(frame_name + ": " + key + " must be a non-negative integer");
    }
    return static_cast<int>(v);
}

FrameShape shape_after_trim(const FitsDimensions& dims, int cover, int rover,
                            const std::string& frame_name) {
    FrameShape shape{dims.naxis2 - rover, dims.naxis1 - cover};
    if (shape.rows <= 0 || shape.cols <= 0) {
        throw MalformedFrameError(frame_name + ": overscan covers the whole image");
    }
    return shape;
}

} // namespace

FrameMetadata parse_frame_metadata(const FitsHeader& header, FrameType type,
                                   const std::string& frame_name) {
    FrameMetadata meta;

    double exptime = require_number(header, kKeyExposure, frame_name);
    if (exptime < 0.0) {
        throw MalformedFrameError(frame_name + ": negative " + kKeyExposure);
    }
    meta.exposure_time = static_cast<float>(exptime);
    meta.overscan_columns = require_extent(header, kKeyOverscanCols, frame_name);
    meta.overscan_rows = require_extent(header, kKeyOverscanRows, frame_name);

    if (type == FrameType::SCIENCE) {
        meta.error_estimate = require_number(header, kKeyErrorEstimate, frame_name);
    } else if (auto err = header.get_number(kKeyErrorEstimate)) {
        meta.error_estimate = *err;
    }

    if (auto band = header.get_string(kKeyBand)) {
        if (!band->empty()) meta.band = *band;
    }

    return meta;
}

Frame load_frame(const fs::path& path, FrameType type) {
    auto [data, header] = read_fits_float(path);

    Frame frame;
    frame.path = path;
    frame.meta = parse_frame_metadata(header, type, path.filename().string());
    frame.data = std::move(data);
    return frame;
}

std::vector<fs::path> list_frames(const fs::path& dir, const std::string& pattern) {
    return core::discover_frames(dir, pattern);
}

FrameShape peek_frame_shape(const fs::path& dir, const std::string& pattern) {
    for (const auto& path : list_frames(dir, pattern)) {
        try {
            auto [dims, header] = read_fits_header(path);
            const std::string name = path.filename().string();
            int cover = require_extent(header, kKeyOverscanCols, name);
            int rover = require_extent(header, kKeyOverscanRows, name);
            return shape_after_trim(dims, cover, rover, name);
        } catch (const CcdCalibError& e) {
            std::cerr << "[SCAN] Skipping " << path.filename().string()
                      << " when reading the frame shape: " << e.what() << std::endl;
        }
    }
    throw EmptyDirectoryError("no readable frame in " + dir.string());
}

FrameShape peek_frame_shape(const fs::path& dir, const std::string& pattern, FrameType type,
                            const FrameFilter& accept) {
    for (const auto& path : list_frames(dir, pattern)) {
        try {
            auto [dims, header] = read_fits_header(path);
            const std::string name = path.filename().string();
            FrameMetadata meta = parse_frame_metadata(header, type, name);
            if (accept && !accept(meta)) {
                continue;
            }
            return shape_after_trim(dims, meta.overscan_columns, meta.overscan_rows, name);
        } catch (const CcdCalibError& e) {
            std::cerr << "[SCAN] Skipping " << path.filename().string()
                      << " when reading the frame shape: " << e.what() << std::endl;
        }
    }
    throw EmptyDirectoryError("no qualifying frame in " + dir.string());
}

} // namespace ccd_calib::io
