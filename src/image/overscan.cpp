#include "ccd_calib/image/overscan.hpp"
#include "ccd_calib/core/errors.hpp"

#include <string>

namespace ccd_calib::image {

namespace {

FrameShape checked_shape(int rows, int cols, int cover, int rover, const std::string& context) {
    const std::string extents = "(COVER=" + std::to_string(cover) +
                                ", ROVER=" + std::to_string(rover) + ")";
    if (cover < 0 || rover < 0) {
        throw MalformedFrameError(context + "negative overscan extents " + extents);
    }
    if (cover > cols || rover > rows) {
        throw MalformedFrameError(context + "overscan extents " + extents + " exceed " +
                                  std::to_string(rows) + "x" + std::to_string(cols) + " frame");
    }
    return {rows - rover, cols - cover};
}

} // namespace

FrameShape trimmed_shape(int rows, int cols, int cover, int rover) {
    return checked_shape(rows, cols, cover, rover, "");
}

Matrix2Df trim_overscan(const Matrix2Df& raw, int cover, int rover) {
    FrameShape s = trimmed_shape(static_cast<int>(raw.rows()), static_cast<int>(raw.cols()),
                                 cover, rover);
    return raw.topLeftCorner(s.rows, s.cols);
}

Matrix2Df trim_overscan(const Frame& frame) {
    FrameShape s = checked_shape(static_cast<int>(frame.data.rows()),
                                 static_cast<int>(frame.data.cols()),
                                 frame.meta.overscan_columns, frame.meta.overscan_rows,
                                 frame.path.filename().string() + ": ");
    return frame.data.topLeftCorner(s.rows, s.cols);
}

} // namespace ccd_calib::image
