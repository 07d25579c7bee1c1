#include "ccd_calib/image/artifact_removal.hpp"
#include "ccd_calib/core/errors.hpp"
#include "ccd_calib/core/statistics.hpp"

#include <algorithm>

namespace ccd_calib::image {

namespace {

std::vector<int> flagged_indices(const core::FlagVector& flags) {
    std::vector<int> out;
    for (Eigen::Index i = 0; i < flags.size(); ++i) {
        if (flags[i]) out.push_back(static_cast<int>(i));
    }
    return out;
}

void repair_column(Matrix2Df& data, int col, int half_window) {
    const int w = static_cast<int>(data.cols());
    const int x0 = std::max(0, col - half_window);
    const int x1 = std::min(w - 1, col + half_window);

    std::vector<float> window;
    window.reserve(static_cast<size_t>(x1 - x0 + 1));
    for (Eigen::Index y = 0; y < data.rows(); ++y) {
        window.clear();
        for (int x = x0; x <= x1; ++x) {
            window.push_back(data(y, x));
        }
        data(y, col) = core::compute_median(window);
    }
}

} // namespace

LineColumns detect_line_columns(const Matrix2Df& img, const LineRemovalParams& params) {
    LineColumns cols;
    if (img.size() == 0) return cols;

    auto flags = core::flag_extremes(
        img, core::Axis::ROWS,
        core::ExtremeCriterion::percentile(params.upper_percentile, params.lower_percentile));
    cols.bright = flagged_indices(flags.high);
    cols.dark = flagged_indices(flags.low);
    return cols;
}

Matrix2Df remove_column_lines(const Matrix2Df& img, const LineRemovalParams& params) {
    if (params.half_window < 1) {
        throw ValidationError("line removal half_window must be >= 1");
    }

    Matrix2Df data = img;
    LineColumns cols = detect_line_columns(img, params);

    for (int c : cols.bright) repair_column(data, c, params.half_window);
    for (int c : cols.dark) repair_column(data, c, params.half_window);

    return data;
}

} // namespace ccd_calib::image
