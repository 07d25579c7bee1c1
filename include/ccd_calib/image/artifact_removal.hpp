#pragma once

#include "ccd_calib/core/types.hpp"

#include <vector>

namespace ccd_calib::image {

struct LineRemovalParams {
    float upper_percentile = 95.0f;
    float lower_percentile = 10.0f;
    int half_window = 5;  // neighbours on each side in the repair median
};

struct LineColumns {
    std::vector<int> bright;  // column sum above the upper percentile
    std::vector<int> dark;    // column sum below the lower percentile
};

// Classify columns of `img` by their summed brightness.
LineColumns detect_line_columns(const Matrix2Df& img, const LineRemovalParams& params = {});

/**
 * Repair column-line defects. Every pixel of a flagged column is replaced by
 * the median of the same row over columns [col - half_window, col + half_window]
 * clipped to the image; the window always includes the column itself.
 * Bright columns are repaired first, then dark ones, each in ascending order,
 * in place. Unflagged columns are returned untouched.
 */
Matrix2Df remove_column_lines(const Matrix2Df& img, const LineRemovalParams& params = {});

} // namespace ccd_calib::image
