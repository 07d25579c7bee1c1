#pragma once

#include "ccd_calib/core/types.hpp"

namespace ccd_calib::image {

// Drop `cover` trailing columns and `rover` trailing rows. Throws
// MalformedFrameError if an extent is negative or exceeds the array.
Matrix2Df trim_overscan(const Matrix2Df& raw, int cover, int rover);

// Same, with extents taken from the frame's metadata.
Matrix2Df trim_overscan(const Frame& frame);

// Shape that trim_overscan would produce.
FrameShape trimmed_shape(int rows, int cols, int cover, int rover);

} // namespace ccd_calib::image
