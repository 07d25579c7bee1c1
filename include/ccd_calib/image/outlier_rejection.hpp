#pragma once

#include "ccd_calib/core/types.hpp"

namespace ccd_calib::image {

struct SigmaClipParams {
    float sigma = 5.0f;
    int max_iters = 5;
};

// Mask every pixel farther than sigma * std from the frame mean. Shape is
// preserved; rejected pixels keep their value but are marked invalid.
MaskedFrame sigma_clip(const Matrix2Df& data, const SigmaClipParams& params = {});

// Smallest valid value. Throws CalibrationError if nothing is valid.
float masked_min(const MaskedFrame& frame);

} // namespace ccd_calib::image
