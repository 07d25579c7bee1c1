#include "ccd_calib/image/outlier_rejection.hpp"
#include "ccd_calib/core/errors.hpp"
#include "ccd_calib/core/statistics.hpp"

#include <limits>

namespace ccd_calib::image {

MaskedFrame sigma_clip(const Matrix2Df& data, const SigmaClipParams& params) {
    auto flags = core::flag_extremes(
        data, core::Axis::ALL, core::ExtremeCriterion::sigma_clip(params.sigma, params.max_iters));

    MaskedFrame out;
    out.data = data;
    out.valid = Mask2D::Constant(data.rows(), data.cols(), true);
    if (flags.high.size() == 0) {
        return out;
    }

    // Axis::ALL flattens in storage order, which is row-major here.
    Eigen::Map<Eigen::Array<bool, Eigen::Dynamic, 1>> valid_flat(out.valid.data(), out.valid.size());
    valid_flat = !flags.any();
    return out;
}

float masked_min(const MaskedFrame& frame) {
    float m = std::numeric_limits<float>::infinity();
    bool any = false;
    for (Eigen::Index i = 0; i < frame.data.size(); ++i) {
        if (!frame.valid.data()[i]) continue;
        any = true;
        if (frame.data.data()[i] < m) m = frame.data.data()[i];
    }
    if (!any) {
        throw CalibrationError("no valid pixels left after outlier rejection");
    }
    return m;
}

} // namespace ccd_calib::image
