#pragma once

#include "ccd_calib/core/types.hpp"

namespace ccd_calib::io {

// File name of a persisted master: "Bias.fits", "Dark.fits" or "Flat.fits".
std::string master_filename(MasterKind kind);

// "Sci_<index>.fits", index is 1-based.
std::string science_filename(int index);

// Write `master` into `out_dir`, creating it if needed. Returns the path.
fs::path write_master(const MasterFrame& master, const fs::path& out_dir);

/**
 * Write one calibrated science image as Sci_<index>.fits. The error estimate
 * goes to the ERROR card and the source file name to ORIGFILE.
 */
fs::path write_calibrated(const CalibratedImage& image, const fs::path& out_dir, int index);

} // namespace ccd_calib::io
