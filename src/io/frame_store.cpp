#include "ccd_calib/io/frame_store.hpp"
#include "ccd_calib/core/errors.hpp"
#include "ccd_calib/core/utils.hpp"
#include "ccd_calib/io/fits_io.hpp"
#include "ccd_calib/io/frame_loader.hpp"

namespace ccd_calib::io {

std::string master_filename(MasterKind kind) {
    return master_kind_to_string(kind) + ".fits";
}

std::string science_filename(int index) {
    return "Sci_" + std::to_string(index) + ".fits";
}

fs::path write_master(const MasterFrame& master, const fs::path& out_dir) {
    core::ensure_directory(out_dir);
    const fs::path out = out_dir / master_filename(master.kind);

    FitsHeader hdr;
    hdr.set("NCOMBINE", master.frames_used);
    write_fits_float(out, master.data, hdr);
    return out;
}

fs::path write_calibrated(const CalibratedImage& image, const fs::path& out_dir, int index) {
    if (index < 1) {
        throw ValidationError("science output index must be >= 1, got " + std::to_string(index));
    }
    core::ensure_directory(out_dir);
    const fs::path out = out_dir / science_filename(index);

    FitsHeader hdr;
    hdr.set(kKeyOutputError, image.error_estimate);
    hdr.set(kKeyOutputSource, image.filename);
    write_fits_float(out, image.data, hdr);
    return out;
}

} // namespace ccd_calib::io
