#pragma once

#include "ccd_calib/core/types.hpp"
#include "ccd_calib/image/artifact_removal.hpp"
#include "ccd_calib/image/outlier_rejection.hpp"
#include "ccd_calib/io/frame_loader.hpp"

#include <string>
#include <variant>
#include <vector>

namespace ccd_calib::image {

struct CalibrationOptions {
    std::string pattern = io::kDefaultFramePattern;
    SigmaClipParams sigma_clip;
    bool remove_lines = true;
    LineRemovalParams line_removal;
    float flat_denom_eps = 1.0e-6f;
};

// A master dependency is either already built or described by its source.
template <typename Source>
using MasterInput = std::variant<MasterFrame, Source>;

struct BiasSource {
    fs::path dir;
};

struct DarkSource {
    fs::path dir;
    MasterInput<BiasSource> bias;
};

struct FlatSource {
    fs::path dir;
    MasterInput<BiasSource> bias;
    MasterInput<DarkSource> dark;
};

struct ScienceSource {
    fs::path dir;
    MasterInput<BiasSource> bias;
    MasterInput<DarkSource> dark;
    MasterInput<FlatSource> flat;
};

struct SkippedFrame {
    fs::path path;
    std::string reason;
};

struct MasterBuildResult {
    MasterFrame master;
    std::vector<SkippedFrame> skipped;  // includes frames skipped by nested builds
};

/**
 * Running per-pixel mean over masked frames. Rejected pixels do not enter the
 * sum; a pixel rejected in every frame falls back to the plain mean.
 */
class MasterAccumulator {
public:
    explicit MasterAccumulator(FrameShape shape);

    // Throws MalformedFrameError if the frame shape differs.
    void add(const MaskedFrame& frame, const std::string& frame_name);

    int frames() const { return frames_; }
    FrameShape shape() const { return shape_; }

    // Throws EmptyDirectoryError when nothing was added.
    Matrix2Df average() const;

private:
    FrameShape shape_;
    Matrix2Dd sum_valid_;
    Matrix2Dd sum_all_;
    Eigen::Matrix<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> count_valid_;
    int frames_ = 0;
};

// Throws NotABiasFrameError unless EXPTIME == 0.
void check_bias_frame(const Frame& frame);

// (frame - bias) / exposure
Matrix2Df correct_dark_frame(const Matrix2Df& trimmed, float exposure_time,
                             const Matrix2Df& bias);

// ((frame - bias) / exposure) - dark
Matrix2Df correct_flat_frame(const Matrix2Df& trimmed, float exposure_time,
                             const Matrix2Df& bias, const Matrix2Df& dark);

// Divide by the smallest valid pixel so that it becomes exactly 1.
MaskedFrame normalize_by_min(MaskedFrame frame, const std::string& frame_name);

MasterBuildResult build_master_bias(const BiasSource& source, const CalibrationOptions& opts = {});
MasterBuildResult build_master_dark(const DarkSource& source, const CalibrationOptions& opts = {});
// A dark given by source is built against the flat's own bias.
MasterBuildResult build_master_flat(const FlatSource& source, const CalibrationOptions& opts = {});

// Return the precomputed master or build it from its source. Frames skipped
// while building are appended to `skipped` when given.
MasterFrame resolve_master(const MasterInput<BiasSource>& input, const CalibrationOptions& opts,
                           std::vector<SkippedFrame>* skipped = nullptr);
MasterFrame resolve_master(const MasterInput<DarkSource>& input, const CalibrationOptions& opts,
                           std::vector<SkippedFrame>* skipped = nullptr);
MasterFrame resolve_master(const MasterInput<FlatSource>& input, const CalibrationOptions& opts,
                           std::vector<SkippedFrame>* skipped = nullptr);

// (((frame - bias) / exposure) - dark) / flat, then line removal. No
// outlier rejection is applied to science data.
CalibratedImage calibrate_science_frame(const Frame& raw, const MasterFrame& bias,
                                        const MasterFrame& dark, const MasterFrame& flat,
                                        const CalibrationOptions& opts = {});

// Calibrate every frame of the source directory, in path order. Masters
// given by source are built once, each against the ones resolved before it.
std::vector<CalibratedImage> calibrate_science(const ScienceSource& source,
                                               const CalibrationOptions& opts = {});

} // namespace ccd_calib::image
