#include "ccd_calib/image/calibration.hpp"
#include "ccd_calib/core/errors.hpp"
#include "ccd_calib/image/overscan.hpp"

#include <iostream>
#include <sstream>

namespace ccd_calib::image {

namespace {

std::string shape_str(FrameShape s) {
    return std::to_string(s.rows) + "x" + std::to_string(s.cols);
}

void require_shape(const Matrix2Df& m, FrameShape expected, const std::string& what,
                   const std::string& frame_name) {
    if (shape_of(m) != expected) {
        throw MalformedFrameError(frame_name + ": " + what + " shape " + shape_str(shape_of(m)) +
                                  " does not match trimmed frame shape " + shape_str(expected));
    }
}

void require_kind(const MasterFrame& m, MasterKind kind) {
    if (m.kind != kind) {
        throw ValidationError("expected a " + master_kind_to_string(kind) + " master, got " +
                              master_kind_to_string(m.kind));
    }
}

float require_exposure(const Frame& frame) {
    if (!(frame.meta.exposure_time > 0.0f)) {
        throw MalformedFrameError(frame.path.filename().string() +
                                  ": exposure time must be > 0, got " +
                                  std::to_string(frame.meta.exposure_time));
    }
    return frame.meta.exposure_time;
}

void append(std::vector<SkippedFrame>* dst, const std::vector<SkippedFrame>& src) {
    if (dst) dst->insert(dst->end(), src.begin(), src.end());
}

} // namespace

MasterAccumulator::MasterAccumulator(FrameShape shape)
    : shape_(shape),
      sum_valid_(Matrix2Dd::Zero(shape.rows, shape.cols)),
      sum_all_(Matrix2Dd::Zero(shape.rows, shape.cols)),
      count_valid_(decltype(count_valid_)::Zero(shape.rows, shape.cols)) {}

void MasterAccumulator::add(const MaskedFrame& frame, const std::string& frame_name) {
    require_shape(frame.data, shape_, "frame", frame_name);

    for (Eigen::Index y = 0; y < frame.data.rows(); ++y) {
        for (Eigen::Index x = 0; x < frame.data.cols(); ++x) {
            const double v = static_cast<double>(frame.data(y, x));
            sum_all_(y, x) += v;
            if (frame.valid(y, x)) {
                sum_valid_(y, x) += v;
                count_valid_(y, x) += 1;
            }
        }
    }
    ++frames_;
}

Matrix2Df MasterAccumulator::average() const {
    if (frames_ == 0) {
        throw EmptyDirectoryError("no frames accumulated");
    }

    Matrix2Df out(shape_.rows, shape_.cols);
    for (Eigen::Index y = 0; y < out.rows(); ++y) {
        for (Eigen::Index x = 0; x < out.cols(); ++x) {
            const int n = count_valid_(y, x);
            out(y, x) = n > 0 ? static_cast<float>(sum_valid_(y, x) / n)
                              : static_cast<float>(sum_all_(y, x) / frames_);
        }
    }
    return out;
}

void check_bias_frame(const Frame& frame) {
    if (frame.meta.exposure_time != 0.0f) {
        std::ostringstream oss;
        oss << "File " << frame.path.filename().string()
            << " is not a bias image, exposure time must be equal to zero (EXPTIME="
            << frame.meta.exposure_time << ")";
        throw NotABiasFrameError(oss.str());
    }
}

Matrix2Df correct_dark_frame(const Matrix2Df& trimmed, float exposure_time,
                             const Matrix2Df& bias) {
    return (trimmed - bias) / exposure_time;
}

Matrix2Df correct_flat_frame(const Matrix2Df& trimmed, float exposure_time,
                             const Matrix2Df& bias, const Matrix2Df& dark) {
    return (trimmed - bias) / exposure_time - dark;
}

MaskedFrame normalize_by_min(MaskedFrame frame, const std::string& frame_name) {
    const float m = masked_min(frame);
    if (!(m > 0.0f)) {
        throw CalibrationError(frame_name + ": flat minimum must be > 0 for normalization, got " +
                               std::to_string(m));
    }
    frame.data /= m;
    return frame;
}

MasterBuildResult build_master_bias(const BiasSource& source, const CalibrationOptions& opts) {
    MasterBuildResult result;
    // Exposed frames are skipped below, so they must not set the shape either
    MasterAccumulator acc(io::peek_frame_shape(
        source.dir, opts.pattern, FrameType::BIAS,
        [](const FrameMetadata& meta) { return meta.exposure_time == 0.0f; }));

    for (const auto& path : io::list_frames(source.dir, opts.pattern)) {
        Frame frame = io::load_frame(path, FrameType::BIAS);
        try {
            check_bias_frame(frame);
        } catch (const NotABiasFrameError& e) {
            std::cerr << "[BIAS] " << e.what() << std::endl;
            result.skipped.push_back({path, e.what()});
            continue;
        }

        Matrix2Df data = trim_overscan(frame);
        acc.add(sigma_clip(data, opts.sigma_clip), path.filename().string());
    }

    if (acc.frames() == 0) {
        throw EmptyDirectoryError("no bias frames with EXPTIME == 0 in " + source.dir.string());
    }

    result.master = {MasterKind::BIAS, acc.average(), acc.frames()};
    return result;
}

MasterBuildResult build_master_dark(const DarkSource& source, const CalibrationOptions& opts) {
    MasterBuildResult result;
    const MasterFrame bias = resolve_master(source.bias, opts, &result.skipped);
    require_kind(bias, MasterKind::BIAS);

    MasterAccumulator acc(io::peek_frame_shape(source.dir, opts.pattern));
    require_shape(bias.data, acc.shape(), "master bias", source.dir.string());

    for (const auto& path : io::list_frames(source.dir, opts.pattern)) {
        Frame frame = io::load_frame(path, FrameType::DARK);
        const float exposure = require_exposure(frame);
        const std::string name = path.filename().string();

        Matrix2Df data = trim_overscan(frame);
        require_shape(data, acc.shape(), "frame", name);
        data = correct_dark_frame(data, exposure, bias.data);
        acc.add(sigma_clip(data, opts.sigma_clip), name);
    }

    if (acc.frames() == 0) {
        throw EmptyDirectoryError("no dark frames in " + source.dir.string());
    }

    result.master = {MasterKind::DARK, acc.average(), acc.frames()};
    return result;
}

MasterBuildResult build_master_flat(const FlatSource& source, const CalibrationOptions& opts) {
    MasterBuildResult result;
    const MasterFrame bias = resolve_master(source.bias, opts, &result.skipped);
    require_kind(bias, MasterKind::BIAS);

    // A dark described by source reuses the bias resolved above.
    MasterFrame dark;
    if (const auto* ds = std::get_if<DarkSource>(&source.dark)) {
        dark = resolve_master(MasterInput<DarkSource>(DarkSource{ds->dir, bias}), opts,
                              &result.skipped);
    } else {
        dark = std::get<MasterFrame>(source.dark);
    }
    require_kind(dark, MasterKind::DARK);

    MasterAccumulator acc(io::peek_frame_shape(source.dir, opts.pattern));
    require_shape(bias.data, acc.shape(), "master bias", source.dir.string());
    require_shape(dark.data, acc.shape(), "master dark", source.dir.string());

    for (const auto& path : io::list_frames(source.dir, opts.pattern)) {
        Frame frame = io::load_frame(path, FrameType::FLAT);
        const float exposure = require_exposure(frame);
        const std::string name = path.filename().string();

        Matrix2Df data = trim_overscan(frame);
        require_shape(data, acc.shape(), "frame", name);
        data = correct_flat_frame(data, exposure, bias.data, dark.data);
        acc.add(normalize_by_min(sigma_clip(data, opts.sigma_clip), name), name);
    }

    if (acc.frames() == 0) {
        throw EmptyDirectoryError("no flat frames in " + source.dir.string());
    }

    result.master = {MasterKind::FLAT, acc.average(), acc.frames()};
    return result;
}

MasterFrame resolve_master(const MasterInput<BiasSource>& input, const CalibrationOptions& opts,
                           std::vector<SkippedFrame>* skipped) {
    if (const auto* m = std::get_if<MasterFrame>(&input)) {
        return *m;
    }
    auto built = build_master_bias(std::get<BiasSource>(input), opts);
    append(skipped, built.skipped);
    return built.master;
}

MasterFrame resolve_master(const MasterInput<DarkSource>& input, const CalibrationOptions& opts,
                           std::vector<SkippedFrame>* skipped) {
    if (const auto* m = std::get_if<MasterFrame>(&input)) {
        return *m;
    }
    auto built = build_master_dark(std::get<DarkSource>(input), opts);
    append(skipped, built.skipped);
    return built.master;
}

MasterFrame resolve_master(const MasterInput<FlatSource>& input, const CalibrationOptions& opts,
                           std::vector<SkippedFrame>* skipped) {
    if (const auto* m = std::get_if<MasterFrame>(&input)) {
        return *m;
    }
    auto built = build_master_flat(std::get<FlatSource>(input), opts);
    append(skipped, built.skipped);
    return built.master;
}

CalibratedImage calibrate_science_frame(const Frame& raw, const MasterFrame& bias,
                                        const MasterFrame& dark, const MasterFrame& flat,
                                        const CalibrationOptions& opts) {
    require_kind(bias, MasterKind::BIAS);
    require_kind(dark, MasterKind::DARK);
    require_kind(flat, MasterKind::FLAT);

    const std::string name = raw.path.filename().string();
    if (!raw.meta.error_estimate) {
        throw MalformedFrameError(name + ": missing header key " + io::kKeyErrorEstimate);
    }
    const float exposure = require_exposure(raw);

    Matrix2Df data = trim_overscan(raw);
    const FrameShape shape = shape_of(data);
    require_shape(bias.data, shape, "master bias", name);
    require_shape(dark.data, shape, "master dark", name);
    require_shape(flat.data, shape, "master flat", name);

    data = ((data - bias.data) / exposure - dark.data).array() /
           flat.data.array().max(opts.flat_denom_eps);

    if (opts.remove_lines) {
        data = remove_column_lines(data, opts.line_removal);
    }

    return {name, std::move(data), *raw.meta.error_estimate, raw.meta.band};
}

std::vector<CalibratedImage> calibrate_science(const ScienceSource& source,
                                               const CalibrationOptions& opts) {
    const auto frames = io::list_frames(source.dir, opts.pattern);
    if (frames.empty()) {
        throw EmptyDirectoryError("no science frames in " + source.dir.string());
    }

    const MasterFrame bias = resolve_master(source.bias, opts);

    MasterFrame dark;
    if (const auto* ds = std::get_if<DarkSource>(&source.dark)) {
        dark = resolve_master(MasterInput<DarkSource>(DarkSource{ds->dir, bias}), opts);
    } else {
        dark = std::get<MasterFrame>(source.dark);
    }

    MasterFrame flat;
    if (const auto* fsrc = std::get_if<FlatSource>(&source.flat)) {
        flat = resolve_master(MasterInput<FlatSource>(FlatSource{fsrc->dir, bias, dark}), opts);
    } else {
        flat = std::get<MasterFrame>(source.flat);
    }

    std::vector<CalibratedImage> out;
    out.reserve(frames.size());
    for (const auto& path : frames) {
        Frame raw = io::load_frame(path, FrameType::SCIENCE);
        out.push_back(calibrate_science_frame(raw, bias, dark, flat, opts));
    }
    return out;
}

} // namespace ccd_calib::image
