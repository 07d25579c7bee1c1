#pragma once

#include <Eigen/Dense>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ccd_calib {

namespace fs = std::filesystem;

// Matrix types (NumPy equivalents)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Mask2D = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXf = Eigen::VectorXf;

// Raw frame type, as implied by the directory a frame was taken from
enum class FrameType {
    BIAS,
    DARK,
    FLAT,
    SCIENCE
};

enum class MasterKind {
    BIAS,
    DARK,
    FLAT
};

inline std::string master_kind_to_string(MasterKind kind) {
    switch (kind) {
        case MasterKind::BIAS: return "Bias";
        case MasterKind::DARK: return "Dark";
        case MasterKind::FLAT: return "Flat";
        default: return "Unknown";
    }
}

// Header-derived metadata of one raw frame
struct FrameMetadata {
    float exposure_time = 0.0f;          // EXPTIME [s]
    int overscan_columns = 0;            // COVER
    int overscan_rows = 0;               // ROVER
    std::optional<double> error_estimate; // CRDER2S (science only)
    std::optional<std::string> band;      // FILTER
};

struct Frame {
    fs::path path;
    Matrix2Df data;
    FrameMetadata meta;
};

// Post-overscan frame shape
struct FrameShape {
    int rows = 0;
    int cols = 0;

    bool operator==(const FrameShape& o) const { return rows == o.rows && cols == o.cols; }
    bool operator!=(const FrameShape& o) const { return !(*this == o); }
};

inline FrameShape shape_of(const Matrix2Df& m) {
    return {static_cast<int>(m.rows()), static_cast<int>(m.cols())};
}

// Data plus per-pixel validity (false = rejected)
struct MaskedFrame {
    Matrix2Df data;
    Mask2D valid;

    int rejected_count() const {
        return static_cast<int>(valid.size() - valid.count());
    }
};

struct MasterFrame {
    MasterKind kind = MasterKind::BIAS;
    Matrix2Df data;
    int frames_used = 0;
};

// Flat masters keyed by band name
using FlatMasters = std::map<std::string, MasterFrame>;

struct CalibratedImage {
    std::string filename;
    Matrix2Df data;
    double error_estimate = 0.0;
    std::optional<std::string> band;  // FILTER of the raw frame, when present
};

// Pipeline phase enumeration
enum class Phase {
    BIAS = 0,
    DARK = 1,
    FLAT = 2,
    SCIENCE = 3,
    DONE = 4
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::BIAS: return "BIAS";
        case Phase::DARK: return "DARK";
        case Phase::FLAT: return "FLAT";
        case Phase::SCIENCE: return "SCIENCE";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace ccd_calib
