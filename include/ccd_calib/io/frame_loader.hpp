#pragma once

#include "ccd_calib/core/types.hpp"
#include "ccd_calib/io/fits_io.hpp"

#include <functional>
#include <string>
#include <vector>

namespace ccd_calib::io {

inline constexpr const char* kDefaultFramePattern = "*.fit;*.fits;*.fts";

// Header keys carrying frame metadata
inline constexpr const char* kKeyExposure = "EXPTIME";
inline constexpr const char* kKeyOverscanCols = "COVER";
inline constexpr const char* kKeyOverscanRows = "ROVER";
inline constexpr const char* kKeyErrorEstimate = "CRDER2S";
inline constexpr const char* kKeyBand = "FILTER";
inline constexpr const char* kKeyOutputError = "ERROR";
inline constexpr const char* kKeyOutputSource = "ORIGFILE";

/**
 * Parse frame metadata from a header. EXPTIME, COVER and ROVER are always
 * required, CRDER2S only for science frames. Throws MalformedFrameError.
 */
FrameMetadata parse_frame_metadata(const FitsHeader& header, FrameType type,
                                   const std::string& frame_name);

/**
 * Read pixel data and metadata of one raw frame.
 */
Frame load_frame(const fs::path& path, FrameType type);

/**
 * Sorted list of frame files in `dir` matching `pattern` (';'-separated globs).
 */
std::vector<fs::path> list_frames(const fs::path& dir,
                                  const std::string& pattern = kDefaultFramePattern);

/**
 * Trimmed shape of the first frame in `dir` whose header is readable and
 * complete. Throws EmptyDirectoryError when there is none.
 */
FrameShape peek_frame_shape(const fs::path& dir,
                            const std::string& pattern = kDefaultFramePattern);

using FrameFilter = std::function<bool(const FrameMetadata&)>;

/**
 * Same, but only frames whose metadata parses as `type` and passes `accept`
 * qualify. Used where frames of the wrong kind are skipped later, so that
 * one of them cannot decide the shape.
 */
FrameShape peek_frame_shape(const fs::path& dir, const std::string& pattern, FrameType type,
                            const FrameFilter& accept);

} // namespace ccd_calib::io
