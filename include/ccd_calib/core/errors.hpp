#pragma once

#include <stdexcept>
#include <string>

namespace ccd_calib {

class CcdCalibError : public std::runtime_error {
public:
    explicit CcdCalibError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public CcdCalibError {
public:
    explicit ConfigError(const std::string& message)
        : CcdCalibError("Config error: " + message) {}
};

class ValidationError : public CcdCalibError {
public:
    explicit ValidationError(const std::string& message)
        : CcdCalibError("Validation error: " + message) {}
};

class IOError : public CcdCalibError {
public:
    explicit IOError(const std::string& message)
        : CcdCalibError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

// Overscan/shape inconsistency or missing required header key. Fatal for
// the enclosing build.
class MalformedFrameError : public CcdCalibError {
public:
    explicit MalformedFrameError(const std::string& message)
        : CcdCalibError("Malformed frame: " + message) {}
};

// Raised per frame while building a master bias; callers skip the frame.
class NotABiasFrameError : public CcdCalibError {
public:
    explicit NotABiasFrameError(const std::string& message)
        : CcdCalibError("Not a bias frame: " + message) {}
};

class EmptyDirectoryError : public CcdCalibError {
public:
    explicit EmptyDirectoryError(const std::string& message)
        : CcdCalibError("Empty directory: " + message) {}
};

class CalibrationError : public CcdCalibError {
public:
    explicit CalibrationError(const std::string& message)
        : CcdCalibError("Calibration error: " + message) {}
};

} // namespace ccd_calib
