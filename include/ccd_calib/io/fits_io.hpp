#pragma once

#include "ccd_calib/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace ccd_calib::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;

    // Integer or floating point card, whichever the writer used.
    std::optional<double> get_number(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);
};

// Image dimensions of the primary HDU, NAXIS1 = width, NAXIS2 = height.
struct FitsDimensions {
    int naxis1 = 0;
    int naxis2 = 0;
    int naxis = 0;
};

// Header cards and dimensions only; pixel data is not read.
std::pair<FitsDimensions, FitsHeader> read_fits_header(const fs::path& path);

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path);

// Overwrites `path` if it exists.
void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header);

} // namespace ccd_calib::io
