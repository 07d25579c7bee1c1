#include "ccd_calib/io/fits_io.hpp"
#include "ccd_calib/core/errors.hpp"
#include "ccd_calib/core/utils.hpp"

#include <fitsio.h>
#include <algorithm>
#include <cstring>
#include <vector>

namespace ccd_calib::io {

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_number(const std::string& key) const {
    if (auto d = get_double(key)) {
        return d;
    }
    if (auto i = get_int(key)) {
        return static_cast<double>(*i);
    }
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

void FitsHeader::set(const std::string& key, bool value) {
    bool_values[key] = value;
}

namespace {

FitsDimensions read_dimensions(fitsfile* fptr, const fs::path& path) {
    int status = 0;
    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;

    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }

    if (naxis < 2) {
        fits_close_file(fptr, &status);
        throw FitsError("FITS file has less than 2 dimensions: " + path.string());
    }

    return {static_cast<int>(naxes[0]), static_cast<int>(naxes[1]), naxis};
}

FitsHeader read_header_cards(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;

    char card[FLEN_CARD];
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);

    for (int i = 1; i <= nkeys; ++i) {
        status = 0;
        fits_read_record(fptr, i, card, &status);
        if (status) continue;

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) continue;

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
            continue;
        }

        fits_parse_value(card, value, comment, &status);
        if (status) continue;

        char dtype;
        fits_get_keytype(value, &dtype, &status);
        if (status) continue;

        std::string val_str = core::trim(value);

        switch (dtype) {
            case 'C':
                header.set(key, val_str);
                break;
            case 'L':
                header.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I':
                try {
                    header.set(key, std::stoi(val_str));
                } catch (const std::exception&) {
                    // Beyond int range: keep the value as a double.
                    header.set(key, std::stod(val_str));
                }
                break;
            case 'F':
                try {
                    header.set(key, std::stod(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            default:
                header.set(key, val_str);
                break;
        }
    }

    return header;
}

} // namespace

std::pair<FitsDimensions, FitsHeader> read_fits_header(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    FitsDimensions dims = read_dimensions(fptr, path);
    FitsHeader header = read_header_cards(fptr);

    fits_close_file(fptr, &status);
    return {dims, header};
}

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    FitsDimensions dims = read_dimensions(fptr, path);
    long width = dims.naxis1;
    long height = dims.naxis2;
    long npixels = width * height;

    std::vector<float> buffer(static_cast<size_t>(npixels));
    long fpixel[3] = {1, 1, 1};

    fits_read_pix(fptr, TFLOAT, fpixel, npixels, nullptr, buffer.data(), nullptr, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS pixel data: " + path.string());
    }

    FitsHeader header = read_header_cards(fptr);

    fits_close_file(fptr, &status);

    // FITS stores rows contiguously (NAXIS1 fastest), same as RowMajor.
    Matrix2Df data = Eigen::Map<const Matrix2Df>(buffer.data(), height, width);
    return {data, header};
}

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header) {
    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();

    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};

    fits_create_img(fptr, FLOAT_IMG, 2, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                            const_cast<char*>(value.c_str()), nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.bool_values) {
        if (key.size() <= 8) {
            int val = value ? 1 : 0;
            fits_update_key(fptr, TLOGICAL, key.c_str(), &val, nullptr, &status);
        }
    }

    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS header: " + path.string());
    }

    std::vector<float> buffer(data.data(), data.data() + data.size());

    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TFLOAT, fpixel, static_cast<LONGLONG>(data.size()), buffer.data(), &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS pixel data: " + path.string());
    }

    fits_close_file(fptr, &status);
    if (status) {
        throw FitsError("Cannot close FITS file: " + path.string());
    }
}

} // namespace ccd_calib::io
