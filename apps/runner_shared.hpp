#pragma once

#include "ccd_calib/config/configuration.hpp"
#include "ccd_calib/image/calibration.hpp"

#include <filesystem>
#include <streambuf>
#include <string>
#include <vector>

namespace ccd_calib::runner {

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

image::CalibrationOptions calibration_options(const config::Config &cfg);

// One science input directory with the band whose flat applies to it.
struct ScienceJob {
  std::string target;
  std::string band;
  std::string sub_path;
};

// Science jobs in config order: targets sorted by name, paths as listed.
std::vector<ScienceJob> science_jobs(const config::Config &cfg);

} // namespace ccd_calib::runner
