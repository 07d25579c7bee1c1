#include "runner_shared.hpp"

namespace ccd_calib::runner {

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

image::CalibrationOptions calibration_options(const config::Config &cfg) {
  image::CalibrationOptions opts;
  opts.pattern = cfg.calibration.pattern;
  opts.sigma_clip.sigma = cfg.calibration.sigma_clip.sigma;
  opts.sigma_clip.max_iters = cfg.calibration.sigma_clip.max_iters;
  opts.remove_lines = cfg.calibration.line_removal.enabled;
  opts.line_removal.upper_percentile = cfg.calibration.line_removal.upper_percentile;
  opts.line_removal.lower_percentile = cfg.calibration.line_removal.lower_percentile;
  opts.line_removal.half_window = cfg.calibration.line_removal.half_window;
  opts.flat_denom_eps = cfg.calibration.flat_denom_eps;
  return opts;
}

std::vector<ScienceJob> science_jobs(const config::Config &cfg) {
  std::vector<ScienceJob> jobs;
  for (const auto &[target, sci] : cfg.science) {
    for (size_t i = 0; i < sci.path.size() && i < sci.band.size(); ++i) {
      jobs.push_back({target, sci.band[i], sci.path[i]});
    }
  }
  return jobs;
}

} // namespace ccd_calib::runner
