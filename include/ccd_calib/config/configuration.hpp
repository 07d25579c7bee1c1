#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace ccd_calib::config {

namespace fs = std::filesystem;

struct FramePathConfig {
  std::string path;
};

// One observed target: science sub-paths and the band of each.
struct ScienceTargetConfig {
  std::vector<std::string> path;
  std::vector<std::string> band;
};

struct SigmaClipConfig {
  float sigma = 5.0f;
  int max_iters = 5;
};

struct LineRemovalConfig {
  bool enabled = true;
  float upper_percentile = 95.0f;
  float lower_percentile = 10.0f;
  int half_window = 5;
};

struct CalibrationConfig {
  std::string pattern = "*.fit;*.fits;*.fts";
  SigmaClipConfig sigma_clip;
  LineRemovalConfig line_removal;
  float flat_denom_eps = 1.0e-6f;
};

struct OutputConfig {
  bool write_masters = true;
  bool write_science = true;
};

struct Config {
  std::string path_raw;
  std::string path_clean;
  FramePathConfig bias;
  FramePathConfig dark;
  std::map<std::string, std::string> flat;                  // band -> sub-path
  std::map<std::string, ScienceTargetConfig> science;       // target -> paths
  CalibrationConfig calibration;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  fs::path raw_dir(const std::string &sub) const;
  fs::path clean_dir(const std::string &sub) const;
};

} // namespace ccd_calib::config
