#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ccd_calib::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
// `pattern` may hold several globs separated by ';'. Result is sorted.
std::vector<fs::path> discover_frames(const fs::path& input_dir, const std::string& pattern = "*.fit*");
std::vector<uint8_t> read_bytes(const fs::path& path);
void ensure_directory(const fs::path& dir);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// String utilities
std::string trim(const std::string& s);
std::vector<std::string> split(const std::string& str, char delimiter);

// Glob pattern matching
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace ccd_calib::core
