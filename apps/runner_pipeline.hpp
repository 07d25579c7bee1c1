#pragma once

#include <string>

// Build all masters and calibrate every science directory named in the
// config. Returns the process exit code.
int run_pipeline_command(const std::string &config_path, bool dry_run);

// Load and validate the config only.
int validate_command(const std::string &config_path);
