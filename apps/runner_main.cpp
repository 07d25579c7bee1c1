#include "runner_pipeline.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <string>

int main(int argc, char *argv[]) {
  CLI::App app{"CCD calibration runner"};
  app.require_subcommand(1);

  std::string config_path;
  bool dry_run = false;

  auto run_cmd = app.add_subcommand(
      "run", "Build master frames and calibrate all science frames");
  run_cmd->add_option("--config", config_path, "Path to config.yaml")
      ->required();
  run_cmd->add_flag("--dry-run", dry_run,
                    "Validate and list input frames without processing");

  auto validate_cmd =
      app.add_subcommand("validate", "Load and validate a config file");
  validate_cmd->add_option("--config", config_path, "Path to config.yaml")
      ->required();

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    return run_pipeline_command(config_path, dry_run);
  }

  if (validate_cmd->parsed()) {
    return validate_command(config_path);
  }

  std::cout << app.help() << std::endl;
  return 1;
}
