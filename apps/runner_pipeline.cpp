#include "runner_pipeline.hpp"

#include "ccd_calib/config/configuration.hpp"
#include "ccd_calib/core/errors.hpp"
#include "ccd_calib/core/events.hpp"
#include "ccd_calib/core/types.hpp"
#include "ccd_calib/core/utils.hpp"
#include "ccd_calib/image/calibration.hpp"
#include "ccd_calib/io/frame_loader.hpp"
#include "ccd_calib/io/frame_store.hpp"

#include "runner_shared.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using ccd_calib::MasterFrame;
using ccd_calib::Phase;
using ccd_calib::runner::ScienceJob;
using ccd_calib::runner::TeeBuf;

namespace config = ccd_calib::config;
namespace core = ccd_calib::core;
namespace image = ccd_calib::image;
namespace io = ccd_calib::io;

struct RunContext {
  const config::Config &cfg;
  const image::CalibrationOptions &opts;
  core::EventEmitter &emitter;
  const std::string &run_id;
  std::ostream &log;
};

void report_skipped(RunContext &ctx, Phase phase,
                    const std::vector<image::SkippedFrame> &skipped) {
  for (const auto &s : skipped) {
    ctx.emitter.frame_skipped(ctx.run_id, phase, s.path.filename().string(),
                              s.reason, ctx.log);
  }
}

core::json master_summary(const MasterFrame &m, size_t skipped,
                          const fs::path &written) {
  core::json j = {{"frames_used", m.frames_used},
                  {"frames_skipped", skipped},
                  {"rows", m.data.rows()},
                  {"cols", m.data.cols()}};
  if (!written.empty()) {
    j["output"] = written.string();
  }
  return j;
}

int dry_run(RunContext &ctx, const std::vector<ScienceJob> &jobs) {
  auto list_phase = [&](Phase phase, const core::json &dirs) {
    ctx.emitter.phase_start(ctx.run_id, phase, ccd_calib::phase_to_string(phase),
                            ctx.log);
    ctx.emitter.phase_end(ctx.run_id, phase, "skipped",
                          {{"reason", "dry_run"}, {"inputs", dirs}}, ctx.log);
  };

  auto describe = [&](const std::string &sub) {
    const fs::path dir = ctx.cfg.raw_dir(sub);
    return core::json{{"dir", dir.string()},
                      {"frames", io::list_frames(dir, ctx.opts.pattern).size()}};
  };

  list_phase(Phase::BIAS, core::json::array({describe(ctx.cfg.bias.path)}));
  list_phase(Phase::DARK, core::json::array({describe(ctx.cfg.dark.path)}));

  core::json flats = core::json::array();
  for (const auto &[band, sub] : ctx.cfg.flat) {
    core::json d = describe(sub);
    d["band"] = band;
    flats.push_back(d);
  }
  list_phase(Phase::FLAT, flats);

  core::json sci = core::json::array();
  for (const auto &job : jobs) {
    core::json d = describe(job.sub_path);
    d["target"] = job.target;
    d["band"] = job.band;
    sci.push_back(d);
  }
  list_phase(Phase::SCIENCE, sci);

  std::cout << "Dry run - no processing" << std::endl;
  ctx.emitter.run_end(ctx.run_id, true, "ok", ctx.log);
  return 0;
}

} // namespace

int validate_command(const std::string &config_path) {
  try {
    config::Config cfg = config::Config::load(config_path);
    cfg.validate();
  } catch (const ccd_calib::CcdCalibError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  std::cout << "Config OK: " << config_path << std::endl;
  return 0;
}

int run_pipeline_command(const std::string &config_path, bool dry_run_only) {
  config::Config cfg;
  fs::path clean_root;
  std::string config_hash;
  try {
    cfg = config::Config::load(config_path);
    cfg.validate();
    config_hash = core::sha256_file(config_path);
    clean_root = fs::path(cfg.path_clean);
    core::ensure_directory(clean_root / "logs");
    cfg.save(clean_root / "config.yaml");
  } catch (const ccd_calib::CcdCalibError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  const std::string run_id = core::get_run_id();
  std::ofstream event_log_file(clean_root / "logs" / "run_events.jsonl");
  if (!event_log_file) {
    std::cerr << "Error: cannot open event log in " << (clean_root / "logs").string()
              << std::endl;
    return 1;
  }
  TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  const image::CalibrationOptions opts = ccd_calib::runner::calibration_options(cfg);
  const std::vector<ScienceJob> jobs = ccd_calib::runner::science_jobs(cfg);

  core::EventEmitter emitter;
  emitter.run_start(run_id,
                    {{"config_path", config_path},
                     {"config_sha256", config_hash},
                     {"path_raw", cfg.path_raw},
                     {"path_clean", cfg.path_clean},
                     {"bands", cfg.flat.size()},
                     {"science_dirs", jobs.size()},
                     {"dry_run", dry_run_only}},
                    log_file);

  RunContext ctx{cfg, opts, emitter, run_id, log_file};

  if (dry_run_only) {
    try {
      return dry_run(ctx, jobs);
    } catch (const std::exception &e) {
      emitter.error(run_id, e.what(), log_file);
      emitter.run_end(run_id, false, "error", log_file);
      std::cerr << "Error during dry run: " << e.what() << std::endl;
      return 1;
    }
  }

  Phase current = Phase::BIAS;
  auto fail = [&](const std::string &message) {
    emitter.phase_end(run_id, current, "error", {{"error", message}}, log_file);
    emitter.error(run_id, message, log_file);
    emitter.run_end(run_id, false, "error", log_file);
    std::cerr << "Error during " << ccd_calib::phase_to_string(current) << ": "
              << message << std::endl;
    return 1;
  };

  try {
    // Phase 0: BIAS
    emitter.phase_start(run_id, Phase::BIAS, "BIAS", log_file);
    auto bias = image::build_master_bias({cfg.raw_dir(cfg.bias.path)}, opts);
    report_skipped(ctx, Phase::BIAS, bias.skipped);
    fs::path bias_out;
    if (cfg.output.write_masters) {
      bias_out = io::write_master(bias.master, cfg.clean_dir(cfg.bias.path));
    }
    emitter.phase_end(run_id, Phase::BIAS, "ok",
                      master_summary(bias.master, bias.skipped.size(), bias_out),
                      log_file);

    // Phase 1: DARK
    current = Phase::DARK;
    emitter.phase_start(run_id, Phase::DARK, "DARK", log_file);
    auto dark = image::build_master_dark({cfg.raw_dir(cfg.dark.path), bias.master}, opts);
    report_skipped(ctx, Phase::DARK, dark.skipped);
    fs::path dark_out;
    if (cfg.output.write_masters) {
      dark_out = io::write_master(dark.master, cfg.clean_dir(cfg.dark.path));
    }
    emitter.phase_end(run_id, Phase::DARK, "ok",
                      master_summary(dark.master, dark.skipped.size(), dark_out),
                      log_file);

    // Phase 2: FLAT, one master per band
    current = Phase::FLAT;
    emitter.phase_start(run_id, Phase::FLAT, "FLAT", log_file);
    ccd_calib::FlatMasters flats;
    core::json per_band = core::json::object();
    for (const auto &kv : cfg.flat) {
      const std::string &band = kv.first;
      const std::string &sub = kv.second;
      const bool used = std::any_of(jobs.begin(), jobs.end(),
                                    [&](const ScienceJob &j) { return j.band == band; });
      if (!used) {
        emitter.warning(run_id, "flat band '" + band + "' is not used by any science target",
                        log_file);
      }
      auto flat = image::build_master_flat(
          {cfg.raw_dir(sub), bias.master, dark.master}, opts);
      report_skipped(ctx, Phase::FLAT, flat.skipped);
      fs::path flat_out;
      if (cfg.output.write_masters) {
        flat_out = io::write_master(flat.master, cfg.clean_dir(sub));
      }
      per_band[band] = master_summary(flat.master, flat.skipped.size(), flat_out);
      flats.emplace(band, std::move(flat.master));
    }
    emitter.phase_end(run_id, Phase::FLAT, "ok", {{"bands", per_band}}, log_file);

    // Phase 3: SCIENCE, per target and band
    current = Phase::SCIENCE;
    emitter.phase_start(run_id, Phase::SCIENCE, "SCIENCE", log_file);
    int total_written = 0;
    core::json per_dir = core::json::array();
    for (const auto &job : jobs) {
      const MasterFrame &flat = flats.at(job.band);
      auto images = image::calibrate_science(
          {cfg.raw_dir(job.sub_path), bias.master, dark.master, flat}, opts);

      const fs::path out_dir = cfg.clean_dir(job.sub_path);
      const int n = static_cast<int>(images.size());
      for (int i = 0; i < n; ++i) {
        const auto &band = images[static_cast<size_t>(i)].band;
        if (band && *band != job.band) {
          emitter.warning(run_id,
                          images[static_cast<size_t>(i)].filename + ": FILTER '" + *band +
                              "' does not match band '" + job.band + "' of " + job.target,
                          log_file);
        }
        if (cfg.output.write_science) {
          io::write_calibrated(images[static_cast<size_t>(i)], out_dir, i + 1);
          ++total_written;
        }
        emitter.frame_processed(run_id, Phase::SCIENCE, i, n,
                                images[static_cast<size_t>(i)].filename, log_file);
      }
      per_dir.push_back(core::json{{"target", job.target},
                                   {"band", job.band},
                                   {"frames", n},
                                   {"output_dir", out_dir.string()}});
    }
    emitter.phase_end(run_id, Phase::SCIENCE, "ok",
                      {{"directories", per_dir}, {"written", total_written}},
                      log_file);
  } catch (const std::exception &e) {
    return fail(e.what());
  }

  emitter.run_end(run_id, true, "ok", log_file);
  return 0;
}
