#include "ccd_calib/config/configuration.hpp"
#include "ccd_calib/core/errors.hpp"

#include <fstream>

namespace ccd_calib::config {

static std::vector<std::string> read_string_list(const YAML::Node& n) {
    std::vector<std::string> out;
    if (!n) return out;
    if (n.IsScalar()) {
        out.push_back(n.as<std::string>());
    } else if (n.IsSequence()) {
        for (const auto& item : n) {
            out.push_back(item.as<std::string>());
        }
    } else {
        throw ConfigError("expected a string or a list of strings");
    }
    return out;
}

static void read_frame_path(const YAML::Node& n, FramePathConfig& out) {
    if (!n) return;
    if (n.IsScalar()) {
        out.path = n.as<std::string>();
    } else if (n["path"]) {
        out.path = n["path"].as<std::string>();
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["path_raw"]) cfg.path_raw = node["path_raw"].as<std::string>();
        if (node["path_clean"]) cfg.path_clean = node["path_clean"].as<std::string>();

        read_frame_path(node["bias"], cfg.bias);
        read_frame_path(node["dark"], cfg.dark);

        if (node["flat"]) {
            for (const auto& kv : node["flat"]) {
                FramePathConfig fp;
                read_frame_path(kv.second, fp);
                cfg.flat[kv.first.as<std::string>()] = fp.path;
            }
        }

        if (node["science"]) {
            for (const auto& kv : node["science"]) {
                ScienceTargetConfig target;
                target.path = read_string_list(kv.second["path"]);
                target.band = read_string_list(kv.second["band"]);
                cfg.science[kv.first.as<std::string>()] = target;
            }
        }

        if (node["calibration"]) {
            auto c = node["calibration"];
            if (c["pattern"]) cfg.calibration.pattern = c["pattern"].as<std::string>();
            if (c["flat_denom_eps"]) cfg.calibration.flat_denom_eps = c["flat_denom_eps"].as<float>();

            if (c["sigma_clip"]) {
                auto sc = c["sigma_clip"];
                if (sc["sigma"]) cfg.calibration.sigma_clip.sigma = sc["sigma"].as<float>();
                if (sc["max_iters"]) cfg.calibration.sigma_clip.max_iters = sc["max_iters"].as<int>();
            }

            if (c["line_removal"]) {
                auto lr = c["line_removal"];
                if (lr["enabled"]) cfg.calibration.line_removal.enabled = lr["enabled"].as<bool>();
                if (lr["upper_percentile"]) {
                    cfg.calibration.line_removal.upper_percentile = lr["upper_percentile"].as<float>();
                }
                if (lr["lower_percentile"]) {
                    cfg.calibration.line_removal.lower_percentile = lr["lower_percentile"].as<float>();
                }
                if (lr["half_window"]) cfg.calibration.line_removal.half_window = lr["half_window"].as<int>();
            }
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["write_masters"]) cfg.output.write_masters = o["write_masters"].as<bool>();
            if (o["write_science"]) cfg.output.write_science = o["write_science"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["path_raw"] = path_raw;
    node["path_clean"] = path_clean;
    node["bias"]["path"] = bias.path;
    node["dark"]["path"] = dark.path;

    for (const auto& [band, sub] : flat) {
        node["flat"][band] = sub;
    }

    for (const auto& [target, sci] : science) {
        YAML::Node t;
        for (const auto& p : sci.path) t["path"].push_back(p);
        for (const auto& b : sci.band) t["band"].push_back(b);
        node["science"][target] = t;
    }

    node["calibration"]["pattern"] = calibration.pattern;
    node["calibration"]["flat_denom_eps"] = calibration.flat_denom_eps;
    node["calibration"]["sigma_clip"]["sigma"] = calibration.sigma_clip.sigma;
    node["calibration"]["sigma_clip"]["max_iters"] = calibration.sigma_clip.max_iters;
    node["calibration"]["line_removal"]["enabled"] = calibration.line_removal.enabled;
    node["calibration"]["line_removal"]["upper_percentile"] = calibration.line_removal.upper_percentile;
    node["calibration"]["line_removal"]["lower_percentile"] = calibration.line_removal.lower_percentile;
    node["calibration"]["line_removal"]["half_window"] = calibration.line_removal.half_window;

    node["output"]["write_masters"] = output.write_masters;
    node["output"]["write_science"] = output.write_science;

    return node;
}

void Config::validate() const {
    if (path_raw.empty()) {
        throw ValidationError("path_raw must be set");
    }
    if (path_clean.empty()) {
        throw ValidationError("path_clean must be set");
    }
    if (bias.path.empty()) {
        throw ValidationError("bias.path must be set");
    }
    if (dark.path.empty()) {
        throw ValidationError("dark.path must be set");
    }
    for (const auto& [band, sub] : flat) {
        if (sub.empty()) {
            throw ValidationError("flat." + band + " must be a non-empty path");
        }
    }

    for (const auto& [target, sci] : science) {
        if (sci.path.size() != sci.band.size()) {
            throw ValidationError("science." + target + ": path and band lists must have the same length");
        }
        for (const auto& b : sci.band) {
            if (flat.find(b) == flat.end()) {
                throw ValidationError("science." + target + ": no flat configured for band '" + b + "'");
            }
        }
    }

    if (calibration.pattern.empty()) {
        throw ValidationError("calibration.pattern must not be empty");
    }
    if (!(calibration.sigma_clip.sigma > 0.0f)) {
        throw ValidationError("calibration.sigma_clip.sigma must be > 0");
    }
    if (calibration.sigma_clip.max_iters < 1) {
        throw ValidationError("calibration.sigma_clip.max_iters must be >= 1");
    }
    const auto& lr = calibration.line_removal;
    if (lr.lower_percentile < 0.0f || lr.upper_percentile > 100.0f ||
        lr.lower_percentile > lr.upper_percentile) {
        throw ValidationError("calibration.line_removal percentiles must satisfy 0 <= lower <= upper <= 100");
    }
    if (lr.half_window < 1) {
        throw ValidationError("calibration.line_removal.half_window must be >= 1");
    }
    if (!(calibration.flat_denom_eps > 0.0f)) {
        throw ValidationError("calibration.flat_denom_eps must be > 0");
    }
}

fs::path Config::raw_dir(const std::string& sub) const {
    return fs::path(path_raw) / sub;
}

fs::path Config::clean_dir(const std::string& sub) const {
    return fs::path(path_clean) / sub;
}

} // namespace ccd_calib::config
