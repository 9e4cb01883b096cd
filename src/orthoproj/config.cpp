#include "orthoproj/config.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace orthoproj {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

Color parse_color(const YAML::Node& node, const Color& fallback) {
    if (!node) {
        return fallback;
    }
    const std::vector<int> rgb = node.as<std::vector<int>>();
    if (rgb.size() != 3) {
        throw std::runtime_error("rasterizer.background must have 3 channels");
    }
    for (int channel : rgb) {
        if (channel < 0 || channel > 255) {
            throw std::runtime_error("rasterizer.background channels must be in [0, 255]");
        }
    }
    return Color(static_cast<std::uint8_t>(rgb[0]),
                 static_cast<std::uint8_t>(rgb[1]),
                 static_cast<std::uint8_t>(rgb[2]));
}

int parse_int_arg(const std::string& arg, const std::string& prefix) {
    const std::string value = arg.substr(prefix.size());
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid integer for " + prefix + " " + value);
    }
}

} // namespace

void PipelineConfig::set_precision(int precision) {
    normalizer.precision = precision;
    rasterizer.precision = precision;
}

NormalizationMode parse_normalization_mode(const std::string& value) {
    const auto lower = toLower(value);
    if (lower == "fit_cube") {
        return NormalizationMode::FitCube;
    }
    if (lower == "preserve_spacing") {
        return NormalizationMode::PreserveSpacing;
    }
    throw std::runtime_error("Unknown normalization mode: " + value);
}

ColorRange parse_color_range(const std::string& value) {
    const auto lower = toLower(value);
    if (lower == "auto") {
        return ColorRange::Auto;
    }
    if (lower == "unit") {
        return ColorRange::Unit;
    }
    if (lower == "byte") {
        return ColorRange::Byte;
    }
    throw std::runtime_error("Unknown color range: " + value);
}

LogLevel parse_log_level(const std::string& value) {
    const auto lower = toLower(value);
    if (lower == "debug") {
        return LogLevel::Debug;
    }
    if (lower == "info") {
        return LogLevel::Info;
    }
    if (lower == "warn") {
        return LogLevel::Warn;
    }
    if (lower == "error") {
        return LogLevel::Error;
    }
    throw std::runtime_error("Unknown log level: " + value);
}

PipelineConfig load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    PipelineConfig cfg{};
    cfg.set_precision(root["precision"].as<int>(8));

    cfg.normalizer.mode =
        parse_normalization_mode(root["normalizer"]["mode"].as<std::string>("fit_cube"));
    cfg.normalizer.color_range =
        parse_color_range(root["normalizer"]["color_range"].as<std::string>("auto"));
    cfg.normalizer.merge_duplicates = root["normalizer"]["merge_duplicates"].as<bool>(false);

    cfg.rasterizer.background =
        parse_color(root["rasterizer"]["background"], cfg.rasterizer.background);
    cfg.rasterizer.parallel_faces = root["rasterizer"]["parallel_faces"].as<bool>(true);

    cfg.outlier_filter.radius = root["outlier_filter"]["radius"].as<int>(0);
    cfg.outlier_filter.depth_threshold = root["outlier_filter"]["depth_threshold"].as<int>(20);

    cfg.gap_filler.radius = root["gap_filler"]["radius"].as<int>(0);

    cfg.crop.enabled = root["crop"]["enabled"].as<bool>(false);

    cfg.output.write_output = root["output"]["write_output"].as<bool>(false);
    cfg.output.output_dir = root["output"]["output_dir"].as<std::string>("projections");

    cfg.log_level = parse_log_level(root["log_level"].as<std::string>("info"));

    return cfg;
}

ConfigOverrides ConfigOverrides::fromArgs(int argc, char** argv) {
    ConfigOverrides overrides;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            overrides.config_path = argv[++i];
        } else if (arg == "--crop") {
            overrides.crop = true;
        } else if (arg == "--no-crop") {
            overrides.crop = false;
        } else if (arg == "--parallel") {
            overrides.parallel_faces = true;
        } else if (arg == "--sequential") {
            overrides.parallel_faces = false;
        } else if (arg == "--merge-duplicates") {
            overrides.merge_duplicates = true;
        } else if (arg.rfind("--precision=", 0) == 0) {
            overrides.precision = parse_int_arg(arg, "--precision=");
        } else if (arg.rfind("--filtering=", 0) == 0) {
            overrides.filtering = parse_int_arg(arg, "--filtering=");
        } else if (arg.rfind("--outlier-radius=", 0) == 0) {
            overrides.outlier_radius = parse_int_arg(arg, "--outlier-radius=");
        } else if (arg.rfind("--mode=", 0) == 0) {
            overrides.mode = parse_normalization_mode(arg.substr(std::string("--mode=").size()));
        } else if (arg.rfind("--crop-dir=", 0) == 0) {
            overrides.crop_input_dir = arg.substr(std::string("--crop-dir=").size());
        } else if (arg.rfind("--output-dir=", 0) == 0) {
            overrides.output_dir = arg.substr(std::string("--output-dir=").size());
        } else if (arg.rfind("--log-level=", 0) == 0) {
            overrides.log_level = parse_log_level(arg.substr(std::string("--log-level=").size()));
        } else if (arg.rfind("--", 0) != 0 && !overrides.input_path.has_value()) {
            overrides.input_path = arg;
        } else {
            throw std::runtime_error("Unknown argument: " + arg);
        }
    }

    return overrides;
}

void apply_overrides(PipelineConfig& config, const ConfigOverrides& overrides) {
    if (overrides.precision.has_value()) {
        config.set_precision(*overrides.precision);
    }
    if (overrides.filtering.has_value()) {
        config.gap_filler.radius = *overrides.filtering;
    }
    if (overrides.outlier_radius.has_value()) {
        config.outlier_filter.radius = *overrides.outlier_radius;
    }
    if (overrides.crop.has_value()) {
        config.crop.enabled = *overrides.crop;
    }
    if (overrides.parallel_faces.has_value()) {
        config.rasterizer.parallel_faces = *overrides.parallel_faces;
    }
    if (overrides.merge_duplicates.has_value()) {
        config.normalizer.merge_duplicates = *overrides.merge_duplicates;
    }
    if (overrides.mode.has_value()) {
        config.normalizer.mode = *overrides.mode;
    }
    if (overrides.output_dir.has_value()) {
        config.output.write_output = true;
        config.output.output_dir = *overrides.output_dir;
    }
    if (overrides.log_level.has_value()) {
        config.log_level = *overrides.log_level;
    }
}

} // namespace orthoproj
