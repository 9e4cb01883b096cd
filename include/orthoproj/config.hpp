#pragma once

#include <optional>
#include <string>

#include "orthoproj/logger.hpp"
#include "orthoproj/types.hpp"

namespace orthoproj {

constexpr int kMinPrecision = 1;
constexpr int kMaxPrecision = 16;

enum class NormalizationMode {
    FitCube,
    PreserveSpacing
};

enum class ColorRange {
    Auto,
    Unit,
    Byte
};

struct NormalizerConfig {
    int precision = 8;
    NormalizationMode mode = NormalizationMode::FitCube;
    ColorRange color_range = ColorRange::Auto;
    bool merge_duplicates = false;
};

struct RasterizerConfig {
    int precision = 8;
    Color background = Color(255, 255, 255);
    bool parallel_faces = true;
};

struct OutlierFilterConfig {
    int radius = 0;
    int depth_threshold = 20;
};

struct GapFillerConfig {
    int radius = 0;
};

struct CropConfig {
    bool enabled = false;
};

struct OutputConfig {
    bool write_output = false;
    std::string output_dir = "projections";
};

struct PipelineConfig {
    NormalizerConfig normalizer;
    RasterizerConfig rasterizer;
    OutlierFilterConfig outlier_filter;
    GapFillerConfig gap_filler;
    CropConfig crop;
    OutputConfig output;
    LogLevel log_level = LogLevel::Info;

    // Sets the grid resolution for both the normalizer and the rasterizer.
    void set_precision(int precision);
};

// Loads projection_config.yaml from the given path.
// Applies hardcoded defaults first, then overrides with values from the file.
// Throws std::runtime_error if the file cannot be read or an enum value is unknown.
PipelineConfig load_config(const std::string& path);

// Command-line overrides; only fields that were given are set.
struct ConfigOverrides {
    std::optional<std::string> config_path;
    std::optional<std::string> input_path;
    std::optional<std::string> crop_input_dir;
    std::optional<int> precision;
    std::optional<int> filtering;
    std::optional<int> outlier_radius;
    std::optional<bool> crop;
    std::optional<bool> parallel_faces;
    std::optional<bool> merge_duplicates;
    std::optional<NormalizationMode> mode;
    std::optional<std::string> output_dir;
    std::optional<LogLevel> log_level;

    static ConfigOverrides fromArgs(int argc, char** argv);
};

void apply_overrides(PipelineConfig& config, const ConfigOverrides& overrides);

NormalizationMode parse_normalization_mode(const std::string& value);
ColorRange parse_color_range(const std::string& value);
LogLevel parse_log_level(const std::string& value);

} // namespace orthoproj
