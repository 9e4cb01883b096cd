#include <fstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "orthoproj/config.hpp"

namespace orthoproj {

TEST(ConfigTest, ParsesConfigFile) {
    // Validates parsing of every section of the YAML config.
    const std::string path = "/tmp/orthoproj_config_test.yaml";
    std::ofstream out(path);
    out << "precision: 9\n";
    out << "log_level: debug\n";
    out << "normalizer:\n";
    out << "  mode: preserve_spacing\n";
    out << "  color_range: unit\n";
    out << "  merge_duplicates: true\n";
    out << "rasterizer:\n";
    out << "  background: [0, 0, 0]\n";
    out << "  parallel_faces: false\n";
    out << "outlier_filter:\n";
    out << "  radius: 3\n";
    out << "  depth_threshold: 12\n";
    out << "gap_filler:\n";
    out << "  radius: 2\n";
    out << "crop:\n";
    out << "  enabled: true\n";
    out << "output:\n";
    out << "  write_output: true\n";
    out << "  output_dir: /tmp/orthoproj_out\n";
    out.close();

    const PipelineConfig config = load_config(path);
    EXPECT_EQ(config.normalizer.precision, 9);
    EXPECT_EQ(config.rasterizer.precision, 9);
    EXPECT_EQ(config.log_level, LogLevel::Debug);
    EXPECT_EQ(config.normalizer.mode, NormalizationMode::PreserveSpacing);
    EXPECT_EQ(config.normalizer.color_range, ColorRange::Unit);
    EXPECT_TRUE(config.normalizer.merge_duplicates);
    EXPECT_EQ(config.rasterizer.background, Color(0, 0, 0));
    EXPECT_FALSE(config.rasterizer.parallel_faces);
    EXPECT_EQ(config.outlier_filter.radius, 3);
    EXPECT_EQ(config.outlier_filter.depth_threshold, 12);
    EXPECT_EQ(config.gap_filler.radius, 2);
    EXPECT_TRUE(config.crop.enabled);
    EXPECT_TRUE(config.output.write_output);
    EXPECT_EQ(config.output.output_dir, "/tmp/orthoproj_out");
}

TEST(ConfigTest, MissingKeysUseDefaults) {
    const std::string path = "/tmp/orthoproj_config_defaults.yaml";
    std::ofstream out(path);
    out << "gap_filler:\n";
    out << "  radius: 1\n";
    out.close();

    const PipelineConfig config = load_config(path);
    EXPECT_EQ(config.normalizer.precision, 8);
    EXPECT_EQ(config.normalizer.mode, NormalizationMode::FitCube);
    EXPECT_EQ(config.normalizer.color_range, ColorRange::Auto);
    EXPECT_EQ(config.rasterizer.background, Color(255, 255, 255));
    EXPECT_TRUE(config.rasterizer.parallel_faces);
    EXPECT_EQ(config.outlier_filter.radius, 0);
    EXPECT_EQ(config.outlier_filter.depth_threshold, 20);
    EXPECT_EQ(config.gap_filler.radius, 1);
    EXPECT_FALSE(config.crop.enabled);
}

TEST(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(load_config("/tmp/orthoproj_no_such_config.yaml"), std::runtime_error);
}

TEST(ConfigTest, UnknownEnumValueThrows) {
    const std::string path = "/tmp/orthoproj_config_bad_mode.yaml";
    std::ofstream out(path);
    out << "normalizer:\n";
    out << "  mode: stretch\n";
    out.close();

    EXPECT_THROW(load_config(path), std::runtime_error);
}

TEST(ConfigTest, OverridesApply) {
    // Ensures CLI overrides update only specified fields.
    std::string args[] = {"orthoproj_cli", "cloud.xyz", "--precision=6", "--filtering=3",
                          "--crop", "--sequential", "--output-dir=/tmp/out",
                          "--log-level=warn"};
    char* argv[8];
    for (int i = 0; i < 8; ++i) {
        argv[i] = args[i].data();
    }

    const ConfigOverrides overrides = ConfigOverrides::fromArgs(8, argv);
    ASSERT_TRUE(overrides.input_path.has_value());
    EXPECT_EQ(*overrides.input_path, "cloud.xyz");

    PipelineConfig config;
    config.outlier_filter.radius = 2;
    apply_overrides(config, overrides);
    EXPECT_EQ(config.normalizer.precision, 6);
    EXPECT_EQ(config.rasterizer.precision, 6);
    EXPECT_EQ(config.gap_filler.radius, 3);
    EXPECT_TRUE(config.crop.enabled);
    EXPECT_FALSE(config.rasterizer.parallel_faces);
    EXPECT_TRUE(config.output.write_output);
    EXPECT_EQ(config.output.output_dir, "/tmp/out");
    EXPECT_EQ(config.log_level, LogLevel::Warn);
    EXPECT_EQ(config.outlier_filter.radius, 2);
}

TEST(ConfigTest, UnknownArgumentThrows) {
    std::string args[] = {"orthoproj_cli", "--bogus"};
    char* argv[] = {args[0].data(), args[1].data()};

    EXPECT_THROW(ConfigOverrides::fromArgs(2, argv), std::runtime_error);
}

} // namespace orthoproj
