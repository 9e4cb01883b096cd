#include <stdexcept>

#include <gtest/gtest.h>

#include "orthoproj/outlier_filter.hpp"

namespace orthoproj {
namespace {

FaceRaster empty_raster(Eigen::Index side) {
    FaceRaster raster;
    raster.face = Face::PosZ;
    raster.side = side;
    raster.cells.assign(static_cast<std::size_t>(side * side), std::nullopt);
    return raster;
}

// 3x3 front surface at depth 0 with a back-surface point showing through its centre.
FaceRaster surface_with_hole(std::int32_t hole_depth) {
    FaceRaster raster = empty_raster(4);
    std::size_t index = 0;
    for (Eigen::Index r = 0; r < 3; ++r) {
        for (Eigen::Index c = 0; c < 3; ++c) {
            raster.at(r, c) = Sample{0, index++};
        }
    }
    raster.at(1, 1) = Sample{hole_depth, index};
    return raster;
}

} // namespace

TEST(OutlierFilterTest, RemovesPointFarBehindItsNeighbours) {
    OutlierFilterConfig config;
    config.radius = 1;
    config.depth_threshold = 20;

    const OutlierFilterResult result = OutlierFilter(config).process(surface_with_hole(30));

    EXPECT_EQ(result.removed, 1u);
    EXPECT_FALSE(result.raster.at(1, 1).has_value());
    EXPECT_EQ(result.raster.occupied_count(), 8u);
}

TEST(OutlierFilterTest, KeepsPointWithinThreshold) {
    OutlierFilterConfig config;
    config.radius = 1;
    config.depth_threshold = 20;

    // Mean of the window is 2, so depth 18 stays below mean + threshold.
    const OutlierFilterResult result = OutlierFilter(config).process(surface_with_hole(18));

    EXPECT_EQ(result.removed, 0u);
    EXPECT_TRUE(result.raster.at(1, 1).has_value());
}

TEST(OutlierFilterTest, ZeroRadiusIsDisabled) {
    OutlierFilterConfig config;
    config.radius = 0;
    config.depth_threshold = 0;

    const FaceRaster input = surface_with_hole(200);
    const OutlierFilterResult result = OutlierFilter(config).process(input);

    EXPECT_EQ(result.removed, 0u);
    EXPECT_EQ(result.raster.occupied_count(), input.occupied_count());
}

TEST(OutlierFilterTest, JudgesEveryPixelAgainstTheInput) {
    // Two far pixels side by side: both are judged with each other still present.
    FaceRaster raster = empty_raster(3);
    raster.at(0, 0) = Sample{0, 0};
    raster.at(0, 1) = Sample{100, 1};
    raster.at(0, 2) = Sample{100, 2};
    OutlierFilterConfig config;
    config.radius = 1;
    config.depth_threshold = 10;

    const OutlierFilterResult result = OutlierFilter(config).process(raster);

    // (0,1): mean 200/3 -> removed. (0,2): mean 100 -> kept.
    EXPECT_EQ(result.removed, 1u);
    EXPECT_FALSE(result.raster.at(0, 1).has_value());
    EXPECT_TRUE(result.raster.at(0, 2).has_value());
    EXPECT_TRUE(result.raster.at(0, 0).has_value());
}

TEST(OutlierFilterTest, RejectsNegativeSettings) {
    OutlierFilterConfig config;
    config.radius = -1;
    EXPECT_THROW(OutlierFilter(config).process(empty_raster(2)), std::invalid_argument);

    config.radius = 1;
    config.depth_threshold = -5;
    EXPECT_THROW(OutlierFilter(config).process(empty_raster(2)), std::invalid_argument);
}

} // namespace orthoproj
