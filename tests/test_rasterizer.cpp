#include <stdexcept>

#include <gtest/gtest.h>

#include "orthoproj/rasterizer.hpp"

namespace orthoproj {
namespace {

const Color kRed(255, 0, 0);
const Color kBlue(0, 0, 255);
const Color kWhite(255, 255, 255);

NormalizedCloud make_cloud(int precision, const std::vector<Eigen::Vector3i>& voxels,
                           const std::vector<Color>& colors) {
    NormalizedCloud cloud;
    cloud.precision = precision;
    cloud.voxels.resize(static_cast<Eigen::Index>(voxels.size()), 3);
    for (std::size_t i = 0; i < voxels.size(); ++i) {
        cloud.voxels.row(static_cast<Eigen::Index>(i)) = voxels[i].transpose();
    }
    cloud.colors = colors;
    return cloud;
}

Rasterizer rasterizer_with_precision(int precision) {
    RasterizerConfig config;
    config.precision = precision;
    return Rasterizer(config);
}

} // namespace

TEST(RasterizerTest, FaceAxesFollowDocumentedPlanes) {
    EXPECT_EQ(face_axes(Face::PosX).depth_axis, 0);
    EXPECT_EQ(face_axes(Face::PosX).row_axis, 1);
    EXPECT_EQ(face_axes(Face::PosX).col_axis, 2);
    EXPECT_FALSE(face_axes(Face::PosX).reversed);
    EXPECT_TRUE(face_axes(Face::NegY).reversed);
    EXPECT_EQ(face_axes(Face::NegY).row_axis, 0);
    EXPECT_EQ(face_axes(Face::PosZ).row_axis, 0);
    EXPECT_EQ(face_axes(Face::PosZ).col_axis, 1);
}

TEST(RasterizerTest, NearestPointWinsOnOpposingFaces) {
    // Two points on one Z column: +Z sees the low-z point, -Z the high-z one.
    const NormalizedCloud cloud =
        make_cloud(2, {Eigen::Vector3i(1, 2, 0), Eigen::Vector3i(1, 2, 3)}, {kRed, kBlue});
    const Rasterizer rasterizer = rasterizer_with_precision(2);

    const FaceRaster pos_z = rasterizer.rasterize(cloud, Face::PosZ);
    const FaceRaster neg_z = rasterizer.rasterize(cloud, Face::NegZ);
    ASSERT_TRUE(pos_z.at(1, 2).has_value());
    ASSERT_TRUE(neg_z.at(1, 2).has_value());
    EXPECT_EQ(pos_z.at(1, 2)->index, 0u);
    EXPECT_EQ(pos_z.at(1, 2)->depth, 0);
    EXPECT_EQ(neg_z.at(1, 2)->index, 1u);
    EXPECT_EQ(neg_z.at(1, 2)->depth, 0);
    EXPECT_EQ(pos_z.occupied_count(), 1u);

    // Seen from X the two points land on different pixels.
    const FaceRaster pos_x = rasterizer.rasterize(cloud, Face::PosX);
    EXPECT_EQ(pos_x.occupied_count(), 2u);
    EXPECT_EQ(pos_x.at(2, 0)->index, 0u);
    EXPECT_EQ(pos_x.at(2, 3)->index, 1u);
}

TEST(RasterizerTest, EqualDepthKeepsFirstPoint) {
    const NormalizedCloud cloud =
        make_cloud(3, {Eigen::Vector3i(4, 4, 4), Eigen::Vector3i(4, 4, 4)}, {kRed, kBlue});
    const Rasterizer rasterizer = rasterizer_with_precision(3);

    for (const FaceRaster& raster : rasterizer.process(cloud)) {
        ASSERT_EQ(raster.occupied_count(), 1u);
        EXPECT_EQ(raster.at(4, 4)->index, 0u);
    }
}

TEST(RasterizerTest, CloserLaterPointReplacesEarlierPoint) {
    const NormalizedCloud cloud =
        make_cloud(2, {Eigen::Vector3i(0, 0, 2), Eigen::Vector3i(0, 0, 1)}, {kRed, kBlue});
    const Rasterizer rasterizer = rasterizer_with_precision(2);

    const Projection projection =
        rasterizer.to_projection(rasterizer.rasterize(cloud, Face::PosZ), cloud);

    EXPECT_EQ(projection.image.pixel(0, 0), kBlue);
}

TEST(RasterizerTest, EmptyCloudGivesBackgroundProjection) {
    const NormalizedCloud cloud = make_cloud(3, {}, {});
    const Rasterizer rasterizer = rasterizer_with_precision(3);

    const auto rasters = rasterizer.process(cloud);
    ASSERT_EQ(rasters.size(), kNumFaces);
    for (const FaceRaster& raster : rasters) {
        EXPECT_EQ(raster.side, 8);
        EXPECT_EQ(raster.occupied_count(), 0u);
        const Projection projection = rasterizer.to_projection(raster, cloud);
        EXPECT_EQ(projection.image.rows(), 8);
        EXPECT_EQ(projection.image.cols(), 8);
        EXPECT_EQ(projection.occupancy.count(), 0);
        EXPECT_EQ(projection.image.pixel(7, 7), kWhite);
    }
}

TEST(RasterizerTest, BackgroundColoredPointStaysDistinguishable) {
    const NormalizedCloud cloud = make_cloud(1, {Eigen::Vector3i(0, 1, 0)}, {kWhite});
    const Rasterizer rasterizer = rasterizer_with_precision(1);

    const Projection projection =
        rasterizer.to_projection(rasterizer.rasterize(cloud, Face::PosZ), cloud);

    EXPECT_TRUE(projection.occupancy(0, 1));
    EXPECT_EQ(projection.image.pixel(0, 1), Color(255, 255, 254));
    EXPECT_EQ(projection.image.pixel(0, 0), kWhite);
}

TEST(RasterizerTest, PointsOutsideGridAreSkipped) {
    const NormalizedCloud cloud =
        make_cloud(2, {Eigen::Vector3i(5, 0, 0), Eigen::Vector3i(1, -1, 0)}, {kRed, kBlue});
    const Rasterizer rasterizer = rasterizer_with_precision(2);

    for (const FaceRaster& raster : rasterizer.process(cloud)) {
        EXPECT_EQ(raster.occupied_count(), 0u);
    }
}

TEST(RasterizerTest, RejectsCloudWithDifferentPrecision) {
    const NormalizedCloud cloud = make_cloud(4, {Eigen::Vector3i(0, 0, 0)}, {kRed});

    EXPECT_THROW(rasterizer_with_precision(2).rasterize(cloud, Face::PosX), std::invalid_argument);
    EXPECT_THROW(rasterizer_with_precision(0).rasterize(cloud, Face::PosX), std::invalid_argument);
}

} // namespace orthoproj
