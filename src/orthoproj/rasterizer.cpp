#include "orthoproj/rasterizer.hpp"

#include <stdexcept>
#include <string>

#include "orthoproj/logger.hpp"

namespace orthoproj {

FaceAxes face_axes(Face face) {
    switch (face) {
        case Face::PosX:
            return {0, 1, 2, false};
        case Face::NegX:
            return {0, 1, 2, true};
        case Face::PosY:
            return {1, 0, 2, false};
        case Face::NegY:
            return {1, 0, 2, true};
        case Face::PosZ:
            return {2, 0, 1, false};
        case Face::NegZ:
            return {2, 0, 1, true};
    }
    throw std::invalid_argument("Unknown face");
}

std::size_t FaceRaster::occupied_count() const {
    std::size_t count = 0;
    for (const auto& cell : cells) {
        if (cell.has_value()) {
            ++count;
        }
    }
    return count;
}

Rasterizer::Rasterizer(const RasterizerConfig& config) : config_(config) {}

Eigen::Index Rasterizer::side() const {
    if (config_.precision < kMinPrecision || config_.precision > kMaxPrecision) {
        throw std::invalid_argument(
            "`precision` must be in [" + std::to_string(kMinPrecision) + ", " +
            std::to_string(kMaxPrecision) + "], got " + std::to_string(config_.precision));
    }
    return Eigen::Index{1} << config_.precision;
}

FaceRaster Rasterizer::rasterize(const NormalizedCloud& cloud, Face face) const {
    const Eigen::Index n = side();
    if (cloud.size() > 0 && cloud.precision != config_.precision) {
        throw std::invalid_argument(
            "Cloud was normalized for precision " + std::to_string(cloud.precision) +
            ", rasterizer expects " + std::to_string(config_.precision));
    }

    FaceRaster raster;
    raster.face = face;
    raster.side = n;
    raster.cells.assign(static_cast<std::size_t>(n * n), std::nullopt);

    const FaceAxes axes = face_axes(face);
    const std::int32_t max_coord = static_cast<std::int32_t>(n - 1);
    std::size_t rejected = 0;

    for (Eigen::Index i = 0; i < cloud.size(); ++i) {
        const std::int32_t row = cloud.voxels(i, axes.row_axis);
        const std::int32_t col = cloud.voxels(i, axes.col_axis);
        const std::int32_t coord = cloud.voxels(i, axes.depth_axis);
        if (row < 0 || row > max_coord || col < 0 || col > max_coord ||
            coord < 0 || coord > max_coord) {
            ++rejected;
            continue;
        }

        const std::int32_t depth = axes.reversed ? max_coord - coord : coord;
        std::optional<Sample>& cell = raster.at(row, col);
        // Strict comparison keeps the first point on equal depth.
        if (!cell.has_value() || depth < cell->depth) {
            cell = Sample{depth, static_cast<std::size_t>(i)};
        }
    }

    if (rejected > 0) {
        Logger::log(LogLevel::Warn,
                    std::to_string(rejected) + " points outside the grid skipped on face " +
                        face_name(face));
    }
    return raster;
}

std::array<FaceRaster, kNumFaces> Rasterizer::process(const NormalizedCloud& cloud) const {
    std::array<FaceRaster, kNumFaces> rasters;
    for (Face face : kFaces) {
        rasters[static_cast<std::size_t>(face)] = rasterize(cloud, face);
    }
    return rasters;
}

Projection Rasterizer::to_projection(const FaceRaster& raster,
                                     const NormalizedCloud& cloud) const {
    const Eigen::Index n = raster.side;
    Projection projection;
    projection.image = ProjectionImage(n, n, config_.background);
    projection.occupancy = OccupancyMap::Constant(n, n, false);

    for (Eigen::Index row = 0; row < n; ++row) {
        for (Eigen::Index col = 0; col < n; ++col) {
            const std::optional<Sample>& cell = raster.at(row, col);
            if (!cell.has_value()) {
                continue;
            }
            if (cell->index >= cloud.colors.size()) {
                throw std::invalid_argument("Raster sample refers to a point outside the cloud.");
            }
            projection.image.set_pixel(
                row, col, distinct_color(cloud.colors[cell->index], config_.background));
            projection.occupancy(row, col) = true;
        }
    }
    return projection;
}

} // namespace orthoproj
