#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <Eigen/Core>

#include "orthoproj/config.hpp"
#include "orthoproj/normalizer.hpp"
#include "orthoproj/types.hpp"

namespace orthoproj {

// Axes of the cloud seen from one face. Depth grows away from the viewer.
struct FaceAxes {
    int depth_axis;
    int row_axis;
    int col_axis;
    bool reversed;
};

FaceAxes face_axes(Face face);

// Winning point of a pixel: its depth and its row in the normalized cloud.
struct Sample {
    std::int32_t depth;
    std::size_t index;
};

// Square z-buffer of one face; cells without a point are empty.
struct FaceRaster {
    Face face = Face::PosX;
    Eigen::Index side = 0;
    std::vector<std::optional<Sample>> cells;

    const std::optional<Sample>& at(Eigen::Index row, Eigen::Index col) const {
        return cells[static_cast<std::size_t>(row * side + col)];
    }
    std::optional<Sample>& at(Eigen::Index row, Eigen::Index col) {
        return cells[static_cast<std::size_t>(row * side + col)];
    }
    std::size_t occupied_count() const;
};

// Projects a normalized cloud onto the six cube faces. The nearest point wins
// each pixel; equal depths keep the point that comes first in the cloud.
// Throws std::invalid_argument on invalid config values or a cloud built for
// a different precision.
class Rasterizer {
public:
    explicit Rasterizer(const RasterizerConfig& config);

    FaceRaster rasterize(const NormalizedCloud& cloud, Face face) const;
    std::array<FaceRaster, kNumFaces> process(const NormalizedCloud& cloud) const;

    // Resolves winners to colors. Empty cells get the background color.
    Projection to_projection(const FaceRaster& raster, const NormalizedCloud& cloud) const;

    Eigen::Index side() const;

private:
    RasterizerConfig config_;
};

} // namespace orthoproj
